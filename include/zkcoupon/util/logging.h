// ZKCOUPON - Logging System
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Provides the logging system used by every component:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Per-component categories for filtering
// - Console, file and callback sinks
// - Thread-safe stream-style and printf-style interfaces
//
// Secrets (confirmation tokens, proofs, commitments) must only ever be
// logged through Redact().

#ifndef ZKCOUPON_UTIL_LOGGING_H
#define ZKCOUPON_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace zkcoupon {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* PROOF = "proof";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* GATEWAY = "gateway";
    constexpr const char* WALLET = "wallet";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* SERVICE = "service";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Shared formatting switches for text sinks
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single text line
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

/// Log sink that writes to stdout/stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{true};           // Errors and above go to stderr
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;

    static const char* GetColorCode(LogLevel level);
};

/// Log sink that appends to a file
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

/// Log sink that forwards entries to a callback (used by tests)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink once
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ZKCOUPON_LOGGER ::zkcoupon::util::Logger::Instance()

#define ZKCOUPON_LOG_ENABLED(level, category) \
    ZKCOUPON_LOGGER.WillLog(::zkcoupon::util::LogLevel::level, category)

#define ZKCOUPON_LOG(level, category) \
    if (!ZKCOUPON_LOG_ENABLED(level, category)) {} else \
        ::zkcoupon::util::LogStream(::zkcoupon::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   ZKCOUPON_LOG(Trace, category)
#define LOG_DEBUG(category)   ZKCOUPON_LOG(Debug, category)
#define LOG_INFO(category)    ZKCOUPON_LOG(Info, category)
#define LOG_WARN(category)    ZKCOUPON_LOG(Warn, category)
#define LOG_ERROR(category)   ZKCOUPON_LOG(Error, category)

#define ZKCOUPON_LOGF(level, category, ...) \
    do { \
        if (ZKCOUPON_LOG_ENABLED(level, category)) { \
            ZKCOUPON_LOGGER.LogF(::zkcoupon::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  ZKCOUPON_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ZKCOUPON_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ZKCOUPON_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ZKCOUPON_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging (local time, millisecond precision)
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Keep the first `keep` characters of a secret and mask the rest
std::string Redact(const std::string& secret, size_t keep = 8);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace zkcoupon

#endif // ZKCOUPON_UTIL_LOGGING_H
