// ZKCOUPON - Configuration File Parser
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Parses INI-style configuration for the coupon service.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]; a key inside [token] is addressed as
//   "token.ttl", the same name used on the command line (-token.ttl=600)
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef ZKCOUPON_UTIL_CONFIG_H
#define ZKCOUPON_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkcoupon {
namespace util {

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "zkcoupon.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;       // Fully qualified ("section.key")
    std::string value;
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, strings and the command line.
 *
 * Later sources override earlier ones; defaults never override an explicit
 * value. The manager is not synchronized: load it once at startup, then
 * treat it as read-only.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // --- Parsing ---

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Accepts -key=value, --key=value, -key value, -flag and -noflag
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // --- Value Retrieval ---

    bool HasKey(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;

    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    // --- Value Setting ---

    void Set(const std::string& key, const std::string& value);

    /// Set a value only if nothing explicit is present
    void SetDefault(const std::string& key, const std::string& value);

    // --- Validation ---

    void RequireKey(const std::string& key);
    void AllowKey(const std::string& key);

    /// Missing required keys, plus unknown keys when an allow list is set
    std::vector<std::string> Validate() const;

    // --- Utilities ---

    void Clear();
    size_t Size() const { return entries_.size(); }
    std::vector<ConfigEntry> GetEntries() const;

    /// Dump explicit values as "key=value" lines
    std::string Dump() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Confirmation tokens
    constexpr const char* TOKEN_TTL = "token.ttl";
    constexpr const char* TOKEN_MAX_TTL = "token.maxttl";
    constexpr const char* TOKEN_RETENTION = "token.retention";

    // Reservations and reconciliation
    constexpr const char* RESERVATION_TIMEOUT = "reservation.timeout";
    constexpr const char* RECONCILE_INTERVAL = "ledger.reconcileinterval";

    // Wallets and proofs
    constexpr const char* WALLET_SALT = "wallet.salt";
    constexpr const char* RECOVERY_KEY = "wallet.recoverykey";
    constexpr const char* VERIFIER_THREADS = "verifier.threads";

    // Logging
    constexpr const char* LOG_LEVEL = "log.level";
    constexpr const char* LOG_FILE = "log.file";
    constexpr const char* LOG_CONSOLE = "log.console";
}

} // namespace util
} // namespace zkcoupon

#endif // ZKCOUPON_UTIL_CONFIG_H
