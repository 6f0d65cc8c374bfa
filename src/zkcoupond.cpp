// ZKCOUPON Daemon - Main Entry Point
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// zkcoupond hosts a coupon service in a long-running process:
// - Loads zkcoupon.conf and command-line overrides
// - Sets up logging
// - Runs the periodic reconciliation sweep until SIGINT/SIGTERM

#include <zkcoupon/service/service.h>
#include <zkcoupon/util/config.h>
#include <zkcoupon/util/logging.h>
#include <zkcoupon/util/time.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace zkcoupon {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ZKCOUPON Daemon";

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};
static std::mutex g_shutdownMutex;
static std::condition_variable g_shutdownCondition;

static std::unique_ptr<service::CouponService> g_service;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
        g_shutdownCondition.notify_all();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

// ============================================================================
// Command Line
// ============================================================================

void PrintUsage() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n"
              << "Usage: zkcoupond [options]\n\n"
              << "Options:\n"
              << "  -conf=<file>                  Config file (default: "
              << util::DEFAULT_CONFIG_FILENAME << ")\n"
              << "  -token.ttl=<sec>              Default confirmation token lifetime\n"
              << "  -token.maxttl=<sec>           Longest token lifetime a caller may ask for\n"
              << "  -token.retention=<sec>        How long settled tokens are kept\n"
              << "  -reservation.timeout=<sec>    Age at which reservations are rolled back\n"
              << "  -ledger.reconcileinterval=<sec>  Reconciliation period (0 = off)\n"
              << "  -wallet.salt=<salt>           Salt for identity commitments\n"
              << "  -wallet.recoverykey=<hex>     Recovery verification key\n"
              << "  -verifier.threads=<n>         Proof verification workers\n"
              << "  -log.level=<level>            trace, debug, info, warn, error\n"
              << "  -log.file=<file>              Also log to a file\n"
              << "  -nolog.console                Disable console logging\n"
              << "  -help                         Show this help\n";
}

bool HasFlag(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], flag) == 0) {
            return true;
        }
    }
    return false;
}

/// Config file first, then command-line overrides
bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config) {
    util::ConfigManager cli;
    auto cliResult = cli.ParseCommandLine(argc, argv);
    if (!cliResult.success) {
        std::cerr << "Error: " << cliResult.errorMessage << std::endl;
        return false;
    }

    bool explicitConf = cli.HasKey("conf");
    std::string confPath = cli.GetString("conf", util::DEFAULT_CONFIG_FILENAME);

    auto fileResult = config.ParseFile(confPath);
    if (!fileResult.success && explicitConf) {
        std::cerr << "Error reading " << confPath << ": " << fileResult.errorMessage;
        if (fileResult.errorLine > 0) {
            std::cerr << " (line " << fileResult.errorLine << ")";
        }
        std::cerr << std::endl;
        return false;
    }

    return config.ParseCommandLine(argc, argv).success;
}

// ============================================================================
// Lifecycle
// ============================================================================

void WaitForShutdown() {
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    while (!g_shutdownRequested.load()) {
        g_shutdownCondition.wait_for(lock, std::chrono::seconds(1));
    }
}

void Shutdown() {
    LOG_INFO(util::LogCategory::SERVICE) << "Shutting down...";

    if (g_service) {
        g_service->StopMaintenance();

        auto stats = g_service->GetStats();
        LOG_INFO(util::LogCategory::SERVICE) << "Final stats: " << stats.ledger.issued
                                             << " issued, " << stats.ledger.redeemed
                                             << " redeemed, " << stats.ledger.expired
                                             << " expired";
        g_service.reset();
    }

    LOG_INFO(util::LogCategory::SERVICE) << "Shutdown complete";
    util::Logger::Instance().Shutdown();
}

int AppMain(int argc, char* argv[]) {
    if (HasFlag(argc, argv, "-help") || HasFlag(argc, argv, "-h")) {
        PrintUsage();
        return 0;
    }

    util::ConfigManager config;
    if (!LoadConfiguration(argc, argv, config)) {
        return 1;
    }

    service::ServiceOptions options = service::ServiceOptions::FromConfig(config);
    auto problems = options.Validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << std::endl;
        }
        return 1;
    }

    service::SetupLogging(options);
    LOG_INFO(util::LogCategory::SERVICE) << CLIENT_NAME << " v" << VERSION << " starting at "
                                         << util::FormatISO8601(util::GetTime());

    SetupSignalHandlers();

    g_service = std::make_unique<service::CouponService>(options);
    g_service->StartMaintenance();

    LOG_INFO(util::LogCategory::SERVICE) << "Daemon started";

    WaitForShutdown();
    Shutdown();
    return 0;
}

} // namespace zkcoupon

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return zkcoupon::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error" << std::endl;
        return 1;
    }
}
