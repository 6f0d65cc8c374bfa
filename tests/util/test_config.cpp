// ZKCOUPON - Configuration File Parser Tests
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcoupon/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace zkcoupon {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/zkcoupon_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# token.ttl=60
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("key=value");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("key"));
    EXPECT_EQ(config_.GetString("key", ""), "value");
}

TEST_F(ConfigTest, ParseKeyWithSpaces) {
    auto result = config_.ParseString("  key   =   value with spaces  ");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key", ""), "value with spaces");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    config_.ParseString("a=\"  padded  \"\nb='single \\n raw'");
    EXPECT_EQ(config_.GetString("a", ""), "  padded  ");
    EXPECT_EQ(config_.GetString("b", ""), "single \\n raw");
}

TEST_F(ConfigTest, ParseEscapeSequences) {
    config_.ParseString(R"(key="line1\nline2\t\"q\"")");
    EXPECT_EQ(config_.GetString("key", ""), "line1\nline2\t\"q\"");
}

TEST_F(ConfigTest, ParseBareFlag) {
    config_.ParseString("verbose");
    EXPECT_TRUE(config_.GetBool("verbose", false));
}

TEST_F(ConfigTest, ParseSection) {
    std::string content = R"(
[token]
ttl=600
maxttl=3600

[log]
level=debug
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt(ConfigKeys::TOKEN_TTL, 0), 600);
    EXPECT_EQ(config_.GetInt(ConfigKeys::TOKEN_MAX_TTL, 0), 3600);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_LEVEL, ""), "debug");
}

TEST_F(ConfigTest, InvalidSectionHeader) {
    auto result = config_.ParseString("[token\nttl=5");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("ok=1\nbad key=2");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorSource, "<string>");
}

TEST_F(ConfigTest, EmptyKey) {
    EXPECT_FALSE(config_.ParseString("=value").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string longLine = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    auto result = config_.ParseString(longLine);
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    config_.ParseString("a=42\nb=-7\nc=12abc\nd=");
    EXPECT_EQ(config_.GetInt("a", 0), 42);
    EXPECT_EQ(config_.GetInt("b", 0), -7);
    EXPECT_EQ(config_.GetInt("c", 99), 99);
    EXPECT_EQ(config_.GetInt("d", 5), 5);
    EXPECT_EQ(config_.GetInt("missing", 11), 11);
}

TEST_F(ConfigTest, TryGetIntInvalid) {
    config_.Set("n", "not-a-number");
    EXPECT_FALSE(config_.TryGetInt("n").has_value());
    EXPECT_FALSE(config_.TryGetInt("absent").has_value());
}

TEST_F(ConfigTest, GetBool) {
    config_.ParseString("a=yes\nb=OFF\nc=1\nd=maybe");
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_TRUE(config_.GetBool("d", true));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
}

TEST_F(ConfigTest, ParseBoolValues) {
    EXPECT_EQ(ConfigManager::ParseBool("True"), std::optional<bool>(true));
    EXPECT_EQ(ConfigManager::ParseBool("no"), std::optional<bool>(false));
    EXPECT_FALSE(ConfigManager::ParseBool("2").has_value());
}

// ============================================================================
// Environment Variables
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVarsBraced) {
    setenv("ZKCOUPON_TEST_SALT", "pepper", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("salt-${ZKCOUPON_TEST_SALT}"), "salt-pepper");
    unsetenv("ZKCOUPON_TEST_SALT");
}

TEST_F(ConfigTest, ExpandEnvVarsUndefined) {
    unsetenv("ZKCOUPON_TEST_UNDEFINED");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a${ZKCOUPON_TEST_UNDEFINED}b"), "ab");
}

TEST_F(ConfigTest, ExpandEnvVarsInConfig) {
    setenv("ZKCOUPON_TEST_LOGDIR", "/var/log/zk", 1);
    config_.ParseString("[log]\nfile=${ZKCOUPON_TEST_LOGDIR}/daemon.log");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_FILE, ""), "/var/log/zk/daemon.log");
    unsetenv("ZKCOUPON_TEST_LOGDIR");
}

// ============================================================================
// File Parsing
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile(R"(
# zkcoupon.conf
[reservation]
timeout=30

[wallet]
salt="deployment salt"
)");

    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetInt(ConfigKeys::RESERVATION_TIMEOUT, 0), 30);
    EXPECT_EQ(config_.GetString(ConfigKeys::WALLET_SALT, ""), "deployment salt");

    auto entries = config_.GetEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].source, path);
    EXPECT_GT(entries[0].lineNumber, 0);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/zkcoupon.conf");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, ParseCommandLineBasic) {
    const char* argv[] = {"zkcoupond", "-token.ttl=120", "--log.level=debug", "-verbose"};
    auto result = config_.ParseCommandLine(4, argv);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt(ConfigKeys::TOKEN_TTL, 0), 120);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_LEVEL, ""), "debug");
    EXPECT_TRUE(config_.GetBool("verbose", false));
}

TEST_F(ConfigTest, ParseCommandLineNegated) {
    const char* argv[] = {"zkcoupond", "-nolog.console"};
    config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(config_.GetBool(ConfigKeys::LOG_CONSOLE, true));
}

TEST_F(ConfigTest, ParseCommandLineValueAsNextArg) {
    const char* argv[] = {"zkcoupond", "-wallet.salt", "abc", "-verifier.threads", "3"};
    config_.ParseCommandLine(5, argv);
    EXPECT_EQ(config_.GetString(ConfigKeys::WALLET_SALT, ""), "abc");
    EXPECT_EQ(config_.GetInt(ConfigKeys::VERIFIER_THREADS, 0), 3);
}

TEST_F(ConfigTest, ParseCommandLineInvalidOption) {
    const char* argv[] = {"zkcoupond", "-bad key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, CommandLineOverridesConfig) {
    config_.ParseString("[token]\nttl=600");
    const char* argv[] = {"zkcoupond", "-token.ttl=60"};
    config_.ParseCommandLine(2, argv);
    EXPECT_EQ(config_.GetInt(ConfigKeys::TOKEN_TTL, 0), 60);
}

// ============================================================================
// Setting and Validation
// ============================================================================

TEST_F(ConfigTest, SetOverwrites) {
    config_.Set("key", "one");
    config_.Set("key", "two");
    EXPECT_EQ(config_.GetString("key", ""), "two");
}

TEST_F(ConfigTest, SetDefault) {
    config_.SetDefault("a", "default");
    EXPECT_EQ(config_.GetString("a", ""), "default");

    config_.Set("a", "explicit");
    config_.SetDefault("a", "ignored");
    EXPECT_EQ(config_.GetString("a", ""), "explicit");
}

TEST_F(ConfigTest, RequiredKeyMissing) {
    config_.RequireKey(ConfigKeys::WALLET_SALT);
    auto problems = config_.Validate();
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find(ConfigKeys::WALLET_SALT), std::string::npos);
}

TEST_F(ConfigTest, RequiredKeyPresent) {
    config_.RequireKey(ConfigKeys::WALLET_SALT);
    config_.Set(ConfigKeys::WALLET_SALT, "x");
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ConfigTest, UnknownKeyReported) {
    config_.AllowKey(ConfigKeys::TOKEN_TTL);
    config_.ParseString("[token]\nttl=5\ntll=6");
    auto problems = config_.Validate();
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("token.tll"), std::string::npos);
}

TEST_F(ConfigTest, DumpSkipsDefaults) {
    config_.SetDefault("hidden", "1");
    config_.Set("shown", "2");
    EXPECT_EQ(config_.Dump(), "shown=2\n");
}

TEST_F(ConfigTest, Clear) {
    config_.Set("a", "1");
    config_.RequireKey("b");
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_TRUE(config_.Validate().empty());
}

} // namespace test
} // namespace util
} // namespace zkcoupon
