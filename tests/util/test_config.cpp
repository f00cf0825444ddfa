// REFINDEX - Configuration File Parser Tests
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include "refindex/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace refindex {
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
        char filename[] = "/tmp/refindex_config_test_XXXXXX";
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

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString("# comment\n; also a comment\n\n   \nworkers=2\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetString("workers", ""), "2");
}

TEST_F(ConfigTest, KeyValueWithWhitespace) {
    ASSERT_TRUE(config_.ParseString("  loglevel =  debug  \n").success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "a=\"two words\"\n"
        "b='single \\n kept'\n"
        "c=\"tab\\there\"\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "two words");
    EXPECT_EQ(config_.GetString("b", ""), "single \\n kept");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, BareAndNegatedFlags) {
    ASSERT_TRUE(config_.ParseString("inmemory\nnoprinttoconsole\n").success);
    EXPECT_EQ(config_.TryGetBool("inmemory"), std::optional<bool>(true));
    EXPECT_EQ(config_.TryGetBool("printtoconsole"), std::optional<bool>(false));
}

TEST_F(ConfigTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("rpc=http://a,\\\nhttp://b\n").success);
    EXPECT_EQ(config_.GetList("rpc"), (std::vector<std::string>{"http://a", "http://b"}));
}

TEST_F(ConfigTest, ErrorsCarryLocation) {
    auto result = config_.ParseString("ok=1\n[broken\n", "refindex.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.ToString(), "refindex.conf:2: Missing closing bracket in section header");

    config_.Clear();
    result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid key"), std::string::npos);

    config_.Clear();
    result = config_.ParseString("=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Empty key");
}

TEST_F(ConfigTest, LineTooLong) {
    std::string line = "k=" + std::string(MAX_LINE_LENGTH, 'x') + "\n";
    auto result = config_.ParseString(line);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Line too long"), std::string::npos);
}

// ============================================================================
// Sections and Lists
// ============================================================================

TEST_F(ConfigTest, SectionsInFileOrder) {
    ASSERT_TRUE(config_.ParseString(
        "workers=4\n"
        "[polkadot]\n"
        "id=0\n"
        "[kusama]\n"
        "id=2\n"
        "[polkadot]\n"
        "ss58prefix=0\n").success);

    EXPECT_EQ(config_.GetSections(), (std::vector<std::string>{"polkadot", "kusama"}));
    EXPECT_EQ(config_.GetInt("id", -1, "kusama"), 2);
    EXPECT_EQ(config_.GetInt("ss58prefix", -1, "polkadot"), 0);
    EXPECT_FALSE(config_.HasKey("id"));
    EXPECT_FALSE(config_.HasKey("workers", "polkadot"));

    auto keys = config_.GetKeys("polkadot");
    EXPECT_EQ(keys.size(), 2u);
}

TEST_F(ConfigTest, RepeatedKeysFormAList) {
    ASSERT_TRUE(config_.ParseString(
        "[dot]\n"
        "rpc=http://a\n"
        "rpc=http://b, http://c\n"
        "rpc=http://d\n").success);

    EXPECT_EQ(config_.GetList("rpc", "dot"),
              (std::vector<std::string>{"http://a", "http://b", "http://c", "http://d"}));
    // The first definition stays the scalar value
    EXPECT_EQ(config_.GetString("rpc", "", "dot"), "http://a");
    EXPECT_TRUE(config_.GetList("rpc").empty());
}

// ============================================================================
// Typed Values
// ============================================================================

TEST_F(ConfigTest, Integers) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12x\nd=\ne= 5 \n").success);
    EXPECT_EQ(config_.TryGetInt("a"), std::optional<int64_t>(42));
    EXPECT_EQ(config_.TryGetInt("b"), std::optional<int64_t>(-7));
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 9), 9);

    EXPECT_EQ(config_.TryGetUInt("a"), std::optional<uint64_t>(42));
    EXPECT_FALSE(config_.TryGetUInt("b").has_value());
    EXPECT_EQ(config_.GetUInt("b", 3), 3u);
}

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=OFF\nc=1\nd=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("REFINDEX_TEST_HOST", "node.example", 1);
    ASSERT_TRUE(config_.ParseString("rpc=http://${REFINDEX_TEST_HOST}:9933\n").success);
    EXPECT_EQ(config_.GetString("rpc", ""), "http://node.example:9933");
    unsetenv("REFINDEX_TEST_HOST");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("${REFINDEX_TEST_UNSET_VAR}x"), "x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unterminated"), "${unterminated");
}

TEST_F(ConfigTest, TildeExpansion) {
    const char* oldHome = std::getenv("HOME");
    const bool hadHome = oldHome != nullptr;
    std::string savedHome = hadHome ? oldHome : "";
    setenv("HOME", "/home/indexer", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/data"), "/home/indexer/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/data"), "~other/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/indexer/.refindex");

    ASSERT_TRUE(config_.ParseString("datadir=~/refs\n").success);
    EXPECT_EQ(config_.GetPath("datadir"), "/home/indexer/refs");

    if (hadHome) {
        setenv("HOME", savedHome.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

// ============================================================================
// Command Line and Precedence
// ============================================================================

TEST_F(ConfigTest, CommandLineForms) {
    const char* argv[] = {"refindexd", "-workers=8", "--inmemory", "-noprinttoconsole"};
    ASSERT_TRUE(config_.ParseCommandLine(4, argv).success);

    EXPECT_EQ(config_.GetInt("workers", 0), 8);
    EXPECT_TRUE(config_.GetBool("inmemory", false));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_EQ(config_.GetSource("workers"), "<command-line>");
}

TEST_F(ConfigTest, CommandLineRejectsPositional) {
    const char* argv[] = {"refindexd", "stray"};
    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("stray"), std::string::npos);
}

TEST_F(ConfigTest, CommandLineBeatsFileBeatsDefault) {
    config_.SetDefault("workers", "1");
    config_.SetDefault("interval", "3600");
    config_.SetDefault("loglevel", "info");

    const char* argv[] = {"refindexd", "-workers=8"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    ASSERT_TRUE(config_.ParseString("workers=2\ninterval=60\n", "file.conf").success);

    EXPECT_EQ(config_.GetInt("workers", 0), 8);
    EXPECT_EQ(config_.GetInt("interval", 0), 60);
    EXPECT_EQ(config_.GetSource("interval"), "file.conf");
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");
    EXPECT_EQ(config_.GetSource("loglevel"), "<default>");
}

TEST_F(ConfigTest, SetOverwrites) {
    config_.Set("workers", "3");
    config_.Set("workers", "5");
    EXPECT_EQ(config_.GetInt("workers", 0), 5);
    EXPECT_EQ(config_.GetList("workers"), (std::vector<std::string>{"5"}));
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("workers=6\n[dot]\nid=0\nrpc=http://127.0.0.1:9933\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetInt("workers", 0), 6);
    EXPECT_EQ(config_.GetSource("id", "dot"), path);
}

TEST_F(ConfigTest, ParseFileMissing) {
    auto result = config_.ParseFile("/nonexistent/refindex.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open file"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace refindex
