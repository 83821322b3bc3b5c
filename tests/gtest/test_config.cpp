// =============================================================================
// Configuration, Logging and Error Reporting Tests
// =============================================================================

#include <gtest/gtest.h>
#include "covec/config.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace covec;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        file = std::filesystem::temp_directory_path() /
               ("covec_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".conf");
    }

    void TearDown() override {
        Config::getInstance().clear();
        std::error_code ec;
        std::filesystem::remove(file, ec);
    }

    void write_file(const std::string& text) {
        std::ofstream out(file);
        out << text;
    }

    std::filesystem::path file;
};

TEST_F(ConfigTest, TypedGetters) {
    Config& config = Config::getInstance();
    config.set("workers", "4");
    config.set("ratio", "0.75");
    config.set("verbose", "Yes");
    config.set("name", "cooc_lda5");
    config.set("broken", "four");

    EXPECT_EQ(config.get<int>("workers"), 4);
    EXPECT_EQ(config.get<size_t>("workers"), 4u);
    EXPECT_DOUBLE_EQ(config.get<double>("ratio"), 0.75);
    EXPECT_TRUE(config.get<bool>("verbose"));
    EXPECT_EQ(config.get<std::string>("name"), "cooc_lda5");

    EXPECT_EQ(config.get<int>("missing", 9), 9);
    EXPECT_EQ(config.get<int>("broken", 3), 3);
    EXPECT_TRUE(config.has("name"));
    EXPECT_FALSE(config.has("missing"));
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    write_file("# covec settings\n"
               "output.dir = /tmp/covec-out\n"
               "; alternate comment\n"
               "data.train=train.csv\n"
               "not a setting\n"
               "log.level = warn\n");

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(file.string()));
    EXPECT_EQ(config.get<std::string>("output.dir"), "/tmp/covec-out");
    EXPECT_EQ(config.get<std::string>("data.train"), "train.csv");
    EXPECT_EQ(config.get<std::string>("log.level"), "warn");
    EXPECT_FALSE(config.has("not a setting"));
}

TEST_F(ConfigTest, UnknownLogLevelFallsBackToInfo) {
    write_file("log.level = chatty\n");
    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(file.string()));
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, MissingFileStillLoadsEnvironmentDefaults) {
    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load((file.string() + ".absent")));
    EXPECT_TRUE(config.has("log.level"));
    EXPECT_TRUE(config.has("output.dir"));
}

TEST_F(ConfigTest, EnvironmentThenFileThenExplicitSet) {
    Config& config = Config::getInstance();
    ASSERT_EQ(setenv("COVEC_OUTPUT_DIR", "/env/features", 1), 0);

    EXPECT_TRUE(config.load());
    EXPECT_EQ(config.get<std::string>("output.dir"), "/env/features");
    EXPECT_EQ(config.get<std::string>("log.level"), "info");

    write_file("output.dir = /file/features\n");
    EXPECT_TRUE(config.load(file.string()));
    EXPECT_EQ(config.get<std::string>("output.dir"), "/file/features");

    config.set("output.dir", "/flag/features");
    EXPECT_EQ(config.get<std::string>("output.dir"), "/flag/features");

    unsetenv("COVEC_OUTPUT_DIR");
}

TEST_F(ConfigTest, EmptyEnvironmentValueKeepsDefault) {
    Config& config = Config::getInstance();
    ASSERT_EQ(setenv("COVEC_OUTPUT_DIR", "", 1), 0);
    EXPECT_TRUE(config.load());
    EXPECT_EQ(config.get<std::string>("output.dir"), ".");
    unsetenv("COVEC_OUTPUT_DIR");
}

TEST_F(ConfigTest, NonAsciiValuesAreTrimmedIntact) {
    write_file("data.train =  \xC3\xA9t\xC3\xA9/train.csv \t\n"
               "\xC2\xA0key = caf\xC3\xA9\n");

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(file.string()));
    EXPECT_EQ(config.get<std::string>("data.train"), "\xC3\xA9t\xC3\xA9/train.csv");
    EXPECT_EQ(config.get<std::string>("\xC2\xA0key"), "caf\xC3\xA9");
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("off"), LogLevel::OFF);
    EXPECT_EQ(parse_log_level("whatever"), LogLevel::INFO);
}

TEST(LoggingTest, LevelFiltersMessages) {
    std::ostringstream captured;
    const LogLevel previous = Logger::getInstance().level();
    set_log_output(captured);
    set_log_level(LogLevel::WARN);

    LOG_INFO("hidden ", 1);
    LOG_WARN("shown ", 2);

    set_log_output(std::clog);
    set_log_level(previous);

    const std::string text = captured.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown 2"), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("test_config.cpp"), std::string::npos);
}

TEST(LoggingTest, ScopedTimerReportsStage) {
    std::ostringstream captured;
    const LogLevel previous = Logger::getInstance().level();
    set_log_output(captured);
    set_log_level(LogLevel::INFO);
    {
        ScopedTimer timer("vectorize documents");
        EXPECT_GE(timer.elapsed_seconds(), 0.0);
    }
    set_log_output(std::clog);
    set_log_level(previous);

    EXPECT_NE(captured.str().find("vectorize documents: "), std::string::npos);
}

TEST(ErrorTest, ExceptionsCarryCodeContextAndSuggestion) {
    try {
        throw VocabularyError("nothing left", "fit_transform", "lower min_df");
    } catch (const CovecException& e) {
        EXPECT_EQ(e.code(), ErrorCode::EMPTY_VOCABULARY);
        EXPECT_EQ(e.message(), "nothing left");
        EXPECT_EQ(e.context(), "fit_transform");
        EXPECT_EQ(e.suggestion(), "lower min_df");
        const std::string what = e.what();
        EXPECT_NE(what.find("EMPTY_VOCABULARY"), std::string::npos);
        EXPECT_NE(what.find("lower min_df"), std::string::npos);
        // Reporting what() alone shows the suggestion exactly once
        EXPECT_EQ(what.find("lower min_df"), what.rfind("lower min_df"));
    }

    EXPECT_STREQ(error_code_name(ErrorCode::JOB_FAILED), "JOB_FAILED");
    EXPECT_THROW(COVEC_CHECK_SCHEMA(false, "bad column"), SchemaError);
    EXPECT_NO_THROW(COVEC_CHECK_ARGUMENT(true, "never"));
}
