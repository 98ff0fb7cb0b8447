// test/unit/test_config_parser.cpp
// -----------------------------------------------------------

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/guard_config.hpp"
#include "util/config_parser.hpp"

namespace {

TEST(ConfigParserTest, DefaultsWithoutInput) {
    piiguard::config::GuardConfig cfg;
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_TRUE(cfg.displayName.empty());
    EXPECT_EQ(cfg.maxJobChars, (uint64_t)12000);
    EXPECT_EQ(cfg.maxResumeChars, (uint64_t)30000);
    EXPECT_EQ(cfg.maxAnswerChars, (uint64_t)2000);
}

TEST(ConfigParserTest, ParsesKeyValueLines) {
    piiguard::config::GuardConfig cfg;
    piiguard::util::ConfigParser parser(cfg);

    std::istringstream in(
        "# PII Guard settings\n"
        "logLevel = debug\n"
        "\n"
        "  maxJobChars=500  \r\n"
        "maxAnswerChars = 10\n"
        "displayName = Max Mustermann\n"
        "logFile=/tmp/piiguard.log\n");
    parser.loadFromStream(in);

    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.maxJobChars, (uint64_t)500);
    EXPECT_EQ(cfg.maxAnswerChars, (uint64_t)10);
    EXPECT_EQ(cfg.maxResumeChars, (uint64_t)30000);
    EXPECT_EQ(cfg.displayName, "Max Mustermann");
    EXPECT_EQ(cfg.logFile, "/tmp/piiguard.log");
}

TEST(ConfigParserTest, LineWithoutEqualsThrows) {
    piiguard::config::GuardConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    std::istringstream in("logLevel=info\nthis is not a setting\n");
    EXPECT_THROW(parser.loadFromStream(in), std::runtime_error);
}

TEST(ConfigParserTest, InvalidValuesThrow) {
    const char* bad[] = {
        "maxJobChars=abc",
        "maxJobChars=12k",
        "maxResumeChars=-5",
        "maxAnswerChars=+5",
        "maxAnswerChars=",
        "logLevel=verbose",
    };
    for (const char* line : bad) {
        piiguard::config::GuardConfig cfg;
        piiguard::util::ConfigParser parser(cfg);
        std::istringstream in(line);
        EXPECT_THROW(parser.loadFromStream(in), std::runtime_error) << line;
    }
}

TEST(ConfigParserTest, UnknownKeyIsIgnored) {
    piiguard::config::GuardConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    std::istringstream in("p2pPort=9000\nlogLevel=warn\n");
    EXPECT_NO_THROW(parser.loadFromStream(in));
    EXPECT_EQ(cfg.logLevel, "warn");
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    piiguard::config::GuardConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    EXPECT_NO_THROW(parser.loadFromFile("/nonexistent/piiguard-test.conf"));
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_EQ(cfg.maxJobChars, (uint64_t)12000);
}

} // namespace
