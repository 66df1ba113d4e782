#include "Logging.hh"

#include <gtest/gtest.h>

#include <array>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {
using namespace std::string_view_literals;
constexpr auto MESSAGE = "This is logging"sv;
}

class LoggingTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        setupLogging(Tarot::LogLevel::WARNING, stream);
    }

    virtual void TearDown()
    {
        setupLogging(Tarot::LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testLoggingWithTriggeringLevel)
{
    setupLogging(Tarot::LogLevel::INFO, stream);
    log(Tarot::LogLevel::INFO, "format %s format"sv, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithLevelNone)
{
    setupLogging(Tarot::LogLevel::NONE, stream);
    log(Tarot::LogLevel::FATAL, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithMissingFormatSpecifier)
{
    log(Tarot::LogLevel::WARNING, ""sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithInvalidFormatSpecifier)
{
    log(Tarot::LogLevel::WARNING, "%"sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(Tarot::LogLevel::WARNING, Tarot::getLogLevel(0));
    EXPECT_EQ(Tarot::LogLevel::INFO, Tarot::getLogLevel(1));
    EXPECT_EQ(Tarot::LogLevel::DEBUG, Tarot::getLogLevel(2));
}

TEST_F(LoggingTest, testLoggingOptional)
{
    log(Tarot::LogLevel::WARNING, "%s %s"sv,
        std::optional<int> {}, std::optional<int> {3});
    EXPECT_NE(std::string::npos, stream.str().find("(none) 3"));
}

TEST_F(LoggingTest, testLevelNameInPrefix)
{
    log(Tarot::LogLevel::ERROR, "%s"sv, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find("ERROR"));
    EXPECT_EQ('\n', stream.str().back());
}

TEST_F(LoggingTest, testLevelBelowMinimumIsFiltered)
{
    log(Tarot::LogLevel::INFO, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}
