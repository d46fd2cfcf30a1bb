#include "execkit/logger.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace {

std::string read_all(std::FILE *file) {
    std::rewind(file);
    std::string text;
    char buffer[256];
    while (size_t n = std::fread(buffer, 1, sizeof(buffer), file))
        text.append(buffer, n);
    return text;
}

} // namespace

TEST(Logger, ParsesLevelNames) {
    EXPECT_EQ(execkit::parse_log_level("debug"), execkit::LogLevel::debug);
    EXPECT_EQ(execkit::parse_log_level("info"), execkit::LogLevel::info);
    EXPECT_EQ(execkit::parse_log_level("warn"), execkit::LogLevel::warning);
    EXPECT_EQ(execkit::parse_log_level("error"), execkit::LogLevel::error);
    EXPECT_FALSE(execkit::parse_log_level("loud").has_value());
    EXPECT_EQ(execkit::to_string(execkit::LogLevel::warning), "warning");
}

TEST(Logger, FormatsArguments) {
    execkit::testing::RecordingLogger logger;
    logger.debug("attempt {} of {}", 2, 3);
    auto records = logger.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, execkit::LogLevel::debug);
    EXPECT_EQ(records[0].message, "attempt 2 of 3");
}

TEST(Logger, EnablesEveryLevelByDefault) {
    execkit::testing::RecordingLogger logger;
    EXPECT_TRUE(logger.enabled(execkit::LogLevel::debug));
    EXPECT_TRUE(logger.enabled(execkit::LogLevel::error));
}

TEST(StreamLogger, FiltersBelowMinimumLevel) {
    std::FILE *file = std::tmpfile();
    ASSERT_NE(file, nullptr);
    {
        execkit::StreamLogger logger{execkit::LogLevel::info, file};
        logger.debug("hidden {}", 1);
        logger.info("shown {}", 2);
        logger.error("also shown");
    }
    EXPECT_EQ(read_all(file), "[info] shown 2\n[error] also shown\n");
    std::fclose(file);
}

TEST(NullLogger, IsDisabled) {
    execkit::NullLogger logger;
    EXPECT_FALSE(logger.enabled(execkit::LogLevel::error));
    logger.error("dropped {}", 1);
}
