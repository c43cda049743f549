#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>
#include <stepplot/data.hpp>
#include <stepplot/error.hpp>
#include <stepplot/logger.hpp>
#include <string>
#include <vector>

using namespace stepplot;

namespace
{

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
        unsetenv("STEPPLOT_LOG_LEVEL");
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

}   // namespace

TEST_F(LoggerTest, FiltersBelowLevel)
{
    Logger::instance().set_level(LogLevel::Warning);
    STEPPLOT_LOG_INFO("test", "hidden");
    STEPPLOT_LOG_WARN("test", "shown");
    STEPPLOT_LOG_ERROR("test", "also shown");

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_EQ(entries_[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, IsEnabled)
{
    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Trace));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Debug));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Critical));
}

TEST_F(LoggerTest, FormatsPlaceholders)
{
    Logger::instance().set_level(LogLevel::Trace);
    STEPPLOT_LOG_DEBUG("step", "{} points, kind {}, fill {}", size_t{42}, "mid", true);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "step");
    EXPECT_EQ(entries_[0].message, "42 points, kind mid, fill true");
}

TEST_F(LoggerTest, PlaceholderInArgumentIsNotExpanded)
{
    Logger::instance().set_level(LogLevel::Trace);
    STEPPLOT_LOG_INFO("test", "{} and {}", std::string("{}"), 7);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{} and 7");
}

TEST_F(LoggerTest, ExtraPlaceholdersLeftAlone)
{
    Logger::instance().set_level(LogLevel::Trace);
    STEPPLOT_LOG_INFO("test", "{} {}", 1);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "1 {}");
}

TEST_F(LoggerTest, NullCStringArgument)
{
    Logger::instance().set_level(LogLevel::Trace);
    const char* nothing = nullptr;
    STEPPLOT_LOG_INFO("test", "value {}", nothing);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "value (null)");
}

TEST_F(LoggerTest, RejectedInputIsLogged)
{
    Logger::instance().set_level(LogLevel::Warning);
    std::vector<Point> pts = {{0, 0}, {1, std::numeric_limits<double>::infinity()}};
    EXPECT_THROW(copy_points(pts), InvalidInput);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "data");
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
    EXPECT_NE(entries_[0].message.find("index 1"), std::string::npos);
}

TEST_F(LoggerTest, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST_F(LoggerTest, ParseLevel)
{
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("info"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("error"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("critical"), LogLevel::Critical);
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
}

TEST_F(LoggerTest, ConfigureFromEnv)
{
    Logger::instance().set_level(LogLevel::Info);

    setenv("STEPPLOT_LOG_LEVEL", "error", 1);
    Logger::instance().configure_from_env();
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    setenv("STEPPLOT_LOG_LEVEL", "nonsense", 1);
    Logger::instance().configure_from_env();
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    unsetenv("STEPPLOT_LOG_LEVEL");
    Logger::instance().configure_from_env();
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);
}

TEST_F(LoggerTest, FileSinkAppendsLines)
{
    const std::string path = ::testing::TempDir() + "stepplot_logger_test.log";
    std::remove(path.c_str());

    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::file_sink(path));
    STEPPLOT_LOG_INFO("clip", "first");
    STEPPLOT_LOG_WARN("clip", "second");
    Logger::instance().clear_sinks();

    std::ifstream            in(path);
    std::string              line;
    std::vector<std::string> lines;
    while (std::getline(in, line))
        lines.push_back(line);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("INFO [clip] first"), std::string::npos);
    EXPECT_NE(lines[1].find("WARN [clip] second"), std::string::npos);

    std::remove(path.c_str());
}

TEST_F(LoggerTest, NullSinkDiscards)
{
    Logger::instance().clear_sinks();
    Logger::instance().add_sink(sinks::null_sink());
    STEPPLOT_LOG_ERROR("test", "dropped");
    EXPECT_TRUE(entries_.empty());
}
