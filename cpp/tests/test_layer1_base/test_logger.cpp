/**
 * @file test_logger.cpp
 * @brief Layer 1 tests for the synchronous Logger and its sinks.
 *
 * The Logger is a process-wide singleton; every test restores the console sink and the
 * previous level in TearDown.
 */
#include "ckv_base.hpp"
#include "shared_test_helpers.h"

#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using checkedval::utils::Logger;
using namespace checkedval::tests::helper;
using namespace ::testing;

class LoggerTest : public ::testing::Test
{
  protected:
    void SetUp() override { saved_level_ = Logger::instance().level(); }

    void TearDown() override
    {
        auto &logger = Logger::instance();
        logger.set_console();
        logger.set_level(saved_level_);
        logger.set_write_error_callback(nullptr);
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = unique_temp_path(test_name);
        paths_to_clean_.push_back(p);
        return p;
    }

    std::string ReadLog(const fs::path &p)
    {
        Logger::instance().flush();
        std::string contents;
        EXPECT_TRUE(read_file_contents(p.string(), contents));
        return contents;
    }

    Logger::Level saved_level_{Logger::Level::L_WARNING};
    std::vector<fs::path> paths_to_clean_;
};

// ============================================================================
// Level parsing
// ============================================================================

TEST(LoggerLevelTest, LevelFromStringAcceptsKnownNames)
{
    EXPECT_EQ(Logger::level_from_string("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::level_from_string("DEBUG"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string(" info "), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::level_from_string("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("Warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::level_from_string("system"), Logger::Level::L_SYSTEM);
}

TEST(LoggerLevelTest, LevelFromStringRejectsUnknownNames)
{
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
    EXPECT_FALSE(Logger::level_from_string("").has_value());
}

// ============================================================================
// File sink
// ============================================================================

TEST_F(LoggerTest, BasicLoggingToFile)
{
    auto log_path = GetUniqueLogPath("basic_logging");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(log_path.string()));
    logger.set_level(Logger::Level::L_TRACE);

    LOGGER_INFO("hello {}", "file");
    LOGGER_ERROR("value {} rejected", 42);

    const auto contents = ReadLog(log_path);
    EXPECT_THAT(contents, HasSubstr("[CKV] [INFO  ]"));
    EXPECT_THAT(contents, HasSubstr("hello file"));
    EXPECT_THAT(contents, HasSubstr("[ERROR ]"));
    EXPECT_THAT(contents, HasSubstr("value 42 rejected"));
    EXPECT_THAT(contents, HasSubstr(fmt::format("PID:{:5}", checkedval::platform::get_pid())));
    EXPECT_EQ(count_lines(contents), 2u);
}

TEST_F(LoggerTest, LogLevelFiltering)
{
    auto log_path = GetUniqueLogPath("log_level_filtering");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(log_path.string()));
    logger.set_level(Logger::Level::L_WARNING);

    LOGGER_TRACE("dropped trace");
    LOGGER_DEBUG("dropped debug");
    LOGGER_INFO("dropped info");
    LOGGER_WARN("kept warn");
    LOGGER_SYSTEM("kept system");

    const auto contents = ReadLog(log_path);
    EXPECT_THAT(contents, Not(HasSubstr("dropped")));
    EXPECT_EQ(count_lines(contents, "kept"), 2u);
}

TEST_F(LoggerTest, BadRuntimeFormatStringIsReported)
{
    auto log_path = GetUniqueLogPath("bad_format_string");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(log_path.string()));
    logger.set_level(Logger::Level::L_TRACE);

    LOGGER_WARN_RT("needs two {} {}", 1);

    EXPECT_THAT(ReadLog(log_path), HasSubstr("[FORMAT ERROR]"));
}

TEST_F(LoggerTest, SetLogfileFailureKeepsPreviousSink)
{
    auto log_path = GetUniqueLogPath("keeps_previous_sink");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(log_path.string()));
    logger.set_level(Logger::Level::L_TRACE);

    std::string reported;
    logger.set_write_error_callback([&](const std::string &what) { reported = what; });

    const auto bad_path = fs::temp_directory_path() / "checkedval_no_such_dir" / "x" / "y.log";
    EXPECT_FALSE(logger.set_logfile(bad_path.string()));
    EXPECT_THAT(reported, HasSubstr("Failed to open log file"));

    LOGGER_WARN("still goes to the first file");
    EXPECT_THAT(ReadLog(log_path), HasSubstr("still goes to the first file"));
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines)
{
    auto log_path = GetUniqueLogPath("concurrent_writers");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(log_path.string()));
    logger.set_level(Logger::Level::L_INFO);

    constexpr int kThreads = 4;
    constexpr int kMessagesPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [t]()
            {
                for (int i = 0; i < kMessagesPerThread; ++i)
                    LOGGER_INFO("writer {} message {}", t, i);
            });
    }
    for (auto &th : threads)
        th.join();

    const auto contents = ReadLog(log_path);
    EXPECT_EQ(count_lines(contents, "[CKV]"), static_cast<size_t>(kThreads * kMessagesPerThread));
    EXPECT_EQ(count_lines(contents, "writer 3 message"), static_cast<size_t>(kMessagesPerThread));
}

// ============================================================================
// Console sink
// ============================================================================

TEST_F(LoggerTest, ConsoleSinkWritesToStderr)
{
    auto &logger = Logger::instance();
    logger.set_console();
    logger.set_level(Logger::Level::L_TRACE);

    StringCapture capture(STDERR_FILENO);
    LOGGER_WARN("console line {}", 7);
    logger.flush();
    const auto output = capture.GetOutput();

    EXPECT_THAT(output, HasSubstr("[WARN  ]"));
    EXPECT_THAT(output, HasSubstr("console line 7"));
}
