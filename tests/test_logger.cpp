#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include "signrecog/logger.h"

using namespace signrecog;
using namespace testing;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "signrecog_logger_tests";
        std::filesystem::create_directories(test_dir_);
        test_log_file_ = test_dir_ / "test_log.txt";
        std::filesystem::remove(test_log_file_);

        logger_ = std::make_unique<Logger>("test");
        logger_->set_output(LogOutput::FILE);
        logger_->set_log_file(test_log_file_.string());
        LogFormat format;
        format.include_timestamp = false;
        format.use_colors = false;
        logger_->set_format(format);
    }

    void TearDown() override {
        logger_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    std::string read_log_file() {
        logger_->flush();
        std::ifstream file(test_log_file_);
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        return content;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path test_log_file_;
    std::unique_ptr<Logger> logger_;
};

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    logger_->set_level(LogLevel::WARN);
    logger_->info("hidden message");
    logger_->warn("visible message");

    std::string content = read_log_file();
    EXPECT_THAT(content, Not(HasSubstr("hidden message")));
    EXPECT_THAT(content, HasSubstr("[WARN]"));
    EXPECT_THAT(content, HasSubstr("visible message"));
}

TEST_F(LoggerTest, FormattedMessages) {
    logger_->info_f("trained %d words in %.1f s", 12, 3.5);

    EXPECT_THAT(read_log_file(), HasSubstr("trained 12 words in 3.5 s"));
}

TEST_F(LoggerTest, CandidateAndSelectionMessages) {
    logger_->log_candidate("BOOK", 4, true);
    logger_->log_candidate("FISH", 7, false);
    logger_->log_selection("BOOK", "bic", 4);
    logger_->log_selection("FISH", "cv", 0);

    std::string content = read_log_file();
    EXPECT_THAT(content, HasSubstr("model created for BOOK with 4 states"));
    EXPECT_THAT(content, HasSubstr("failure on FISH with 7 states"));
    EXPECT_THAT(content, HasSubstr("bic selected 4 states for BOOK"));
    EXPECT_THAT(content, HasSubstr("cv found no usable model for FISH"));
}

TEST_F(LoggerTest, StatsCountByLevel) {
    logger_->set_level(LogLevel::DEBUG);
    logger_->debug("d");
    logger_->info("i");
    logger_->info("i");
    logger_->error("e");
    logger_->fatal("f");

    auto stats = logger_->get_stats();
    EXPECT_EQ(stats.debug_count, 1u);
    EXPECT_EQ(stats.info_count, 2u);
    EXPECT_EQ(stats.error_count, 1u);
    EXPECT_EQ(stats.fatal_count, 1u);

    logger_->reset_stats();
    EXPECT_EQ(logger_->get_stats().info_count, 0u);
}

TEST_F(LoggerTest, ScopedLevelRestoresPreviousLevel) {
    logger_->set_level(LogLevel::INFO);
    {
        Logger::ScopedLevel scoped(*logger_, LogLevel::ERROR);
        EXPECT_FALSE(logger_->is_enabled(LogLevel::WARN));
    }
    EXPECT_EQ(logger_->level(), LogLevel::INFO);
}

TEST_F(LoggerTest, PerformanceTimerLogsCompletion) {
    {
        Logger::PerformanceTimer timer(*logger_, LogLevel::INFO, "word training");
    }
    EXPECT_THAT(read_log_file(), HasSubstr("word training completed in"));
}

TEST_F(LoggerTest, ConcurrentLoggingKeepsEveryLine) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 25; ++i) {
                logger_->info_f("thread %d message %d", t, i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(logger_->get_stats().info_count, 100u);
    std::string content = read_log_file();
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 100);
}

TEST_F(LoggerTest, LevelChangesWhileWorkersLog) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 3; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 50; ++i) {
                logger_->warn("worker message");
            }
        });
    }
    for (int i = 0; i < 50; ++i) {
        Logger::ScopedLevel scoped(*logger_, i % 2 == 0 ? LogLevel::ERROR : LogLevel::DEBUG);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(logger_->level(), LogLevel::INFO);
    EXPECT_LE(logger_->get_stats().warn_count, 150u);
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "ERROR");
}
