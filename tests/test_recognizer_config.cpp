#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include "signrecog/errors.h"
#include "signrecog/recognizer_config.h"

using namespace signrecog;
using namespace signrecog::config;
using namespace testing;

class RecognizerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "signrecog_config_tests";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path test_dir_;
    ConfigManager manager_;
};

TEST_F(RecognizerConfigTest, DefaultsMatchSelectionParameters) {
    RecognizerConfig config;

    EXPECT_EQ(config.selector, selection::SelectorKind::CONSTANT);
    EXPECT_EQ(config.selector_config.n_constant, 3);
    EXPECT_EQ(config.selector_config.min_states, 2);
    EXPECT_EQ(config.selector_config.max_states, 10);
    EXPECT_EQ(config.selector_config.random_seed, 14u);
    EXPECT_FALSE(config.selector_config.verbose);
    EXPECT_DOUBLE_EQ(config.training_config.tolerance, 1e-2);
    EXPECT_TRUE(manager_.validate_config(config).is_valid);
}

TEST_F(RecognizerConfigTest, JsonRoundTripKeepsValues) {
    RecognizerConfig config;
    config.selector = selection::SelectorKind::DIC;
    config.selector_config.min_states = 3;
    config.selector_config.max_states = 15;
    config.selector_config.random_seed = 99;
    config.selector_config.num_threads = 4;
    config.training_config.tolerance = 0.001;
    config.logging.level = LogLevel::DEBUG;
    config.logging.log_file_path = "run.log";

    std::string json = manager_.config_to_json(config);
    EXPECT_THAT(json, HasSubstr("\"selector\""));
    EXPECT_THAT(json, HasSubstr("\"dic\""));

    RecognizerConfig parsed;
    ASSERT_TRUE(manager_.config_from_json(json, parsed));
    EXPECT_EQ(parsed.selector, selection::SelectorKind::DIC);
    EXPECT_EQ(parsed.selector_config.min_states, 3);
    EXPECT_EQ(parsed.selector_config.max_states, 15);
    EXPECT_EQ(parsed.selector_config.random_seed, 99u);
    EXPECT_EQ(parsed.selector_config.num_threads, 4);
    EXPECT_DOUBLE_EQ(parsed.training_config.tolerance, 0.001);
    EXPECT_EQ(parsed.logging.level, LogLevel::DEBUG);
    EXPECT_EQ(parsed.logging.log_file_path, "run.log");
}

TEST_F(RecognizerConfigTest, PartialJsonKeepsDefaults) {
    RecognizerConfig config;
    ASSERT_TRUE(manager_.config_from_json(R"({"selector_config": {"max_states": 6}})", config));

    EXPECT_EQ(config.selector_config.max_states, 6);
    EXPECT_EQ(config.selector_config.min_states, 2);
    EXPECT_EQ(config.selector, selection::SelectorKind::CONSTANT);
}

TEST_F(RecognizerConfigTest, RejectsMalformedJson) {
    RecognizerConfig config;
    EXPECT_FALSE(manager_.config_from_json("{ not json", config));
    EXPECT_FALSE(manager_.config_from_json(R"({"selector": "aic"})", config));
    EXPECT_FALSE(manager_.config_from_json(R"({"logging": {"level": "loud"}})", config));
}

TEST_F(RecognizerConfigTest, ValidationFlagsBadRanges) {
    RecognizerConfig config;
    config.selector_config.min_states = 8;
    config.selector_config.max_states = 4;
    config.selector_config.cv_folds = 1;

    auto result = manager_.validate_config(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(RecognizerConfigTest, EmptyRangeIsOnlyAWarning) {
    RecognizerConfig config;
    config.selector_config.min_states = 5;
    config.selector_config.max_states = 5;

    auto result = manager_.validate_config(config);

    EXPECT_TRUE(result.is_valid);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_THAT(result.warnings.front(), HasSubstr("cv yields no model"));
    EXPECT_THAT(result.warnings.front(), HasSubstr("fall back to n_constant"));
}

TEST_F(RecognizerConfigTest, SaveAndLoadFile) {
    RecognizerConfig config;
    config.selector = selection::SelectorKind::CV;
    config.selector_config.cv_folds = 5;
    std::string path = (test_dir_ / "nested" / "recognizer.json").string();

    ASSERT_TRUE(manager_.save_config(path, config));

    RecognizerConfig loaded = manager_.load_validated(path);
    EXPECT_EQ(loaded.selector, selection::SelectorKind::CV);
    EXPECT_EQ(loaded.selector_config.cv_folds, 5);
}

TEST_F(RecognizerConfigTest, SaveRefusesInvalidConfig) {
    RecognizerConfig config;
    config.selector_config.num_threads = 0;

    EXPECT_FALSE(manager_.save_config((test_dir_ / "bad.json").string(), config));
}

TEST_F(RecognizerConfigTest, LoadValidatedThrowsConfigError) {
    EXPECT_THROW(manager_.load_validated((test_dir_ / "missing.json").string()), ConfigError);

    std::string invalid = write_file("invalid.json", R"({"selector_config": {"n_constant": 0}})");
    try {
        manager_.load_validated(invalid);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), HasSubstr("n_constant"));
    }
}
