#include <gtest/gtest.h>
#include <stdexcept>
#include "signrecog/errors.h"
#include "signrecog/recognizer.h"
#include "test_helpers.h"

using namespace signrecog;
using namespace signrecog::recognition;
using signrecog::testing_support::FakeModel;
using signrecog::testing_support::make_sequence;

namespace {
    class ThrowingModel : public SequenceModel {
    public:
        int num_states() const override { return 2; }
        int num_features() const override { return 2; }
        double score(const Eigen::MatrixXd&, const std::vector<int>&) const override {
            throw std::runtime_error("unexpected failure");
        }
    };
}

class RecognizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Word models centered on the first feature of their training data
        models_["BOOK"] = std::make_unique<FakeModel>(3, 2, 0.1, 0.0, false);
        models_["CHOCOLATE"] = std::make_unique<FakeModel>(3, 2, 5.1, 0.0, false);
        models_["FISH"] = std::make_unique<FakeModel>(3, 2, 10.1, 0.0, false);

        test_set_.add_sequence(0, make_sequence(6, 5.0), std::string("CHOCOLATE"));
        test_set_.add_sequence(1, make_sequence(4, 0.0), std::string("BOOK"));
        test_set_.add_sequence(2, make_sequence(5, 10.0), std::string("FISH"));
        test_set_.add_sequence(3, make_sequence(5, 4.8), std::string("CHOCOLATE"));
    }

    ModelMap models_;
    TestSet test_set_;
};

TEST_F(RecognizerTest, PicksHighestScoringWord) {
    auto result = recognize(models_, test_set_);

    ASSERT_EQ(result.guesses.size(), 4u);
    EXPECT_EQ(result.guesses[0], std::optional<std::string>("CHOCOLATE"));
    EXPECT_EQ(result.guesses[1], std::optional<std::string>("BOOK"));
    EXPECT_EQ(result.guesses[2], std::optional<std::string>("FISH"));
    EXPECT_EQ(result.guesses[3], std::optional<std::string>("CHOCOLATE"));
}

TEST_F(RecognizerTest, ProbabilitiesHoldEveryScoredWord) {
    auto result = recognize(models_, test_set_);

    ASSERT_EQ(result.probabilities.size(), 4u);
    for (size_t i = 0; i < result.probabilities.size(); ++i) {
        const auto& scores = result.probabilities[i];
        EXPECT_EQ(scores.size(), 3u);
        double best = scores.at(*result.guesses[i]);
        for (const auto& [word, score] : scores) {
            EXPECT_LE(score, best) << word;
        }
    }

    const auto& sequence = test_set_.items().at(1).data;
    EXPECT_DOUBLE_EQ(result.probabilities[1].at("FISH"),
                     models_.at("FISH")->score(sequence.X, sequence.lengths));
}

TEST_F(RecognizerTest, OutputFollowsIdOrderNotInsertionOrder) {
    TestSet shuffled;
    shuffled.add_sequence(7, make_sequence(5, 10.0), std::string("FISH"));
    shuffled.add_sequence(2, make_sequence(4, 0.0), std::string("BOOK"));
    shuffled.add_sequence(5, make_sequence(6, 5.0), std::string("CHOCOLATE"));

    auto result = recognize(models_, shuffled);

    ASSERT_EQ(result.guesses.size(), 3u);
    EXPECT_EQ(result.guesses[0], std::optional<std::string>("BOOK"));
    EXPECT_EQ(result.guesses[1], std::optional<std::string>("CHOCOLATE"));
    EXPECT_EQ(result.guesses[2], std::optional<std::string>("FISH"));

    ASSERT_EQ(result.probabilities.size(), 3u);
    const auto& first = shuffled.items().at(2).data;
    const auto& last = shuffled.items().at(7).data;
    EXPECT_DOUBLE_EQ(result.probabilities[0].at("FISH"),
                     models_.at("FISH")->score(first.X, first.lengths));
    EXPECT_DOUBLE_EQ(result.probabilities[2].at("BOOK"),
                     models_.at("BOOK")->score(last.X, last.lengths));
}

TEST_F(RecognizerTest, EmptyModelMapGivesEmptyResults) {
    ModelMap empty;
    auto result = recognize(empty, test_set_);

    ASSERT_EQ(result.probabilities.size(), 4u);
    ASSERT_EQ(result.guesses.size(), 4u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_TRUE(result.probabilities[i].empty());
        EXPECT_FALSE(result.guesses[i].has_value());
    }
}

TEST_F(RecognizerTest, EmptyTestSetGivesEmptyResults) {
    auto result = recognize(models_, TestSet());

    EXPECT_TRUE(result.probabilities.empty());
    EXPECT_TRUE(result.guesses.empty());
}

TEST_F(RecognizerTest, NullModelsAreSkipped) {
    models_["JOHN"] = nullptr;
    auto result = recognize(models_, test_set_);

    for (const auto& scores : result.probabilities) {
        EXPECT_EQ(scores.count("JOHN"), 0u);
        EXPECT_EQ(scores.size(), 3u);
    }
}

TEST_F(RecognizerTest, FailingModelsAreOmitted) {
    models_["AARDVARK"] = std::make_unique<FakeModel>(3, 2, 0.0, 0.0, true);
    models_["ZEBRA"] = std::make_unique<ThrowingModel>();

    auto result = recognize(models_, test_set_);

    ASSERT_EQ(result.guesses.size(), 4u);
    EXPECT_EQ(result.guesses[1], std::optional<std::string>("BOOK"));
    for (const auto& scores : result.probabilities) {
        EXPECT_EQ(scores.count("AARDVARK"), 0u);
        EXPECT_EQ(scores.count("ZEBRA"), 0u);
    }
}

TEST_F(RecognizerTest, NoGuessWhenEveryModelFails) {
    ModelMap failing;
    failing["BOOK"] = std::make_unique<ThrowingModel>();
    auto result = recognize(failing, test_set_);

    for (size_t i = 0; i < result.guesses.size(); ++i) {
        EXPECT_FALSE(result.guesses[i].has_value());
        EXPECT_TRUE(result.probabilities[i].empty());
    }
}

TEST_F(RecognizerTest, TiesGoToFirstWordAlphabetically) {
    ModelMap tied;
    tied["BETA"] = std::make_unique<FakeModel>(2, 2, 0.0, 0.0, false);
    tied["ALPHA"] = std::make_unique<FakeModel>(4, 2, 0.0, 0.0, false);

    auto result = recognize(tied, test_set_);

    for (const auto& guess : result.guesses) {
        EXPECT_EQ(guess, std::optional<std::string>("ALPHA"));
    }
}

TEST_F(RecognizerTest, RecognitionIsRepeatable) {
    auto first = recognize(models_, test_set_);
    auto second = recognize(models_, test_set_.combined_sequences());

    EXPECT_EQ(first.guesses, second.guesses);
    EXPECT_EQ(first.probabilities, second.probabilities);
}
