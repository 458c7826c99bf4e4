#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <Eigen/Core>
#include "signrecog/errors.h"
#include "signrecog/gaussian_hmm.h"
#include "signrecog/hmm_trainer.h"

using namespace signrecog;
using namespace signrecog::hmm;

class GaussianHmmTest : public ::testing::Test {
protected:
    void SetUp() override {
        model_ = std::make_unique<GaussianHmm>(2, 1);

        Eigen::VectorXd start(2);
        start << 0.9, 0.1;
        Eigen::MatrixXd transitions(2, 2);
        transitions << 0.8, 0.2,
                       0.1, 0.9;
        model_->set_start_probabilities(start);
        model_->set_transition_matrix(transitions);
        model_->set_state(0, DiagonalGaussian(Eigen::VectorXd::Constant(1, 0.0), Eigen::VectorXd::Constant(1, 1.0)));
        model_->set_state(1, DiagonalGaussian(Eigen::VectorXd::Constant(1, 10.0), Eigen::VectorXd::Constant(1, 1.0)));
    }

    // Two clusters, the first half of each sequence near 0 and the rest near 10
    static Eigen::MatrixXd two_cluster_data(int sequences, int frames, std::uint32_t seed) {
        std::mt19937 gen(seed);
        std::normal_distribution<double> noise(0.0, 0.5);

        Eigen::MatrixXd X(sequences * frames, 2);
        for (int s = 0; s < sequences; ++s) {
            for (int t = 0; t < frames; ++t) {
                double base = t < frames / 2 ? 0.0 : 10.0;
                X(s * frames + t, 0) = base + noise(gen);
                X(s * frames + t, 1) = -base + noise(gen);
            }
        }
        return X;
    }

    std::unique_ptr<GaussianHmm> model_;
};

TEST_F(GaussianHmmTest, DiagonalGaussianDensity) {
    Eigen::VectorXd mean(2);
    mean << 1.0, -1.0;
    Eigen::VectorXd variances(2);
    variances << 4.0, 0.25;
    DiagonalGaussian gaussian(mean, variances);

    Eigen::VectorXd x(2);
    x << 3.0, -0.5;
    double expected = -std::log(2.0 * M_PI) - 0.5 * std::log(4.0 * 0.25) - 0.5 * (1.0 + 1.0);
    EXPECT_NEAR(gaussian.log_pdf(x), expected, 1e-12);

    Eigen::MatrixXd rows(2, 2);
    rows << 3.0, -0.5,
            1.0, -1.0;
    Eigen::VectorXd densities = gaussian.log_pdf_rows(rows);
    EXPECT_NEAR(densities(0), expected, 1e-12);
    EXPECT_GT(densities(1), densities(0));
    EXPECT_TRUE(gaussian.is_valid());
}

TEST_F(GaussianHmmTest, PosteriorsAreNormalized) {
    Eigen::MatrixXd sequence(5, 1);
    sequence << 0.1, -0.2, 9.8, 10.1, 0.3;

    ForwardBackwardResult result = model_->forward_backward(sequence);

    ASSERT_EQ(result.gamma.rows(), 5);
    ASSERT_EQ(result.gamma.cols(), 2);
    EXPECT_TRUE(std::isfinite(result.log_likelihood));
    for (int t = 0; t < 5; ++t) {
        EXPECT_NEAR(result.gamma.row(t).sum(), 1.0, 1e-9);
    }
    EXPECT_GT(result.gamma(2, 1), 0.99);
}

TEST_F(GaussianHmmTest, ScoreSumsSequenceLikelihoods) {
    Eigen::MatrixXd first(3, 1);
    first << 0.0, 0.5, 10.0;
    Eigen::MatrixXd second(2, 1);
    second << 9.5, 10.5;

    Eigen::MatrixXd X(5, 1);
    X << first, second;

    double expected = model_->forward_backward(first).log_likelihood +
                      model_->forward_backward(second).log_likelihood;
    EXPECT_NEAR(model_->score(X, {3, 2}), expected, 1e-9);
}

TEST_F(GaussianHmmTest, ScoreRejectsWrongShapes) {
    Eigen::MatrixXd wrong_features = Eigen::MatrixXd::Zero(4, 3);
    EXPECT_THROW(model_->score(wrong_features, {4}), ScoreFailure);

    Eigen::MatrixXd X = Eigen::MatrixXd::Zero(4, 1);
    EXPECT_THROW(model_->score(X, {3}), ScoreFailure);
    EXPECT_THROW(model_->score(X, {}), ScoreFailure);
}

TEST_F(GaussianHmmTest, LogSumExpIsStable) {
    Eigen::VectorXd values(3);
    values << -1000.0, -1000.0, -1000.0;
    EXPECT_NEAR(log_sum_exp(values), -1000.0 + std::log(3.0), 1e-9);
}

TEST_F(GaussianHmmTest, TrainerSeparatesClusters) {
    Eigen::MatrixXd X = two_cluster_data(4, 20, 7);
    std::vector<int> lengths(4, 20);

    GaussianHmmTrainer trainer;
    TrainingStats stats;
    auto trained = trainer.train(HmmTopology(2, 100, 14), X, lengths, stats);

    ASSERT_NE(trained, nullptr);
    EXPECT_TRUE(trained->is_valid());
    EXPECT_GT(stats.final_iteration, 0);

    double low = std::min(trained->state(0).mean()(0), trained->state(1).mean()(0));
    double high = std::max(trained->state(0).mean()(0), trained->state(1).mean()(0));
    EXPECT_NEAR(low, 0.0, 0.5);
    EXPECT_NEAR(high, 10.0, 0.5);
}

TEST_F(GaussianHmmTest, TrainingImprovesLikelihood) {
    Eigen::MatrixXd X = two_cluster_data(3, 16, 3);
    std::vector<int> lengths(3, 16);

    TrainingConfig config;
    config.tolerance = 1e-4;
    GaussianHmmTrainer trainer(config);
    TrainingStats stats;
    trainer.train(HmmTopology(3, 50, 14), X, lengths, stats);

    ASSERT_GE(stats.log_likelihoods.size(), 2u);
    for (double ll : stats.log_likelihoods) {
        EXPECT_TRUE(std::isfinite(ll));
    }
    EXPECT_GE(stats.log_likelihoods.back(), stats.log_likelihoods.front());
}

TEST_F(GaussianHmmTest, FitIsDeterministicForSeed) {
    Eigen::MatrixXd X = two_cluster_data(3, 12, 11);
    std::vector<int> lengths(3, 12);

    GaussianHmmTrainer trainer;
    auto first = trainer.fit(HmmTopology(3, 100, 14), X, lengths);
    auto second = trainer.fit(HmmTopology(3, 100, 14), X, lengths);

    EXPECT_EQ(first->num_states(), 3);
    EXPECT_EQ(first->num_features(), 2);
    EXPECT_DOUBLE_EQ(first->score(X, lengths), second->score(X, lengths));
}

TEST_F(GaussianHmmTest, FitFailsWithFewerFramesThanStates) {
    Eigen::MatrixXd X = Eigen::MatrixXd::Random(3, 2);
    GaussianHmmTrainer trainer;

    EXPECT_THROW(trainer.fit(HmmTopology(5, 100, 14), X, {3}), FitFailure);
}

TEST_F(GaussianHmmTest, FitFailsOnInvalidInput) {
    GaussianHmmTrainer trainer;
    Eigen::MatrixXd X = Eigen::MatrixXd::Random(10, 2);

    EXPECT_THROW(trainer.fit(HmmTopology(2, 100, 14), X, {4, 4}), FitFailure);
    EXPECT_THROW(trainer.fit(HmmTopology(0, 100, 14), X, {10}), FitFailure);

    X(3, 1) = std::nan("");
    EXPECT_THROW(trainer.fit(HmmTopology(2, 100, 14), X, {10}), FitFailure);
}
