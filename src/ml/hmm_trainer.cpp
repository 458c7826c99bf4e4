#include "signrecog/hmm_trainer.h"
#include "signrecog/errors.h"
#include "signrecog/logger.h"
#include <algorithm>
#include <numeric>
#include <cmath>
#include <random>

namespace signrecog {
namespace hmm {

    GaussianHmmTrainer::GaussianHmmTrainer(const TrainingConfig& config) : config_(config) {
    }

    std::unique_ptr<SequenceModel> GaussianHmmTrainer::fit(const HmmTopology& topology,
                                                           const Eigen::MatrixXd& observations,
                                                           const std::vector<int>& lengths) const {
        TrainingStats stats;
        return train(topology, observations, lengths, stats);
    }

    std::unique_ptr<GaussianHmm> GaussianHmmTrainer::train(const HmmTopology& topology,
                                                           const Eigen::MatrixXd& observations,
                                                           const std::vector<int>& lengths,
                                                           TrainingStats& stats) const {
        const int N = topology.num_states;
        if (N <= 0) {
            throw FitFailure("state count must be positive, got " + std::to_string(N));
        }
        if (observations.cols() == 0 || !observations.allFinite()) {
            throw FitFailure("observations are empty or contain non-finite values");
        }
        if (!lengths_match(observations, lengths)) {
            throw FitFailure("sequence lengths do not match observation rows");
        }
        if (observations.rows() < N) {
            throw FitFailure("n_samples=" + std::to_string(observations.rows()) +
                             " should be >= n_states=" + std::to_string(N));
        }

        std::vector<Eigen::MatrixXd> sequences;
        sequences.reserve(lengths.size());
        int offset = 0;
        for (int length : lengths) {
            sequences.push_back(observations.middleRows(offset, length));
            offset += length;
        }

        auto model = std::make_unique<GaussianHmm>(N, static_cast<int>(observations.cols()));
        initialize_parameters(*model, observations, topology.random_seed);

        for (int iteration = 0; iteration < topology.max_iterations; ++iteration) {
            // E-Step: Forward-Backward over every sequence
            std::vector<ForwardBackwardResult> fb_results;
            double log_likelihood = em_expectation_step(*model, sequences, fb_results);
            if (!std::isfinite(log_likelihood)) {
                throw FitFailure("log-likelihood became non-finite at iteration " +
                                 std::to_string(iteration + 1));
            }

            // M-Step: Parameter re-estimation
            em_maximization_step(*model, sequences, fb_results);

            double gain = stats.log_likelihoods.empty()
                ? std::numeric_limits<double>::infinity()
                : log_likelihood - stats.log_likelihoods.back();

            stats.log_likelihoods.push_back(log_likelihood);
            stats.final_iteration = iteration + 1;
            stats.final_log_likelihood = log_likelihood;

            if (config_.verbose) {
                log_iteration_info(iteration, stats);
            }

            if (gain < config_.tolerance) {
                stats.converged = true;
                stats.convergence_reason = "log-likelihood gain below tolerance";
                break;
            }
        }

        if (!stats.converged) {
            stats.convergence_reason = "maximum iterations reached";
        }

        if (!model->is_valid()) {
            throw FitFailure("trained parameters are degenerate");
        }

        if (config_.verbose) {
            log_convergence_info(stats);
        }

        return model;
    }

    void GaussianHmmTrainer::initialize_parameters(GaussianHmm& model,
                                                   const Eigen::MatrixXd& observations,
                                                   std::uint32_t seed) const {
        const int N = model.num_states();
        const double frames = static_cast<double>(observations.rows());

        Eigen::RowVectorXd data_mean = observations.colwise().mean();
        Eigen::VectorXd data_variance =
            ((observations.rowwise() - data_mean).array().square().colwise().sum() / frames).matrix().transpose();
        data_variance.array() += config_.min_covariance;

        Eigen::MatrixXd centroids = kmeans_centroids(observations, N, seed);
        for (int j = 0; j < N; ++j) {
            model.set_state(j, DiagonalGaussian(centroids.row(j).transpose(), data_variance));
        }

        model.set_start_probabilities(Eigen::VectorXd::Constant(N, 1.0 / N));
        model.set_transition_matrix(Eigen::MatrixXd::Constant(N, N, 1.0 / N));
    }

    Eigen::MatrixXd GaussianHmmTrainer::kmeans_centroids(const Eigen::MatrixXd& observations,
                                                         int num_clusters,
                                                         std::uint32_t seed) const {
        const int T = static_cast<int>(observations.rows());

        std::vector<int> order(T);
        std::iota(order.begin(), order.end(), 0);
        std::mt19937 gen(seed);
        std::shuffle(order.begin(), order.end(), gen);

        Eigen::MatrixXd centroids(num_clusters, observations.cols());
        for (int k = 0; k < num_clusters; ++k) {
            centroids.row(k) = observations.row(order[k]);
        }

        std::vector<int> assignment(T, -1);
        for (int iteration = 0; iteration < config_.kmeans_iterations; ++iteration) {
            bool changed = false;

            for (int t = 0; t < T; ++t) {
                Eigen::Index nearest = 0;
                (centroids.rowwise() - observations.row(t)).rowwise().squaredNorm().minCoeff(&nearest);
                if (assignment[t] != static_cast<int>(nearest)) {
                    assignment[t] = static_cast<int>(nearest);
                    changed = true;
                }
            }

            if (!changed) {
                break;
            }

            Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(num_clusters, observations.cols());
            std::vector<int> counts(num_clusters, 0);
            for (int t = 0; t < T; ++t) {
                sums.row(assignment[t]) += observations.row(t);
                counts[assignment[t]]++;
            }

            // Empty clusters keep their previous centroid
            for (int k = 0; k < num_clusters; ++k) {
                if (counts[k] > 0) {
                    centroids.row(k) = sums.row(k) / static_cast<double>(counts[k]);
                }
            }
        }

        return centroids;
    }

    double GaussianHmmTrainer::em_expectation_step(const GaussianHmm& model,
                                                   const std::vector<Eigen::MatrixXd>& sequences,
                                                   std::vector<ForwardBackwardResult>& fb_results) const {
        fb_results.clear();
        fb_results.reserve(sequences.size());

        double total_log_likelihood = 0.0;
        for (const auto& sequence : sequences) {
            fb_results.push_back(model.forward_backward(sequence));
            total_log_likelihood += fb_results.back().log_likelihood;
        }

        return total_log_likelihood;
    }

    void GaussianHmmTrainer::em_maximization_step(GaussianHmm& model,
                                                  const std::vector<Eigen::MatrixXd>& sequences,
                                                  const std::vector<ForwardBackwardResult>& fb_results) const {
        const int N = model.num_states();
        const int F = model.num_features();

        Eigen::VectorXd start_counts = Eigen::VectorXd::Zero(N);
        Eigen::MatrixXd transition_counts = Eigen::MatrixXd::Zero(N, N);
        Eigen::VectorXd occupancy = Eigen::VectorXd::Zero(N);
        Eigen::MatrixXd weighted_sum = Eigen::MatrixXd::Zero(N, F);
        Eigen::MatrixXd weighted_square_sum = Eigen::MatrixXd::Zero(N, F);

        for (size_t s = 0; s < sequences.size(); ++s) {
            const Eigen::MatrixXd& X = sequences[s];
            const ForwardBackwardResult& fb = fb_results[s];

            start_counts += fb.gamma.row(0).transpose();
            transition_counts += fb.xi_sum;
            occupancy += fb.gamma.colwise().sum().transpose();
            weighted_sum += fb.gamma.transpose() * X;
            weighted_square_sum += fb.gamma.transpose() * X.array().square().matrix();
        }

        // Start probabilities
        if (start_counts.sum() > 0.0) {
            model.set_start_probabilities(start_counts / start_counts.sum());
        }

        // Transition probabilities; rows without evidence keep their values
        Eigen::MatrixXd transitions = model.transition_matrix();
        for (int i = 0; i < N; ++i) {
            double row_total = transition_counts.row(i).sum();
            if (row_total > 0.0) {
                transitions.row(i) = transition_counts.row(i) / row_total;
            }
        }
        model.set_transition_matrix(transitions);

        // Emission parameters
        for (int j = 0; j < N; ++j) {
            if (occupancy[j] <= 1e-10) {
                continue;
            }
            Eigen::VectorXd mean = weighted_sum.row(j).transpose() / occupancy[j];
            Eigen::VectorXd second_moment = weighted_square_sum.row(j).transpose() / occupancy[j];
            Eigen::VectorXd variances = (second_moment - mean.cwiseProduct(mean)).cwiseMax(0.0);
            variances.array() += config_.min_covariance;

            model.set_state(j, DiagonalGaussian(mean, variances));
        }
    }

    void GaussianHmmTrainer::log_iteration_info(int iteration, const TrainingStats& stats) const {
        SIGNRECOG_LOG_DEBUG_F("EM iteration %d, log-likelihood: %.4f",
                              iteration + 1, stats.log_likelihoods.back());
    }

    void GaussianHmmTrainer::log_convergence_info(const TrainingStats& stats) const {
        SIGNRECOG_LOG_DEBUG_F("Training completed after %d iterations (%s), final log-likelihood: %.4f",
                              stats.final_iteration, stats.convergence_reason.c_str(),
                              stats.final_log_likelihood);
    }

} // namespace hmm
} // namespace signrecog
