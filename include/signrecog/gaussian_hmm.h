#pragma once

#include <vector>
#include <limits>
#include <Eigen/Core>
#include "diagonal_gaussian.h"
#include "sequence_model.h"

namespace signrecog {
namespace hmm {

    /**
     * @brief Forward-Backward matrices for one observation sequence
     *
     * All probabilities are kept in the log domain except the posteriors.
     */
    struct ForwardBackwardResult {
        Eigen::MatrixXd log_forward;            // [T x N]
        Eigen::MatrixXd log_backward;           // [T x N]
        Eigen::MatrixXd gamma;                  // State posteriors [T x N]
        Eigen::MatrixXd xi_sum;                 // Expected transition counts [N x N]
        double log_likelihood;

        ForwardBackwardResult() : log_likelihood(-std::numeric_limits<double>::infinity()) {}
    };

    /**
     * @brief Ergodic hidden Markov model with diagonal Gaussian emissions
     *
     * Every state may transition to every other state. Scoring sums the
     * forward-algorithm log-likelihood of each component sequence.
     */
    class GaussianHmm : public SequenceModel {
    public:
        GaussianHmm(int num_states, int num_features);

        int num_states() const override { return static_cast<int>(states_.size()); }
        int num_features() const override { return num_features_; }

        double score(const Eigen::MatrixXd& observations,
                     const std::vector<int>& lengths) const override;

        // Parameter access
        const Eigen::VectorXd& start_probabilities() const { return start_probs_; }
        const Eigen::MatrixXd& transition_matrix() const { return transitions_; }
        const std::vector<DiagonalGaussian>& states() const { return states_; }
        const DiagonalGaussian& state(int index) const;

        void set_start_probabilities(const Eigen::VectorXd& probabilities);
        void set_transition_matrix(const Eigen::MatrixXd& transitions);
        void set_state(int index, const DiagonalGaussian& emission);

        /// Emission log-likelihood of every frame under every state [T x N]
        Eigen::MatrixXd emission_log_likelihoods(const Eigen::MatrixXd& sequence) const;

        ForwardBackwardResult forward_backward(const Eigen::MatrixXd& sequence) const;

        bool is_valid() const;

    private:
        int num_features_;
        Eigen::VectorXd start_probs_;
        Eigen::MatrixXd transitions_;
        std::vector<DiagonalGaussian> states_;

        // Cached log-domain parameters
        Eigen::VectorXd log_start_probs_;
        Eigen::MatrixXd log_transitions_;

        double forward_log_likelihood(const Eigen::MatrixXd& sequence) const;
    };

    /// Numerically stable log(sum(exp(values)))
    double log_sum_exp(const Eigen::VectorXd& log_values);

    /// True when every length is positive and they sum to the row count
    bool lengths_match(const Eigen::MatrixXd& observations, const std::vector<int>& lengths);

} // namespace hmm
} // namespace signrecog
