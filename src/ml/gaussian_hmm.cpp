#include "signrecog/gaussian_hmm.h"
#include "signrecog/errors.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace signrecog {
namespace hmm {

    namespace {
        constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

        Eigen::MatrixXd safe_log(const Eigen::MatrixXd& values) {
            return values.unaryExpr([](double v) { return v > 0.0 ? std::log(v) : NEG_INF; });
        }
    }

    double log_sum_exp(const Eigen::VectorXd& log_values) {
        if (log_values.size() == 0) {
            return NEG_INF;
        }

        double max_val = log_values.maxCoeff();
        if (max_val == NEG_INF) {
            return max_val;
        }

        return max_val + std::log((log_values.array() - max_val).exp().sum());
    }

    bool lengths_match(const Eigen::MatrixXd& observations, const std::vector<int>& lengths) {
        long total = 0;
        for (int length : lengths) {
            if (length <= 0) {
                return false;
            }
            total += length;
        }
        return !lengths.empty() && total == observations.rows();
    }

    GaussianHmm::GaussianHmm(int num_states, int num_features)
        : num_features_(num_features) {
        if (num_states <= 0 || num_features <= 0) {
            throw std::invalid_argument("GaussianHmm requires positive state and feature counts");
        }

        states_.assign(num_states, DiagonalGaussian(num_features));
        set_start_probabilities(Eigen::VectorXd::Constant(num_states, 1.0 / num_states));
        set_transition_matrix(Eigen::MatrixXd::Constant(num_states, num_states, 1.0 / num_states));
    }

    const DiagonalGaussian& GaussianHmm::state(int index) const {
        if (index < 0 || index >= num_states()) {
            throw std::out_of_range("State index out of range");
        }
        return states_[index];
    }

    void GaussianHmm::set_start_probabilities(const Eigen::VectorXd& probabilities) {
        if (probabilities.size() != num_states()) {
            throw std::invalid_argument("Start probability size mismatch");
        }
        start_probs_ = probabilities;
        log_start_probs_ = safe_log(start_probs_);
    }

    void GaussianHmm::set_transition_matrix(const Eigen::MatrixXd& transitions) {
        if (transitions.rows() != num_states() || transitions.cols() != num_states()) {
            throw std::invalid_argument("Transition matrix size mismatch");
        }
        transitions_ = transitions;
        log_transitions_ = safe_log(transitions_);
    }

    void GaussianHmm::set_state(int index, const DiagonalGaussian& emission) {
        if (index < 0 || index >= num_states()) {
            throw std::out_of_range("State index out of range");
        }
        if (emission.dimension() != num_features_) {
            throw std::invalid_argument("Emission dimension mismatch");
        }
        states_[index] = emission;
    }

    double GaussianHmm::score(const Eigen::MatrixXd& observations,
                              const std::vector<int>& lengths) const {
        if (observations.cols() != num_features_) {
            throw ScoreFailure("expected " + std::to_string(num_features_) + " features, got " +
                               std::to_string(observations.cols()));
        }
        if (!lengths_match(observations, lengths)) {
            throw ScoreFailure("sequence lengths do not match observation rows");
        }

        double total = 0.0;
        int offset = 0;
        for (int length : lengths) {
            total += forward_log_likelihood(observations.middleRows(offset, length));
            offset += length;
        }

        if (std::isnan(total)) {
            throw ScoreFailure("log-likelihood is NaN");
        }
        return total;
    }

    Eigen::MatrixXd GaussianHmm::emission_log_likelihoods(const Eigen::MatrixXd& sequence) const {
        Eigen::MatrixXd log_b(sequence.rows(), num_states());
        for (int j = 0; j < num_states(); ++j) {
            log_b.col(j) = states_[j].log_pdf_rows(sequence);
        }
        return log_b;
    }

    double GaussianHmm::forward_log_likelihood(const Eigen::MatrixXd& sequence) const {
        const int T = static_cast<int>(sequence.rows());
        const int N = num_states();
        if (T == 0) {
            return 0.0;
        }

        Eigen::MatrixXd log_b = emission_log_likelihoods(sequence);
        Eigen::VectorXd alpha = log_start_probs_ + log_b.row(0).transpose();
        Eigen::VectorXd next(N);

        for (int t = 1; t < T; ++t) {
            for (int j = 0; j < N; ++j) {
                next[j] = log_sum_exp(alpha + log_transitions_.col(j)) + log_b(t, j);
            }
            alpha.swap(next);
        }

        return log_sum_exp(alpha);
    }

    ForwardBackwardResult GaussianHmm::forward_backward(const Eigen::MatrixXd& sequence) const {
        ForwardBackwardResult result;
        const int T = static_cast<int>(sequence.rows());
        const int N = num_states();

        result.xi_sum = Eigen::MatrixXd::Zero(N, N);
        if (T == 0) {
            return result;
        }

        Eigen::MatrixXd log_b = emission_log_likelihoods(sequence);
        result.log_forward = Eigen::MatrixXd::Constant(T, N, NEG_INF);
        result.log_backward = Eigen::MatrixXd::Zero(T, N);
        result.gamma = Eigen::MatrixXd::Zero(T, N);

        // Forward pass
        result.log_forward.row(0) = (log_start_probs_ + log_b.row(0).transpose()).transpose();
        for (int t = 1; t < T; ++t) {
            Eigen::VectorXd prev = result.log_forward.row(t - 1).transpose();
            for (int j = 0; j < N; ++j) {
                result.log_forward(t, j) = log_sum_exp(prev + log_transitions_.col(j)) + log_b(t, j);
            }
        }

        // Backward pass
        for (int t = T - 2; t >= 0; --t) {
            Eigen::VectorXd next = log_b.row(t + 1).transpose() + result.log_backward.row(t + 1).transpose();
            for (int i = 0; i < N; ++i) {
                result.log_backward(t, i) = log_sum_exp(log_transitions_.row(i).transpose() + next);
            }
        }

        result.log_likelihood = log_sum_exp(result.log_forward.row(T - 1).transpose());
        if (!std::isfinite(result.log_likelihood)) {
            return result;
        }

        // State posteriors
        result.gamma = ((result.log_forward + result.log_backward).array() - result.log_likelihood).exp().matrix();

        // Expected transition counts
        for (int t = 0; t < T - 1; ++t) {
            for (int i = 0; i < N; ++i) {
                if (result.log_forward(t, i) == NEG_INF) {
                    continue;
                }
                for (int j = 0; j < N; ++j) {
                    double log_xi = result.log_forward(t, i) + log_transitions_(i, j) +
                                    log_b(t + 1, j) + result.log_backward(t + 1, j) -
                                    result.log_likelihood;
                    result.xi_sum(i, j) += std::exp(log_xi);
                }
            }
        }

        return result;
    }

    bool GaussianHmm::is_valid() const {
        if (!start_probs_.allFinite() || !transitions_.allFinite()) {
            return false;
        }
        if (std::abs(start_probs_.sum() - 1.0) > 1e-6) {
            return false;
        }
        for (int i = 0; i < num_states(); ++i) {
            if (std::abs(transitions_.row(i).sum() - 1.0) > 1e-6) {
                return false;
            }
        }
        return std::all_of(states_.begin(), states_.end(),
                           [](const DiagonalGaussian& s) { return s.is_valid(); });
    }

} // namespace hmm
} // namespace signrecog
