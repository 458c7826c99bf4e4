#pragma once

#include <memory>
#include <vector>
#include <cstdint>
#include <Eigen/Core>

namespace signrecog {

    /**
     * @brief Covariance structure of the per-state Gaussian emissions
     */
    enum class CovarianceType {
        DIAGONAL = 0
    };

    /**
     * @brief Hyperparameters requested for a single fit
     *
     * The hidden-state count is the quantity under selection; the rest is
     * held constant across all candidates of a selection run.
     */
    struct HmmTopology {
        int num_states;                 // Number of hidden states
        CovarianceType covariance_type; // Emission covariance structure
        int max_iterations;             // EM iteration cap
        std::uint32_t random_seed;      // Seed for parameter initialization

        HmmTopology()
            : num_states(3)
            , covariance_type(CovarianceType::DIAGONAL)
            , max_iterations(1000)
            , random_seed(14) {}

        HmmTopology(int states, int iterations, std::uint32_t seed)
            : num_states(states)
            , covariance_type(CovarianceType::DIAGONAL)
            , max_iterations(iterations)
            , random_seed(seed) {}
    };

    /**
     * @brief Trained statistical model over multivariate time series
     *
     * Observations are passed as one concatenated frames x features matrix
     * plus the frame count of each component sequence.
     */
    class SequenceModel {
    public:
        virtual ~SequenceModel() = default;

        virtual int num_states() const = 0;
        virtual int num_features() const = 0;

        /**
         * @brief Total log-likelihood of the given sequences
         * @throws ScoreFailure on dimensionality mismatch, invalid lengths or
         *         a degenerate model
         */
        virtual double score(const Eigen::MatrixXd& observations,
                             const std::vector<int>& lengths) const = 0;
    };

    /**
     * @brief Factory that fits a fresh SequenceModel to training data
     *
     * Implementations must be deterministic for a fixed topology (including
     * seed) and input, and must not keep state between fit() calls that
     * would make one fit depend on another.
     */
    class SequenceModelTrainer {
    public:
        virtual ~SequenceModelTrainer() = default;

        /**
         * @throws FitFailure when no model can be trained
         */
        virtual std::unique_ptr<SequenceModel> fit(const HmmTopology& topology,
                                                   const Eigen::MatrixXd& observations,
                                                   const std::vector<int>& lengths) const = 0;
    };

} // namespace signrecog
