#pragma once

#include "gaussian_hmm.h"
#include "sequence_model.h"
#include <vector>
#include <memory>
#include <string>
#include <limits>
#include <Eigen/Core>

namespace signrecog {
namespace hmm {

    /**
     * @brief Baum-Welch settings that stay fixed across candidate fits
     *
     * The iteration cap and seed come from the HmmTopology of each fit.
     */
    struct TrainingConfig {
        double tolerance;               // Minimum log-likelihood gain per iteration
        double min_covariance;          // Variance floor added after each update
        int kmeans_iterations;          // Iterations of k-means initialization
        bool verbose;                   // Log every EM iteration

        TrainingConfig()
            : tolerance(1e-2)
            , min_covariance(1e-3)
            , kmeans_iterations(100)
            , verbose(false) {}
    };

    /**
     * @brief Training statistics and convergence information
     */
    struct TrainingStats {
        std::vector<double> log_likelihoods;     // Total log-likelihood per iteration
        int final_iteration;                     // Iterations executed
        bool converged;                          // Stopped on tolerance
        double final_log_likelihood;
        std::string convergence_reason;

        TrainingStats()
            : final_iteration(0)
            , converged(false)
            , final_log_likelihood(-std::numeric_limits<double>::infinity()) {}
    };

    /**
     * @brief Fits ergodic diagonal-covariance Gaussian HMMs with Baum-Welch
     *
     * Means are initialized by seeded k-means, variances from the pooled data
     * variance, start and transition probabilities uniformly. Stateless
     * between calls, so one instance may be shared by concurrent selectors.
     */
    class GaussianHmmTrainer : public SequenceModelTrainer {
    public:
        explicit GaussianHmmTrainer(const TrainingConfig& config = TrainingConfig());

        std::unique_ptr<SequenceModel> fit(const HmmTopology& topology,
                                           const Eigen::MatrixXd& observations,
                                           const std::vector<int>& lengths) const override;

        /**
         * @brief Fit and report per-iteration statistics
         * @throws FitFailure on invalid input or non-finite parameters
         */
        std::unique_ptr<GaussianHmm> train(const HmmTopology& topology,
                                           const Eigen::MatrixXd& observations,
                                           const std::vector<int>& lengths,
                                           TrainingStats& stats) const;

    private:
        TrainingConfig config_;

        void initialize_parameters(GaussianHmm& model,
                                   const Eigen::MatrixXd& observations,
                                   std::uint32_t seed) const;

        Eigen::MatrixXd kmeans_centroids(const Eigen::MatrixXd& observations,
                                         int num_clusters,
                                         std::uint32_t seed) const;

        // EM algorithm core methods
        double em_expectation_step(const GaussianHmm& model,
                                   const std::vector<Eigen::MatrixXd>& sequences,
                                   std::vector<ForwardBackwardResult>& fb_results) const;

        void em_maximization_step(GaussianHmm& model,
                                  const std::vector<Eigen::MatrixXd>& sequences,
                                  const std::vector<ForwardBackwardResult>& fb_results) const;

        void log_iteration_info(int iteration, const TrainingStats& stats) const;
        void log_convergence_info(const TrainingStats& stats) const;
    };

} // namespace hmm
} // namespace signrecog
