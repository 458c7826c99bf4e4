#pragma once

#include <Eigen/Core>

namespace signrecog {
namespace hmm {

    /**
     * @brief Gaussian density with diagonal covariance
     *
     * Emission distribution of one hidden state. The log normalization
     * constant and inverse variances are cached and computed once at
     * construction.
     */
    class DiagonalGaussian {
    public:
        DiagonalGaussian();
        explicit DiagonalGaussian(int dimension);
        DiagonalGaussian(const Eigen::VectorXd& mean, const Eigen::VectorXd& variances);

        const Eigen::VectorXd& mean() const { return mean_; }
        const Eigen::VectorXd& variances() const { return variances_; }
        int dimension() const { return static_cast<int>(mean_.size()); }

        double log_pdf(const Eigen::VectorXd& observation) const;

        /// Log density of every row of a frames x features matrix
        Eigen::VectorXd log_pdf_rows(const Eigen::MatrixXd& observations) const;

        bool is_valid() const;

    private:
        Eigen::VectorXd mean_;
        Eigen::VectorXd variances_;

        Eigen::VectorXd inv_variances_;
        double log_normalization_;      // -0.5 * (k*log(2pi) + sum(log var))

        void update_cache();
    };

} // namespace hmm
} // namespace signrecog
