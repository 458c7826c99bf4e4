#include "signrecog/diagonal_gaussian.h"
#include <stdexcept>
#include <cmath>

namespace signrecog {
namespace hmm {

DiagonalGaussian::DiagonalGaussian()
    : DiagonalGaussian(1) {
}

DiagonalGaussian::DiagonalGaussian(int dimension)
    : mean_(Eigen::VectorXd::Zero(dimension))
    , variances_(Eigen::VectorXd::Ones(dimension))
    , log_normalization_(0.0) {
    update_cache();
}

DiagonalGaussian::DiagonalGaussian(const Eigen::VectorXd& mean, const Eigen::VectorXd& variances)
    : mean_(mean), variances_(variances), log_normalization_(0.0) {
    if (mean.size() != variances.size()) {
        throw std::invalid_argument("Dimension mismatch between mean and variances");
    }
    update_cache();
}

double DiagonalGaussian::log_pdf(const Eigen::VectorXd& observation) const {
    if (observation.size() != dimension()) {
        throw std::invalid_argument("Observation dimension mismatch");
    }

    Eigen::ArrayXd diff = (observation - mean_).array();
    double mahal_dist = (diff.square() * inv_variances_.array()).sum();
    return log_normalization_ - 0.5 * mahal_dist;
}

Eigen::VectorXd DiagonalGaussian::log_pdf_rows(const Eigen::MatrixXd& observations) const {
    if (observations.cols() != dimension()) {
        throw std::invalid_argument("Observation dimension mismatch");
    }

    Eigen::MatrixXd diff = observations.rowwise() - mean_.transpose();
    Eigen::VectorXd mahal_dist = diff.array().square().matrix() * inv_variances_;
    return (log_normalization_ - 0.5 * mahal_dist.array()).matrix();
}

bool DiagonalGaussian::is_valid() const {
    if (!mean_.allFinite() || !variances_.allFinite()) {
        return false;
    }
    return (variances_.array() > 0.0).all();
}

void DiagonalGaussian::update_cache() {
    inv_variances_ = variances_.cwiseInverse();

    double k = static_cast<double>(dimension());
    double log_det = variances_.array().log().sum();
    log_normalization_ = -0.5 * (k * std::log(2.0 * M_PI) + log_det);
}

} // namespace hmm
} // namespace signrecog
