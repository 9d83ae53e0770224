#include "libgpcov/periodic_kernel.hpp"

#include <numbers>
#include <utility>

namespace libgpcov {

Periodic::Periodic(std::size_t input_dim, const PeriodicOptions& options, std::optional<ActiveDims> active_dims)
    : Kernel(input_dim, std::move(active_dims)),
      variance_("variance", options.variance),
      lengthscales_("lengthscales", options.lengthscales),
      period_("period", options.period) {
    register_parameter(variance_);
    register_parameter(lengthscales_);
    register_parameter(period_);
}

Eigen::MatrixXd Periodic::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const Eigen::MatrixXd& Z = X2 == nullptr ? X : *X2;
    const double frequency = std::numbers::pi / period_.scalar();
    const double lengthscale = lengthscales_.scalar();

    Eigen::ArrayXXd exponent = Eigen::ArrayXXd::Zero(X.rows(), Z.rows());
    for (Eigen::Index d = 0; d < X.cols(); ++d) {
        const Eigen::ArrayXXd diff =
            X.col(d).replicate(1, Z.rows()).array() - Z.col(d).transpose().replicate(X.rows(), 1).array();
        exponent += ((frequency * diff).sin() / lengthscale).square();
    }
    return variance_.scalar() * (-0.5 * exponent).exp().matrix();
}

Eigen::VectorXd Periodic::compute_Kdiag(const Eigen::MatrixXd& X) const {
    return Eigen::VectorXd::Constant(X.rows(), variance_.scalar());
}

Dual Periodic::compute_pair(const DualVector& x, const DualVector& z) const {
    const double frequency = std::numbers::pi / period_.scalar();
    const double lengthscale = lengthscales_.scalar();
    Dual exponent = 0.0;
    for (Eigen::Index d = 0; d < x.size(); ++d) {
        const Dual scaled = sin(frequency * (x(d) - z(d))) / lengthscale;
        exponent += scaled * scaled;
    }
    return Dual(variance_.scalar() * exp(-0.5 * exponent));
}

}  // namespace libgpcov
