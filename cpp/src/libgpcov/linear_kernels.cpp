#include "libgpcov/linear_kernels.hpp"

#include <cmath>
#include <utility>

#include "libgpcov/errors.hpp"

namespace libgpcov {

Linear::Linear(std::size_t input_dim, const LinearOptions& options, std::optional<ActiveDims> active_dims)
    : Kernel(input_dim, std::move(active_dims)),
      ard_(options.ard),
      variance_("variance", ard_initial_value(options.variances, options.ard, input_dim, "variance")) {
    register_parameter(variance_);
}

Eigen::MatrixXd Linear::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const Eigen::VectorXd sigma2 = per_dimension(variance_).matrix();
    const Eigen::MatrixXd& Z = X2 == nullptr ? X : *X2;
    return X * sigma2.asDiagonal() * Z.transpose();
}

Eigen::VectorXd Linear::compute_Kdiag(const Eigen::MatrixXd& X) const {
    const Eigen::VectorXd sigma2 = per_dimension(variance_).matrix();
    return X.array().square().matrix() * sigma2;
}

Dual Linear::compute_pair(const DualVector& x, const DualVector& z) const {
    const Eigen::ArrayXd sigma2 = per_dimension(variance_);
    Dual value = 0.0;
    for (Eigen::Index d = 0; d < x.size(); ++d) {
        value += sigma2(d) * x(d) * z(d);
    }
    return value;
}

Polynomial::Polynomial(std::size_t input_dim, const PolynomialOptions& options, std::optional<ActiveDims> active_dims)
    : Linear(input_dim, LinearOptions{options.variances, options.ard}, std::move(active_dims)),
      degree_(options.degree),
      offset_("offset", options.offset) {
    if (!std::isfinite(degree_)) {
        throw InvariantViolation("polynomial degree must be finite");
    }
    register_parameter(offset_);
}

Eigen::MatrixXd Polynomial::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    return (Linear::compute_K(X, X2).array() + offset_.scalar()).pow(degree_).matrix();
}

Eigen::VectorXd Polynomial::compute_Kdiag(const Eigen::MatrixXd& X) const {
    return (Linear::compute_Kdiag(X).array() + offset_.scalar()).pow(degree_).matrix();
}

Dual Polynomial::compute_pair(const DualVector& x, const DualVector& z) const {
    const Dual shifted = Linear::compute_pair(x, z) + offset_.scalar();
    return Dual(pow(shifted, degree_));
}

}  // namespace libgpcov
