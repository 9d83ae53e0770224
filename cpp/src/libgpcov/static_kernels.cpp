#include "libgpcov/static_kernels.hpp"

#include <utility>

namespace libgpcov {

Static::Static(std::size_t input_dim, double variance, std::optional<ActiveDims> active_dims)
    : Kernel(input_dim, std::move(active_dims)), variance_("variance", variance) {
    register_parameter(variance_);
}

Eigen::VectorXd Static::compute_Kdiag(const Eigen::MatrixXd& X) const {
    return Eigen::VectorXd::Constant(X.rows(), variance_.scalar());
}

White::White(std::size_t input_dim, double variance, std::optional<ActiveDims> active_dims)
    : Static(input_dim, variance, std::move(active_dims)) {}

Eigen::MatrixXd White::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    if (X2 == nullptr) {
        return variance().scalar() * Eigen::MatrixXd::Identity(X.rows(), X.rows());
    }
    return Eigen::MatrixXd::Zero(X.rows(), X2->rows());
}

Dual White::compute_pair(const DualVector& /*x*/, const DualVector& /*z*/) const {
    return Dual(0.0);
}

Constant::Constant(std::size_t input_dim, double variance, std::optional<ActiveDims> active_dims)
    : Static(input_dim, variance, std::move(active_dims)) {}

Eigen::MatrixXd Constant::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const Eigen::Index cols = X2 == nullptr ? X.rows() : X2->rows();
    return Eigen::MatrixXd::Constant(X.rows(), cols, variance().scalar());
}

Dual Constant::compute_pair(const DualVector& /*x*/, const DualVector& /*z*/) const {
    return Dual(variance().scalar());
}

}  // namespace libgpcov
