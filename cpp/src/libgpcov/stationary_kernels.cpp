#include "libgpcov/stationary_kernels.hpp"

#include <cmath>
#include <utility>

namespace libgpcov {

namespace {

constexpr double kDistanceJitter = 1e-12;

// The profiles below are written once for both evaluation paths: Eigen arrays
// for whole matrices and autodiff duals for single pairs. Unqualified math
// calls resolve to Eigen's array functions or autodiff's overloads.

template <typename T>
T distance(const T& r2) {
    using std::sqrt;
    return T(sqrt(r2 + kDistanceJitter));
}

template <typename T>
T rbf_profile(const T& r2) {
    using std::exp;
    return T(exp(-0.5 * r2));
}

template <typename T>
T exponential_profile(const T& r2) {
    using std::exp;
    const T r = distance(r2);
    return T(exp(-0.5 * r));
}

template <typename T>
T matern12_profile(const T& r2) {
    using std::exp;
    const T r = distance(r2);
    return T(exp(-r));
}

template <typename T>
T matern32_profile(const T& r2) {
    using std::exp;
    const T sr = std::sqrt(3.0) * distance(r2);
    return T((1.0 + sr) * exp(-sr));
}

template <typename T>
T matern52_profile(const T& r2) {
    using std::exp;
    const T r = distance(r2);
    const T sr = std::sqrt(5.0) * r;
    const T polynomial = 1.0 + sr + (5.0 / 3.0) * (r * r);
    return T(polynomial * exp(-sr));
}

template <typename T>
T cosine_profile(const T& r2) {
    using std::cos;
    const T r = distance(r2);
    return T(cos(r));
}

}  // namespace

Stationary::Stationary(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims)
    : Kernel(input_dim, std::move(active_dims)),
      ard_(options.ard),
      variance_("variance", options.variance),
      lengthscales_("lengthscales", ard_initial_value(options.lengthscales, options.ard, input_dim, "lengthscales")) {
    register_parameter(variance_);
    register_parameter(lengthscales_);
}

Eigen::MatrixXd Stationary::square_dist(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const Eigen::VectorXd inverse_scale = per_dimension(lengthscales_).inverse().matrix();
    const Eigen::MatrixXd Xs = X * inverse_scale.asDiagonal();
    const Eigen::MatrixXd Zs = X2 == nullptr ? Xs : Eigen::MatrixXd(*X2 * inverse_scale.asDiagonal());

    Eigen::MatrixXd dist = -2.0 * Xs * Zs.transpose();
    dist.colwise() += Xs.rowwise().squaredNorm();
    dist.rowwise() += Zs.rowwise().squaredNorm().transpose();
    return dist.cwiseMax(0.0);
}

Eigen::MatrixXd Stationary::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const Eigen::ArrayXXd r2 = square_dist(X, X2).array();
    return variance_.scalar() * profile(r2).matrix();
}

Eigen::VectorXd Stationary::compute_Kdiag(const Eigen::MatrixXd& X) const {
    return Eigen::VectorXd::Constant(X.rows(), variance_.scalar());
}

Dual Stationary::compute_pair(const DualVector& x, const DualVector& z) const {
    const Eigen::ArrayXd scale = per_dimension(lengthscales_);
    Dual r2 = 0.0;
    for (Eigen::Index d = 0; d < x.size(); ++d) {
        const Dual diff = (x(d) - z(d)) / scale(d);
        r2 += diff * diff;
    }
    return Dual(variance_.scalar() * profile(r2));
}

RBF::RBF(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims)
    : Stationary(input_dim, options, std::move(active_dims)) {}

Eigen::ArrayXXd RBF::profile(const Eigen::ArrayXXd& r2) const {
    return rbf_profile(r2);
}

Dual RBF::profile(const Dual& r2) const {
    return rbf_profile(r2);
}

Exponential::Exponential(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims)
    : Stationary(input_dim, options, std::move(active_dims)) {}

Eigen::ArrayXXd Exponential::profile(const Eigen::ArrayXXd& r2) const {
    return exponential_profile(r2);
}

Dual Exponential::profile(const Dual& r2) const {
    return exponential_profile(r2);
}

Matern12::Matern12(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims)
    : Stationary(input_dim, options, std::move(active_dims)) {}

Eigen::ArrayXXd Matern12::profile(const Eigen::ArrayXXd& r2) const {
    return matern12_profile(r2);
}

Dual Matern12::profile(const Dual& r2) const {
    return matern12_profile(r2);
}

Matern32::Matern32(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims)
    : Stationary(input_dim, options, std::move(active_dims)) {}

Eigen::ArrayXXd Matern32::profile(const Eigen::ArrayXXd& r2) const {
    return matern32_profile(r2);
}

Dual Matern32::profile(const Dual& r2) const {
    return matern32_profile(r2);
}

Matern52::Matern52(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims)
    : Stationary(input_dim, options, std::move(active_dims)) {}

Eigen::ArrayXXd Matern52::profile(const Eigen::ArrayXXd& r2) const {
    return matern52_profile(r2);
}

Dual Matern52::profile(const Dual& r2) const {
    return matern52_profile(r2);
}

Cosine::Cosine(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims)
    : Stationary(input_dim, options, std::move(active_dims)) {}

Eigen::ArrayXXd Cosine::profile(const Eigen::ArrayXXd& r2) const {
    return cosine_profile(r2);
}

Dual Cosine::profile(const Dual& r2) const {
    return cosine_profile(r2);
}

}  // namespace libgpcov
