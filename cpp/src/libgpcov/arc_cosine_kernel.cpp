#include "libgpcov/arc_cosine_kernel.hpp"

#include <cmath>
#include <numbers>
#include <string>
#include <utility>

#include "libgpcov/errors.hpp"

namespace libgpcov {

namespace {

constexpr double kAngleJitter = 1e-15;

[[nodiscard]] int checked_order(int order) {
    if (order < 0 || order > 2) {
        throw ConfigurationError("arc-cosine kernel order must be 0, 1 or 2, got " + std::to_string(order));
    }
    return order;
}

template <typename T>
T shrunk_angle(const T& cos_theta) {
    using std::acos;
    return T(acos(kAngleJitter + (1.0 - 2.0 * kAngleJitter) * cos_theta));
}

// Angular part J_n(theta), shared by the array and dual paths.
template <typename T>
T angular(int order, const T& theta) {
    using std::cos;
    using std::sin;
    const T rest = std::numbers::pi - theta;
    if (order == 0) {
        return rest;
    }
    const T s = sin(theta);
    const T c = cos(theta);
    if (order == 1) {
        return T(s + rest * c);
    }
    return T(3.0 * s * c + rest * (1.0 + 2.0 * c * c));
}

[[nodiscard]] double angular_at_zero(int order) {
    switch (order) {
        case 0:
        case 1:
            return std::numbers::pi;
        default:
            return 3.0 * std::numbers::pi;
    }
}

}  // namespace

ArcCosine::ArcCosine(std::size_t input_dim, const ArcCosineOptions& options, std::optional<ActiveDims> active_dims)
    : Kernel(input_dim, std::move(active_dims)),
      order_(checked_order(options.order)),
      variance_("variance", options.variance),
      weight_variances_("weight_variances",
                        ard_initial_value(options.weight_variances, options.ard, input_dim, "weight_variances")),
      bias_variance_("bias_variance", options.bias_variance) {
    register_parameter(variance_);
    register_parameter(weight_variances_);
    register_parameter(bias_variance_);
}

Eigen::VectorXd ArcCosine::weighted_norms(const Eigen::MatrixXd& X) const {
    const Eigen::VectorXd weights = per_dimension(weight_variances_).matrix();
    return ((X.array().square().matrix() * weights).array() + bias_variance_.scalar()).sqrt().matrix();
}

Eigen::MatrixXd ArcCosine::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const Eigen::MatrixXd& Z = X2 == nullptr ? X : *X2;
    const Eigen::VectorXd weights = per_dimension(weight_variances_).matrix();

    const Eigen::ArrayXXd inner = (X * weights.asDiagonal() * Z.transpose()).array() + bias_variance_.scalar();
    const Eigen::VectorXd x_norms = weighted_norms(X);
    const Eigen::VectorXd z_norms = X2 == nullptr ? x_norms : weighted_norms(Z);
    const Eigen::ArrayXXd norm_products = (x_norms * z_norms.transpose()).array();

    const Eigen::ArrayXXd cos_theta = inner / norm_products;
    const Eigen::ArrayXXd theta = shrunk_angle(cos_theta);
    const Eigen::ArrayXXd J = angular(order_, theta);
    const Eigen::ArrayXXd scale = norm_products.pow(static_cast<double>(order_));
    return (variance_.scalar() / std::numbers::pi * J * scale).matrix();
}

Eigen::VectorXd ArcCosine::compute_Kdiag(const Eigen::MatrixXd& X) const {
    const Eigen::VectorXd weights = per_dimension(weight_variances_).matrix();
    const Eigen::ArrayXd products = (X.array().square().matrix() * weights).array() + bias_variance_.scalar();
    const double factor = variance_.scalar() / std::numbers::pi * angular_at_zero(order_);
    return (factor * products.pow(static_cast<double>(order_))).matrix();
}

Dual ArcCosine::compute_pair(const DualVector& x, const DualVector& z) const {
    const Eigen::ArrayXd weights = per_dimension(weight_variances_);
    const double bias = bias_variance_.scalar();
    Dual xz = bias;
    Dual xx = bias;
    Dual zz = bias;
    for (Eigen::Index d = 0; d < x.size(); ++d) {
        xz += weights(d) * x(d) * z(d);
        xx += weights(d) * x(d) * x(d);
        zz += weights(d) * z(d) * z(d);
    }
    const Dual norm_product = sqrt(xx * zz);
    const Dual theta = shrunk_angle(Dual(xz / norm_product));
    const Dual J = angular(order_, theta);
    const double factor = variance_.scalar() / std::numbers::pi;
    if (order_ == 0) {
        return Dual(factor * J);
    }
    return Dual(factor * J * pow(norm_product, static_cast<double>(order_)));
}

}  // namespace libgpcov
