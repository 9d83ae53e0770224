#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

struct ArcCosineOptions {
    int order{0};
    double variance{1.0};
    std::vector<double> weight_variances{1.0};
    double bias_variance{1.0};
    bool ard{false};
};

/**
 * Arc-cosine kernel of Cho and Saul, the covariance of an infinitely wide
 * single-layer network with step (order 0), ramp (order 1) or quarter-pipe
 * (order 2) activations.
 *
 * With the weighted inner product <x, x'>_w = sum_i w_i x_i x'_i + b:
 *   K = sigma^2 / pi J_n(theta) ||x||_w^n ||x'||_w^n,
 *   cos(theta) = <x, x'>_w / (||x||_w ||x'||_w).
 * theta is computed from a slightly shrunk cosine so that acos stays finite
 * under differentiation.
 */
class ArcCosine final : public Kernel {
public:
    explicit ArcCosine(std::size_t input_dim,
                       const ArcCosineOptions& options = {},
                       std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "ArcCosine"; }

    [[nodiscard]] int order() const noexcept { return order_; }

    [[nodiscard]] const Parameter& variance() const noexcept { return variance_; }

    [[nodiscard]] Parameter& variance() noexcept { return variance_; }

    [[nodiscard]] const Parameter& weight_variances() const noexcept { return weight_variances_; }

    [[nodiscard]] Parameter& weight_variances() noexcept { return weight_variances_; }

    [[nodiscard]] const Parameter& bias_variance() const noexcept { return bias_variance_; }

    [[nodiscard]] Parameter& bias_variance() noexcept { return bias_variance_; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

private:
    [[nodiscard]] Eigen::VectorXd weighted_norms(const Eigen::MatrixXd& X) const;

    int order_;
    Parameter variance_;
    Parameter weight_variances_;
    Parameter bias_variance_;
};

}  // namespace libgpcov
