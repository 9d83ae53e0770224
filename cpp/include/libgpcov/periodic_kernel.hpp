#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

struct PeriodicOptions {
    double variance{1.0};
    double lengthscales{1.0};
    double period{1.0};
};

// sigma^2 exp(-1/2 sum_d (sin(pi (x_d - x'_d) / p) / l)^2). Lengthscale and
// period are shared by all dimensions.
class Periodic final : public Kernel {
public:
    explicit Periodic(std::size_t input_dim,
                      const PeriodicOptions& options = {},
                      std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Periodic"; }

    [[nodiscard]] const Parameter& variance() const noexcept { return variance_; }

    [[nodiscard]] Parameter& variance() noexcept { return variance_; }

    [[nodiscard]] const Parameter& lengthscales() const noexcept { return lengthscales_; }

    [[nodiscard]] Parameter& lengthscales() noexcept { return lengthscales_; }

    [[nodiscard]] const Parameter& period() const noexcept { return period_; }

    [[nodiscard]] Parameter& period() noexcept { return period_; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

private:
    Parameter variance_;
    Parameter lengthscales_;
    Parameter period_;
};

}  // namespace libgpcov
