#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

// Kernels whose value does not depend on the input coordinates.
class Static : public Kernel {
public:
    [[nodiscard]] const Parameter& variance() const noexcept { return variance_; }

    [[nodiscard]] Parameter& variance() noexcept { return variance_; }

protected:
    Static(std::size_t input_dim, double variance, std::optional<ActiveDims> active_dims);

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

private:
    Parameter variance_;
};

// sigma^2 I on the symmetric form and zero between distinct input sets.
class White final : public Static {
public:
    explicit White(std::size_t input_dim, double variance = 1.0, std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "White"; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;
};

class Constant : public Static {
public:
    explicit Constant(std::size_t input_dim,
                      double variance = 1.0,
                      std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Constant"; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;
};

class Bias final : public Constant {
public:
    using Constant::Constant;

    [[nodiscard]] std::string type_name() const override { return "Bias"; }
};

}  // namespace libgpcov
