#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

struct LinearOptions {
    std::vector<double> variances{1.0};
    bool ard{false};
};

// X diag(sigma^2) X2^T, with one variance per dimension under ARD.
class Linear : public Kernel {
public:
    explicit Linear(std::size_t input_dim,
                    const LinearOptions& options = {},
                    std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Linear"; }

    [[nodiscard]] const Parameter& variance() const noexcept { return variance_; }

    [[nodiscard]] Parameter& variance() noexcept { return variance_; }

    [[nodiscard]] bool ard() const noexcept { return ard_; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

private:
    bool ard_;
    Parameter variance_;
};

struct PolynomialOptions {
    double degree{3.0};
    double offset{1.0};
    std::vector<double> variances{1.0};
    bool ard{false};
};

// (X diag(sigma^2) X2^T + offset)^degree. The degree is fixed at construction.
class Polynomial final : public Linear {
public:
    explicit Polynomial(std::size_t input_dim,
                        const PolynomialOptions& options = {},
                        std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Polynomial"; }

    [[nodiscard]] double degree() const noexcept { return degree_; }

    [[nodiscard]] const Parameter& offset() const noexcept { return offset_; }

    [[nodiscard]] Parameter& offset() noexcept { return offset_; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

private:
    double degree_;
    Parameter offset_;
};

}  // namespace libgpcov
