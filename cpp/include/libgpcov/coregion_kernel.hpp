#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

// Low-rank coregionalisation over integer output categories stored in a single
// input column: K(x, x') = B[x, x'] with B = W W^T + diag(kappa).
class Coregion final : public Kernel {
public:
    Coregion(std::size_t input_dim,
             std::size_t output_dim,
             std::size_t rank,
             std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Coregion"; }

    [[nodiscard]] std::size_t output_dim() const noexcept { return output_dim_; }

    [[nodiscard]] std::size_t rank() const noexcept { return rank_; }

    [[nodiscard]] const Parameter& W() const noexcept { return W_; }

    [[nodiscard]] Parameter& W() noexcept { return W_; }

    [[nodiscard]] const Parameter& kappa() const noexcept { return kappa_; }

    [[nodiscard]] Parameter& kappa() noexcept { return kappa_; }

    [[nodiscard]] Eigen::MatrixXd B() const;

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

private:
    [[nodiscard]] std::vector<Eigen::Index> categories(const Eigen::MatrixXd& X) const;

    [[nodiscard]] Eigen::Index category(double value) const;

    std::size_t output_dim_;
    std::size_t rank_;
    Parameter W_;
    Parameter kappa_;
};

}  // namespace libgpcov
