#include "libgpcov/coregion_kernel.hpp"

#include <string>
#include <utility>

#include "libgpcov/errors.hpp"

namespace libgpcov {

namespace {

[[nodiscard]] std::size_t checked_coregion_input_dim(std::size_t input_dim) {
    if (input_dim != 1) {
        throw InvariantViolation("coregion kernel needs input_dim == 1, got " + std::to_string(input_dim));
    }
    return input_dim;
}

[[nodiscard]] std::size_t checked_positive(std::size_t value, const char* what) {
    if (value == 0) {
        throw InvariantViolation(std::string("coregion ") + what + " must be positive");
    }
    return value;
}

}  // namespace

Coregion::Coregion(std::size_t input_dim, std::size_t output_dim, std::size_t rank, std::optional<ActiveDims> active_dims)
    : Kernel(checked_coregion_input_dim(input_dim), std::move(active_dims)),
      output_dim_(checked_positive(output_dim, "output_dim")),
      rank_(checked_positive(rank, "rank")),
      W_("W",
         Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(output_dim_), static_cast<Eigen::Index>(rank_)),
         ParameterConstraint::Free),
      kappa_("kappa", Eigen::MatrixXd::Ones(static_cast<Eigen::Index>(output_dim_), 1)) {
    register_parameter(W_);
    register_parameter(kappa_);
}

Eigen::MatrixXd Coregion::B() const {
    const Eigen::MatrixXd W = W_.value();
    Eigen::MatrixXd B = W * W.transpose();
    B.diagonal() += kappa_.vector();
    return B;
}

Eigen::Index Coregion::category(double value) const {
    const int index = static_cast<int>(value);
    if (index < 0 || static_cast<std::size_t>(index) >= output_dim_) {
        throw ShapeError("coregion category " + std::to_string(index) + " outside [0, " +
                         std::to_string(output_dim_) + ")");
    }
    return index;
}

std::vector<Eigen::Index> Coregion::categories(const Eigen::MatrixXd& X) const {
    std::vector<Eigen::Index> result;
    result.reserve(static_cast<std::size_t>(X.rows()));
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        result.push_back(category(X(i, 0)));
    }
    return result;
}

Eigen::MatrixXd Coregion::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const Eigen::MatrixXd full = B();
    const std::vector<Eigen::Index> rows = categories(X);
    const std::vector<Eigen::Index> cols = X2 == nullptr ? rows : categories(*X2);

    Eigen::MatrixXd K(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(cols.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t j = 0; j < cols.size(); ++j) {
            K(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = full(rows[i], cols[j]);
        }
    }
    return K;
}

Eigen::VectorXd Coregion::compute_Kdiag(const Eigen::MatrixXd& X) const {
    const Eigen::VectorXd diag = W_.value().array().square().rowwise().sum().matrix() + kappa_.vector();
    const std::vector<Eigen::Index> rows = categories(X);
    Eigen::VectorXd result(static_cast<Eigen::Index>(rows.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        result(static_cast<Eigen::Index>(i)) = diag(rows[i]);
    }
    return result;
}

// Categories are discrete, so the pairwise value carries no derivative.
Dual Coregion::compute_pair(const DualVector& x, const DualVector& z) const {
    const double left = autodiff::val(x(0));
    const double right = autodiff::val(z(0));
    return Dual(B()(category(left), category(right)));
}

}  // namespace libgpcov
