#pragma once

#include <vector>

#include <Eigen/Dense>
#include <autodiff/forward/dual.hpp>
#include <autodiff/forward/dual/eigen.hpp>

namespace libgpcov {

// One D x D covariance per input row (an N x D x D tensor).
using CovarianceBatch = std::vector<Eigen::MatrixXd>;

// Forward-mode dual number carrying up to four nested directional derivatives:
// two partials on each side of a covariance k(x, z).
using Dual = autodiff::dual4th;
using DualVector = Eigen::Matrix<Dual, Eigen::Dynamic, 1>;

[[nodiscard]] inline DualVector to_dual(const Eigen::Ref<const Eigen::RowVectorXd>& row) {
    DualVector out(row.size());
    for (Eigen::Index i = 0; i < row.size(); ++i) {
        out(i) = row(i);
    }
    return out;
}

}  // namespace libgpcov
