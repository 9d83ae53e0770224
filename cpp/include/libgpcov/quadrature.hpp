#pragma once

#include <cstddef>
#include <functional>

#include <Eigen/Dense>

#include "libgpcov/types.hpp"

namespace libgpcov {

// One-dimensional Gauss-Hermite rule for the weight exp(-x^2).
struct GaussHermiteRule {
    Eigen::VectorXd nodes;
    Eigen::VectorXd weights;
};

// Tensor-product rule over d dimensions: H^d nodes (one per row) and the
// products of the one-dimensional weights.
struct GaussHermiteGrid {
    Eigen::MatrixXd nodes;
    Eigen::VectorXd weights;
};

// Evaluates an integrand at a batch of points (one per row) and returns one
// row of outputs per point.
using QuadratureIntegrand = std::function<Eigen::MatrixXd(const Eigen::MatrixXd& points)>;

// Largest tensor grid mvhermgauss will build (points^dim nodes).
inline constexpr std::size_t kMaxGaussHermiteGridSize = std::size_t{1} << 24;

[[nodiscard]] GaussHermiteRule hermgauss(std::size_t points);

[[nodiscard]] GaussHermiteGrid mvhermgauss(std::size_t points, std::size_t dim);

/**
 * Expectation of an integrand under independent Gaussians N(means[n], covs[n]).
 *
 * Each grid node xi is mapped to mean + sqrt(2) L xi with L the Cholesky factor of
 * the covariance, the integrand is evaluated on all H^d mapped nodes of a row at
 * once, and the outputs are combined with the grid weights scaled by pi^(-d/2).
 *
 * @param integrand Batch evaluator returning (H^d x output_size).
 * @param means N x d means.
 * @param covs N covariances, each d x d and positive definite.
 * @param points Gauss-Hermite points per dimension (H).
 * @param output_size Number of integrand outputs per point.
 * @return N x output_size expectations.
 */
[[nodiscard]] Eigen::MatrixXd mvnquad(const QuadratureIntegrand& integrand,
                                      const Eigen::MatrixXd& means,
                                      const CovarianceBatch& covs,
                                      std::size_t points,
                                      Eigen::Index output_size);

}  // namespace libgpcov
