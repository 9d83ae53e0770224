#include "libgpcov/quadrature.hpp"

#include "libgpcov/errors.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>

namespace libgpcov {

GaussHermiteRule hermgauss(std::size_t points) {
    if (points == 0) {
        throw ConfigurationError("Gauss-Hermite rule requires at least one point");
    }
    const auto n = static_cast<Eigen::Index>(points);

    // Golub-Welsch: nodes are the eigenvalues of the symmetric Jacobi matrix of the
    // Hermite recurrence, weights come from the first eigenvector components.
    Eigen::MatrixXd jacobi = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 1; i < n; ++i) {
        const double off_diagonal = std::sqrt(static_cast<double>(i) / 2.0);
        jacobi(i, i - 1) = off_diagonal;
        jacobi(i - 1, i) = off_diagonal;
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(jacobi);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("Gauss-Hermite eigen-decomposition failed for " + std::to_string(points) +
                                 " points");
    }

    GaussHermiteRule rule;
    rule.nodes = solver.eigenvalues();
    const double mass = std::sqrt(std::numbers::pi);
    rule.weights = (mass * solver.eigenvectors().row(0).transpose().array().square()).matrix();
    return rule;
}

GaussHermiteGrid mvhermgauss(std::size_t points, std::size_t dim) {
    const GaussHermiteRule rule = hermgauss(points);

    std::size_t grid_size = 1;
    for (std::size_t k = 0; k < dim; ++k) {
        if (grid_size > kMaxGaussHermiteGridSize / points) {
            throw ConfigurationError("Gauss-Hermite grid with " + std::to_string(points) + " points in " +
                                     std::to_string(dim) + " dimensions exceeds " +
                                     std::to_string(kMaxGaussHermiteGridSize) + " nodes");
        }
        grid_size *= points;
    }
    const auto h = static_cast<Eigen::Index>(points);
    const auto d = static_cast<Eigen::Index>(dim);
    const auto total = static_cast<Eigen::Index>(grid_size);

    GaussHermiteGrid grid;
    grid.nodes.resize(total, d);
    grid.weights.resize(total);
    // Row-major enumeration: the last dimension varies fastest.
    for (Eigen::Index row = 0; row < total; ++row) {
        Eigen::Index remainder = row;
        double weight = 1.0;
        for (Eigen::Index k = d - 1; k >= 0; --k) {
            const Eigen::Index idx = remainder % h;
            remainder /= h;
            grid.nodes(row, k) = rule.nodes(idx);
            weight *= rule.weights(idx);
        }
        grid.weights(row) = weight;
    }
    return grid;
}

Eigen::MatrixXd mvnquad(const QuadratureIntegrand& integrand,
                        const Eigen::MatrixXd& means,
                        const CovarianceBatch& covs,
                        std::size_t points,
                        Eigen::Index output_size) {
    if (static_cast<std::size_t>(means.rows()) != covs.size()) {
        throw ShapeError("quadrature received " + std::to_string(means.rows()) + " means but " +
                         std::to_string(covs.size()) + " covariances");
    }
    const Eigen::Index d = means.cols();
    const GaussHermiteGrid grid = mvhermgauss(points, static_cast<std::size_t>(d));
    const Eigen::VectorXd weights = grid.weights * std::pow(std::numbers::pi, -0.5 * static_cast<double>(d));

    Eigen::MatrixXd result(means.rows(), output_size);
    for (Eigen::Index n = 0; n < means.rows(); ++n) {
        const Eigen::MatrixXd& cov = covs[static_cast<std::size_t>(n)];
        if (cov.rows() != d || cov.cols() != d) {
            throw ShapeError("covariance " + std::to_string(n) + " is " + std::to_string(cov.rows()) + "x" +
                             std::to_string(cov.cols()) + ", expected " + std::to_string(d) + "x" +
                             std::to_string(d));
        }
        Eigen::LLT<Eigen::MatrixXd> llt(cov);
        if (llt.info() != Eigen::Success) {
            throw ShapeError("covariance " + std::to_string(n) + " is not positive definite");
        }
        const Eigen::MatrixXd lower = llt.matrixL();

        Eigen::MatrixXd mapped = std::sqrt(2.0) * grid.nodes * lower.transpose();
        mapped.rowwise() += means.row(n);

        const Eigen::MatrixXd values = integrand(mapped);
        if (values.rows() != grid.nodes.rows() || values.cols() != output_size) {
            throw ShapeError("quadrature integrand returned " + std::to_string(values.rows()) + "x" +
                             std::to_string(values.cols()) + ", expected " + std::to_string(grid.nodes.rows()) +
                             "x" + std::to_string(output_size));
        }
        result.row(n) = weights.transpose() * values;
    }
    return result;
}

}  // namespace libgpcov
