#include "libgpcov/kernel.hpp"

#include "libgpcov/errors.hpp"
#include "libgpcov/numerics_settings.hpp"
#include "libgpcov/quadrature.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace libgpcov {

namespace {

[[nodiscard]] ActiveDims resolve_active_dims(std::size_t input_dim, std::optional<ActiveDims> active_dims) {
    if (input_dim == 0) {
        throw InvariantViolation("kernel input_dim must be positive");
    }
    if (!active_dims) {
        return ActiveDims::range(input_dim);
    }
    if (active_dims->size() != input_dim) {
        throw InvariantViolation("active dims " + active_dims->to_string() + " select " +
                                 std::to_string(active_dims->size()) + " columns but input_dim is " +
                                 std::to_string(input_dim));
    }
    return std::move(*active_dims);
}

void check_matching_rows(const Eigen::MatrixXd& Xmu, std::size_t cov_rows, const char* what) {
    if (static_cast<std::size_t>(Xmu.rows()) != cov_rows) {
        throw ShapeError(std::string(what) + ": Xmu has " + std::to_string(Xmu.rows()) + " rows but Xcov has " +
                         std::to_string(cov_rows));
    }
}

}  // namespace

Eigen::MatrixXd ard_initial_value(const std::vector<double>& values,
                                  bool ard,
                                  std::size_t input_dim,
                                  const std::string& what) {
    if (values.empty()) {
        throw InvariantViolation(what + " needs at least one value");
    }
    if (!ard) {
        if (values.size() != 1) {
            throw InvariantViolation(what + " without ARD takes a single value, got " +
                                     std::to_string(values.size()));
        }
        return Eigen::MatrixXd::Constant(1, 1, values.front());
    }
    if (values.size() == 1) {
        return Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(input_dim), 1, values.front());
    }
    if (values.size() != input_dim) {
        throw InvariantViolation(what + " has " + std::to_string(values.size()) + " values but input_dim is " +
                                 std::to_string(input_dim));
    }
    Eigen::MatrixXd value(static_cast<Eigen::Index>(input_dim), 1);
    for (std::size_t i = 0; i < input_dim; ++i) {
        value(static_cast<Eigen::Index>(i), 0) = values[i];
    }
    return value;
}

Kernel::Kernel(std::size_t input_dim, std::optional<ActiveDims> active_dims)
    : input_dim_(input_dim), active_dims_(resolve_active_dims(input_dim, std::move(active_dims))) {}

Eigen::MatrixXd Kernel::K(const Eigen::MatrixXd& X, bool presliced) const {
    if (presliced) {
        return compute_K(X, nullptr);
    }
    return compute_K(active_dims_.slice(X), nullptr);
}

Eigen::MatrixXd Kernel::K(const Eigen::MatrixXd& X, const Eigen::MatrixXd& X2, bool presliced) const {
    if (presliced) {
        return compute_K(X, &X2);
    }
    const Eigen::MatrixXd sliced_X2 = active_dims_.slice(X2);
    return compute_K(active_dims_.slice(X), &sliced_X2);
}

Eigen::VectorXd Kernel::Kdiag(const Eigen::MatrixXd& X, bool presliced) const {
    if (presliced) {
        return compute_Kdiag(X);
    }
    return compute_Kdiag(active_dims_.slice(X));
}

Dual Kernel::K_pair(const DualVector& x, const DualVector& z) const {
    return compute_pair(active_dims_.slice_row(x), active_dims_.slice_row(z));
}

std::vector<NamedParameter> Kernel::named_parameters() const {
    std::vector<NamedParameter> named;
    named.reserve(parameters_.size());
    for (const Parameter* parameter : parameters_) {
        named.emplace_back(parameter->name(), parameter);
    }
    return named;
}

void Kernel::register_parameter(const Parameter& parameter) {
    parameters_.push_back(&parameter);
}

Eigen::ArrayXd Kernel::per_dimension(const Parameter& parameter) const {
    if (parameter.is_scalar()) {
        return Eigen::ArrayXd::Constant(static_cast<Eigen::Index>(input_dim_), parameter.scalar());
    }
    return parameter.vector().array();
}

void Kernel::check_quadrature() const {
    const QuadraturePolicy policy = numerics_settings().quadrature_policy;
    if (policy == QuadraturePolicy::Error || num_gauss_hermite_points_ == 0) {
        throw ConfigurationError("quadrature is disabled for kernel expectations of " + type_name() + " (policy " +
                                 to_string(policy) + ", " + std::to_string(num_gauss_hermite_points_) +
                                 " Gauss-Hermite points)");
    }
    if (policy == QuadraturePolicy::Warn) {
        std::cerr << "libgpcov warning: using numerical quadrature for the kernel expectation of " << type_name()
                  << " (" << num_gauss_hermite_points_ << " points per dimension)" << std::endl;
    }
}

Eigen::VectorXd Kernel::eKdiag(const Eigen::MatrixXd& Xmu, const InputCovariance& Xcov) const {
    check_quadrature();
    check_matching_rows(Xmu, Xcov.rows(), "eKdiag");
    const Eigen::MatrixXd mu = active_dims_.slice(Xmu);
    const CovarianceBatch cov = active_dims_.slice_cov(Xcov);

    const QuadratureIntegrand integrand = [this](const Eigen::MatrixXd& x) -> Eigen::MatrixXd {
        return Kdiag(x, true);
    };
    return mvnquad(integrand, mu, cov, num_gauss_hermite_points_, 1).col(0);
}

Eigen::MatrixXd Kernel::eKxz(const Eigen::MatrixXd& Z, const Eigen::MatrixXd& Xmu, const InputCovariance& Xcov) const {
    check_quadrature();
    check_matching_rows(Xmu, Xcov.rows(), "eKxz");
    const Eigen::MatrixXd mu = active_dims_.slice(Xmu);
    const Eigen::MatrixXd sliced_Z = active_dims_.slice(Z);
    const CovarianceBatch cov = active_dims_.slice_cov(Xcov);

    const QuadratureIntegrand integrand = [this, &sliced_Z](const Eigen::MatrixXd& x) -> Eigen::MatrixXd {
        return K(x, sliced_Z, true);
    };
    return mvnquad(integrand, mu, cov, num_gauss_hermite_points_, sliced_Z.rows());
}

std::vector<Eigen::MatrixXd> Kernel::eKzxKxz(const Eigen::MatrixXd& Z,
                                             const Eigen::MatrixXd& Xmu,
                                             const InputCovariance& Xcov) const {
    check_quadrature();
    check_matching_rows(Xmu, Xcov.rows(), "eKzxKxz");
    const Eigen::MatrixXd mu = active_dims_.slice(Xmu);
    const Eigen::MatrixXd sliced_Z = active_dims_.slice(Z);
    const CovarianceBatch cov = active_dims_.slice_cov(Xcov);
    const Eigen::Index M = sliced_Z.rows();

    // Each output row holds the M x M outer product flattened in row-major order.
    const QuadratureIntegrand integrand = [this, &sliced_Z, M](const Eigen::MatrixXd& x) -> Eigen::MatrixXd {
        const Eigen::MatrixXd Kxz = K(x, sliced_Z, true);
        Eigen::MatrixXd outer(x.rows(), M * M);
        for (Eigen::Index p = 0; p < x.rows(); ++p) {
            for (Eigen::Index a = 0; a < M; ++a) {
                outer.row(p).segment(a * M, M) = Kxz(p, a) * Kxz.row(p);
            }
        }
        return outer;
    };
    const Eigen::MatrixXd flat = mvnquad(integrand, mu, cov, num_gauss_hermite_points_, M * M);

    std::vector<Eigen::MatrixXd> result;
    result.reserve(static_cast<std::size_t>(flat.rows()));
    for (Eigen::Index n = 0; n < flat.rows(); ++n) {
        Eigen::MatrixXd expectation(M, M);
        for (Eigen::Index a = 0; a < M; ++a) {
            expectation.row(a) = flat.row(n).segment(a * M, M);
        }
        result.push_back(std::move(expectation));
    }
    return result;
}

std::vector<Eigen::MatrixXd> Kernel::exKxz(const Eigen::MatrixXd& Z,
                                           const Eigen::MatrixXd& Xmu,
                                           const MarkovCovariance& Xcov) const {
    check_quadrature();
    const auto D = static_cast<Eigen::Index>(input_dim_);
    if (Xmu.cols() != D) {
        throw ShapeError("exKxz: numerical quadrature needs Xmu with " + std::to_string(D) + " columns, got " +
                         std::to_string(Xmu.cols()));
    }
    if (Xmu.rows() < 2) {
        throw ShapeError("exKxz: Xmu needs at least two rows, got " + std::to_string(Xmu.rows()));
    }
    check_matching_rows(Xmu, Xcov.marginal.size(), "exKxz marginal");
    check_matching_rows(Xmu, Xcov.cross.size(), "exKxz cross");

    const Eigen::Index T = Xmu.rows() - 1;
    Eigen::MatrixXd joint_mu(T, 2 * D);
    CovarianceBatch joint_cov;
    joint_cov.reserve(static_cast<std::size_t>(T));
    for (Eigen::Index t = 0; t < T; ++t) {
        const auto prev = static_cast<std::size_t>(t);
        const auto next = static_cast<std::size_t>(t + 1);
        for (const Eigen::MatrixXd* block : {&Xcov.marginal[prev], &Xcov.cross[prev], &Xcov.marginal[next]}) {
            if (block->rows() != D || block->cols() != D) {
                throw ShapeError("exKxz: covariance blocks must be " + std::to_string(D) + "x" +
                                 std::to_string(D) + ", got " + std::to_string(block->rows()) + "x" +
                                 std::to_string(block->cols()));
            }
        }
        joint_mu.row(t) << Xmu.row(t), Xmu.row(t + 1);
        Eigen::MatrixXd cov(2 * D, 2 * D);
        cov.topLeftCorner(D, D) = Xcov.marginal[prev];
        cov.topRightCorner(D, D) = Xcov.cross[prev];
        cov.bottomLeftCorner(D, D) = Xcov.cross[prev].transpose();
        cov.bottomRightCorner(D, D) = Xcov.marginal[next];
        joint_cov.push_back(std::move(cov));
    }

    const Eigen::Index M = Z.rows();
    // Points are (x_{t-1}, x_t); each output row is the M x D product flattened row-major.
    const QuadratureIntegrand integrand = [this, &Z, D, M](const Eigen::MatrixXd& x) -> Eigen::MatrixXd {
        const Eigen::MatrixXd Kxz = K(x.rightCols(D), Z);
        Eigen::MatrixXd product(x.rows(), M * D);
        for (Eigen::Index p = 0; p < x.rows(); ++p) {
            for (Eigen::Index m = 0; m < M; ++m) {
                product.row(p).segment(m * D, D) = Kxz(p, m) * x.row(p).head(D);
            }
        }
        return product;
    };
    const Eigen::MatrixXd flat = mvnquad(integrand, joint_mu, joint_cov, num_gauss_hermite_points_, M * D);

    std::vector<Eigen::MatrixXd> result;
    result.reserve(static_cast<std::size_t>(T));
    for (Eigen::Index t = 0; t < T; ++t) {
        Eigen::MatrixXd expectation(M, D);
        for (Eigen::Index m = 0; m < M; ++m) {
            expectation.row(m) = flat.row(t).segment(m * D, D);
        }
        result.push_back(std::move(expectation));
    }
    return result;
}

}  // namespace libgpcov
