#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/active_dims.hpp"
#include "libgpcov/parameter.hpp"
#include "libgpcov/types.hpp"

namespace libgpcov {

// Covariances of a chain of Gaussian inputs x_0..x_T: marginal[t] = cov(x_t) and
// cross[t] = cov(x_t, x_{t+1}). Both hold T + 1 matrices; the last cross entry
// is unused.
struct MarkovCovariance {
    CovarianceBatch marginal;
    CovarianceBatch cross;
};

using NamedParameter = std::pair<std::string, const Parameter*>;

// Initial value of a per-dimension parameter. Without ARD a single value is
// kept as a scalar; with ARD a single value is broadcast to input_dim entries.
[[nodiscard]] Eigen::MatrixXd ard_initial_value(const std::vector<double>& values,
                                                bool ard,
                                                std::size_t input_dim,
                                                const std::string& what);

class Kernel {
public:
    static constexpr std::size_t kDefaultGaussHermitePoints = 20;

    virtual ~Kernel() = default;

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    [[nodiscard]] std::size_t input_dim() const noexcept { return input_dim_; }

    [[nodiscard]] const ActiveDims& active_dims() const noexcept { return active_dims_; }

    // Class name of the covariance function, e.g. "RBF" or "Matern32".
    [[nodiscard]] virtual std::string type_name() const = 0;

    // Symmetric covariance K(X, X). Unless presliced, X is first narrowed to the
    // active dims.
    [[nodiscard]] Eigen::MatrixXd K(const Eigen::MatrixXd& X, bool presliced = false) const;

    [[nodiscard]] Eigen::MatrixXd K(const Eigen::MatrixXd& X, const Eigen::MatrixXd& X2, bool presliced = false) const;

    [[nodiscard]] Eigen::VectorXd Kdiag(const Eigen::MatrixXd& X, bool presliced = false) const;

    // k(x, z) for two unsliced input rows in dual arithmetic, so that partial
    // derivatives with respect to any input coordinate can be seeded.
    [[nodiscard]] Dual K_pair(const DualVector& x, const DualVector& z) const;

    [[nodiscard]] virtual std::vector<NamedParameter> named_parameters() const;

    [[nodiscard]] std::size_t num_gauss_hermite_points() const noexcept { return num_gauss_hermite_points_; }

    void set_num_gauss_hermite_points(std::size_t points) noexcept { num_gauss_hermite_points_ = points; }

    // Expectations under x ~ N(Xmu[n], Xcov[n]) computed by Gauss-Hermite
    // quadrature. Kernels with closed forms may override these.

    // <k(x, x)>, one entry per row of Xmu.
    [[nodiscard]] virtual Eigen::VectorXd eKdiag(const Eigen::MatrixXd& Xmu, const InputCovariance& Xcov) const;

    // <K(x, Z)>, N x M.
    [[nodiscard]] virtual Eigen::MatrixXd eKxz(const Eigen::MatrixXd& Z,
                                               const Eigen::MatrixXd& Xmu,
                                               const InputCovariance& Xcov) const;

    // <K(Z, x) K(x, Z)>, one M x M matrix per row of Xmu.
    [[nodiscard]] virtual std::vector<Eigen::MatrixXd> eKzxKxz(const Eigen::MatrixXd& Z,
                                                               const Eigen::MatrixXd& Xmu,
                                                               const InputCovariance& Xcov) const;

    // <K(x_t, Z)^T x_{t-1}^T>: one M x D matrix per consecutive pair of the T + 1
    // rows of Xmu. Xmu is not sliced and must have input_dim columns.
    [[nodiscard]] virtual std::vector<Eigen::MatrixXd> exKxz(const Eigen::MatrixXd& Z,
                                                             const Eigen::MatrixXd& Xmu,
                                                             const MarkovCovariance& Xcov) const;

protected:
    Kernel(std::size_t input_dim, std::optional<ActiveDims> active_dims);

    // X (and X2, when present) are already sliced. X2 == nullptr requests the
    // symmetric form.
    [[nodiscard]] virtual Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const = 0;

    [[nodiscard]] virtual Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const = 0;

    [[nodiscard]] virtual Dual compute_pair(const DualVector& x, const DualVector& z) const = 0;

    void register_parameter(const Parameter& parameter);

    // Scalar parameters broadcast to input_dim entries, vectors returned as-is.
    [[nodiscard]] Eigen::ArrayXd per_dimension(const Parameter& parameter) const;

    void check_quadrature() const;

private:
    std::size_t input_dim_;
    ActiveDims active_dims_;
    std::vector<const Parameter*> parameters_;
    std::size_t num_gauss_hermite_points_{kDefaultGaussHermitePoints};
};

}  // namespace libgpcov
