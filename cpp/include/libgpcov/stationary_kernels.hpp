#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

struct StationaryOptions {
    double variance{1.0};
    std::vector<double> lengthscales{1.0};
    bool ard{false};
};

// Kernels that depend on the inputs only through the scaled distance
// r^2 = sum_d ((x_d - x'_d) / l_d)^2.
class Stationary : public Kernel {
public:
    [[nodiscard]] const Parameter& variance() const noexcept { return variance_; }

    [[nodiscard]] Parameter& variance() noexcept { return variance_; }

    [[nodiscard]] const Parameter& lengthscales() const noexcept { return lengthscales_; }

    [[nodiscard]] Parameter& lengthscales() noexcept { return lengthscales_; }

    [[nodiscard]] bool ard() const noexcept { return ard_; }

    // Scaled squared distances between the rows of X and X2 (X itself when X2 is
    // null), clamped at zero. Inputs are already sliced.
    [[nodiscard]] Eigen::MatrixXd square_dist(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const;

protected:
    Stationary(std::size_t input_dim, const StationaryOptions& options, std::optional<ActiveDims> active_dims);

    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

    // Correlation as a function of the scaled squared distance.
    [[nodiscard]] virtual Eigen::ArrayXXd profile(const Eigen::ArrayXXd& r2) const = 0;

    [[nodiscard]] virtual Dual profile(const Dual& r2) const = 0;

private:
    bool ard_;
    Parameter variance_;
    Parameter lengthscales_;
};

// Squared exponential, sigma^2 exp(-r^2 / 2).
class RBF final : public Stationary {
public:
    explicit RBF(std::size_t input_dim,
                 const StationaryOptions& options = {},
                 std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "RBF"; }

protected:
    [[nodiscard]] Eigen::ArrayXXd profile(const Eigen::ArrayXXd& r2) const override;

    [[nodiscard]] Dual profile(const Dual& r2) const override;
};

// sigma^2 exp(-r / 2).
class Exponential final : public Stationary {
public:
    explicit Exponential(std::size_t input_dim,
                         const StationaryOptions& options = {},
                         std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Exponential"; }

protected:
    [[nodiscard]] Eigen::ArrayXXd profile(const Eigen::ArrayXXd& r2) const override;

    [[nodiscard]] Dual profile(const Dual& r2) const override;
};

class Matern12 final : public Stationary {
public:
    explicit Matern12(std::size_t input_dim,
                      const StationaryOptions& options = {},
                      std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Matern12"; }

protected:
    [[nodiscard]] Eigen::ArrayXXd profile(const Eigen::ArrayXXd& r2) const override;

    [[nodiscard]] Dual profile(const Dual& r2) const override;
};

class Matern32 final : public Stationary {
public:
    explicit Matern32(std::size_t input_dim,
                      const StationaryOptions& options = {},
                      std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Matern32"; }

protected:
    [[nodiscard]] Eigen::ArrayXXd profile(const Eigen::ArrayXXd& r2) const override;

    [[nodiscard]] Dual profile(const Dual& r2) const override;
};

class Matern52 final : public Stationary {
public:
    explicit Matern52(std::size_t input_dim,
                      const StationaryOptions& options = {},
                      std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Matern52"; }

protected:
    [[nodiscard]] Eigen::ArrayXXd profile(const Eigen::ArrayXXd& r2) const override;

    [[nodiscard]] Dual profile(const Dual& r2) const override;
};

class Cosine final : public Stationary {
public:
    explicit Cosine(std::size_t input_dim,
                    const StationaryOptions& options = {},
                    std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "Cosine"; }

protected:
    [[nodiscard]] Eigen::ArrayXXd profile(const Eigen::ArrayXXd& r2) const override;

    [[nodiscard]] Dual profile(const Dual& r2) const override;
};

}  // namespace libgpcov
