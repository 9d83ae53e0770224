#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

// Which partial derivative of the latent function a data point observes:
// count is 0 (the value itself), 1 or 2, and dims holds the differentiated
// input dimensions with -1 marking unused slots.
struct DerivativeDescriptor {
    int count{0};
    std::array<int, 2> dims{{-1, -1}};
};

// Parses the integer derivative-info layout: column 0 holds the count and
// columns 1.. the differentiated dimensions.
[[nodiscard]] std::vector<DerivativeDescriptor> parse_derivative_info(const Eigen::MatrixXi& info);

// Decodes a per-dimension derivative-order mask (one row per point). The total
// order is the row sum, the first dimension the argmax and the second the
// argmax of what remains after removing one order from the first.
[[nodiscard]] std::vector<DerivativeDescriptor> decode_derivative_mask(const Eigen::MatrixXd& mask);

/**
 * Covariances between values and partial derivatives of a latent function
 * with a given base kernel:
 *
 *   cov(d^a f(x) / dx_i..., d^b f(x') / dx'_j...) = d^(a+b) k(x, x') / dx_i... dx'_j...
 *
 * Up to two derivatives per side. Derivatives are obtained by differentiating
 * the base kernel's pairwise value in forward mode; entries between plain
 * observations reuse the base kernel's covariance matrix.
 */
class DifferentialObservationsKernel : public Kernel {
public:
    [[nodiscard]] const Kernel& base_kernel() const noexcept { return *base_kernel_; }

    [[nodiscard]] Kernel& base_kernel() noexcept { return *base_kernel_; }

    [[nodiscard]] std::vector<NamedParameter> named_parameters() const override;

protected:
    DifferentialObservationsKernel(std::size_t input_dim,
                                   std::unique_ptr<Kernel> base_kernel,
                                   std::optional<ActiveDims> active_dims = std::nullopt);

    // Always evaluates the full covariance and returns its diagonal.
    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

    // Covariance between the points of X (with left descriptors) and X2 (with
    // right descriptors); X2 == nullptr selects the symmetric form of the base
    // kernel. X and X2 hold only the coordinates seen by the base kernel.
    [[nodiscard]] Eigen::MatrixXd differential_covariance(const Eigen::MatrixXd& X,
                                                          const std::vector<DerivativeDescriptor>& left,
                                                          const Eigen::MatrixXd* X2,
                                                          const std::vector<DerivativeDescriptor>& right) const;

private:
    std::unique_ptr<Kernel> base_kernel_;
};

// Derivative layout fixed at construction: one descriptor per row of the X
// (and optionally X2) the kernel will be evaluated on.
class DifferentialObservationsKernelStatic final : public DifferentialObservationsKernel {
public:
    DifferentialObservationsKernelStatic(std::size_t input_dim,
                                         std::unique_ptr<Kernel> base_kernel,
                                         const Eigen::MatrixXi& derivative_info_x,
                                         const std::optional<Eigen::MatrixXi>& derivative_info_x2 = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "DifferentialObservationsKernelStatic"; }

    [[nodiscard]] const std::vector<DerivativeDescriptor>& derivatives_x() const noexcept { return derivatives_x_; }

    [[nodiscard]] const std::vector<DerivativeDescriptor>& derivatives_x2() const noexcept { return derivatives_x2_; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

private:
    std::vector<DerivativeDescriptor> derivatives_x_;
    std::vector<DerivativeDescriptor> derivatives_x2_;
};

// Derivative layout carried in the inputs: after slicing to the active
// dimensions, the first obs_dims columns are the coordinates and the last
// obs_dims columns the derivative-order mask. Columns in between are ignored.
class DifferentialObservationsKernelDynamic final : public DifferentialObservationsKernel {
public:
    DifferentialObservationsKernelDynamic(std::size_t input_dim,
                                          std::unique_ptr<Kernel> base_kernel,
                                          std::size_t obs_dims,
                                          std::optional<ActiveDims> active_dims = std::nullopt);

    [[nodiscard]] std::string type_name() const override { return "DifferentialObservationsKernelDynamic"; }

    [[nodiscard]] std::size_t obs_dims() const noexcept { return obs_dims_; }

protected:
    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

private:
    std::size_t obs_dims_;
};

}  // namespace libgpcov
