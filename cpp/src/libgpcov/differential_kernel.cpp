#include "libgpcov/differential_kernel.hpp"

#include <cmath>
#include <map>
#include <string>
#include <utility>

#include "libgpcov/errors.hpp"

namespace libgpcov {

namespace {

constexpr int kMaxDerivativeOrder = 2;

using DerivativeBranch = double (*)(const Kernel& base,
                                    DualVector& x,
                                    DualVector& z,
                                    const DerivativeDescriptor& left,
                                    const DerivativeDescriptor& right);

// Seeds the listed coordinates one per derivative order and returns the last
// entry of the chain f, df/dv1, d2f/dv1dv2, ...
template <typename... Variables>
double chain_derivative(const Kernel& base, DualVector& x, DualVector& z, Variables&... variables) {
    const auto pair = [&base](const DualVector& left, const DualVector& right) { return base.K_pair(left, right); };
    const auto chain = autodiff::derivatives(pair, autodiff::wrt(variables...), autodiff::at(x, z));
    return chain[sizeof...(Variables)];
}

// Keyed by (left count, right count). Left dimensions are always seeded before
// right dimensions.
const std::map<std::pair<int, int>, DerivativeBranch>& derivative_branches() {
    static const std::map<std::pair<int, int>, DerivativeBranch> branches{
        {{1, 0},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor& l,
            const DerivativeDescriptor&) { return chain_derivative(base, x, z, x(l.dims[0])); }},
        {{0, 1},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor&,
            const DerivativeDescriptor& r) { return chain_derivative(base, x, z, z(r.dims[0])); }},
        {{2, 0},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor& l,
            const DerivativeDescriptor&) { return chain_derivative(base, x, z, x(l.dims[0]), x(l.dims[1])); }},
        {{1, 1},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor& l,
            const DerivativeDescriptor& r) { return chain_derivative(base, x, z, x(l.dims[0]), z(r.dims[0])); }},
        {{0, 2},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor&,
            const DerivativeDescriptor& r) { return chain_derivative(base, x, z, z(r.dims[0]), z(r.dims[1])); }},
        {{2, 1},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor& l,
            const DerivativeDescriptor& r) {
             return chain_derivative(base, x, z, x(l.dims[0]), x(l.dims[1]), z(r.dims[0]));
         }},
        {{1, 2},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor& l,
            const DerivativeDescriptor& r) {
             return chain_derivative(base, x, z, x(l.dims[0]), z(r.dims[0]), z(r.dims[1]));
         }},
        {{2, 2},
         [](const Kernel& base, DualVector& x, DualVector& z, const DerivativeDescriptor& l,
            const DerivativeDescriptor& r) {
             return chain_derivative(base, x, z, x(l.dims[0]), x(l.dims[1]), z(r.dims[0]), z(r.dims[1]));
         }},
    };
    return branches;
}

void check_descriptor_dims(const std::vector<DerivativeDescriptor>& descriptors, Eigen::Index width, const char* side) {
    for (std::size_t n = 0; n < descriptors.size(); ++n) {
        const DerivativeDescriptor& descriptor = descriptors[n];
        for (int slot = 0; slot < descriptor.count; ++slot) {
            const int dim = descriptor.dims[static_cast<std::size_t>(slot)];
            if (dim < 0 || dim >= width) {
                throw ShapeError(std::string(side) + " derivative dimension " + std::to_string(dim) + " of row " +
                                 std::to_string(n) + " outside the " + std::to_string(width) + " input columns");
            }
        }
    }
}

void check_descriptor_rows(const std::vector<DerivativeDescriptor>& descriptors, Eigen::Index rows, const char* side) {
    if (static_cast<Eigen::Index>(descriptors.size()) != rows) {
        throw ShapeError(std::string(side) + " has " + std::to_string(rows) + " rows but " +
                         std::to_string(descriptors.size()) + " derivative descriptors");
    }
}

[[nodiscard]] std::vector<DualVector> dual_rows(const Eigen::MatrixXd& X) {
    std::vector<DualVector> rows;
    rows.reserve(static_cast<std::size_t>(X.rows()));
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        rows.push_back(to_dual(X.row(i)));
    }
    return rows;
}

}  // namespace

std::vector<DerivativeDescriptor> parse_derivative_info(const Eigen::MatrixXi& info) {
    if (info.rows() > 0 && info.cols() == 0) {
        throw ShapeError("derivative info needs a count column");
    }
    const Eigen::Index slots = info.cols() > 0 ? info.cols() - 1 : 0;
    std::vector<DerivativeDescriptor> descriptors;
    descriptors.reserve(static_cast<std::size_t>(info.rows()));
    for (Eigen::Index n = 0; n < info.rows(); ++n) {
        DerivativeDescriptor descriptor;
        descriptor.count = info(n, 0);
        if (descriptor.count < 0 || descriptor.count > kMaxDerivativeOrder) {
            throw ConfigurationError("derivative count " + std::to_string(descriptor.count) + " in row " +
                                     std::to_string(n) + " is not 0, 1 or 2");
        }
        if (descriptor.count > slots) {
            throw ShapeError("derivative count " + std::to_string(descriptor.count) + " in row " + std::to_string(n) +
                             " exceeds the " + std::to_string(slots) + " dimension columns");
        }
        for (int slot = 0; slot < descriptor.count; ++slot) {
            descriptor.dims[static_cast<std::size_t>(slot)] = info(n, slot + 1);
        }
        descriptors.push_back(descriptor);
    }
    return descriptors;
}

std::vector<DerivativeDescriptor> decode_derivative_mask(const Eigen::MatrixXd& mask) {
    std::vector<DerivativeDescriptor> descriptors;
    descriptors.reserve(static_cast<std::size_t>(mask.rows()));
    for (Eigen::Index n = 0; n < mask.rows(); ++n) {
        Eigen::VectorXi orders(mask.cols());
        for (Eigen::Index d = 0; d < mask.cols(); ++d) {
            orders(d) = static_cast<int>(std::lround(mask(n, d)));
            if (orders(d) < 0) {
                throw ConfigurationError("derivative mask entry " + std::to_string(orders(d)) + " in row " +
                                         std::to_string(n) + " is negative");
            }
        }
        DerivativeDescriptor descriptor;
        descriptor.count = orders.sum();
        if (descriptor.count > kMaxDerivativeOrder) {
            throw ConfigurationError("derivative order " + std::to_string(descriptor.count) + " in row " +
                                     std::to_string(n) + " exceeds the supported maximum of 2");
        }
        if (descriptor.count > 0) {
            Eigen::Index first = 0;
            orders.maxCoeff(&first);
            descriptor.dims[0] = static_cast<int>(first);
            orders(first) -= 1;
            if (descriptor.count == 2) {
                Eigen::Index second = 0;
                orders.maxCoeff(&second);
                descriptor.dims[1] = static_cast<int>(second);
            }
        }
        descriptors.push_back(descriptor);
    }
    return descriptors;
}

DifferentialObservationsKernel::DifferentialObservationsKernel(std::size_t input_dim,
                                                               std::unique_ptr<Kernel> base_kernel,
                                                               std::optional<ActiveDims> active_dims)
    : Kernel(input_dim, std::move(active_dims)), base_kernel_(std::move(base_kernel)) {
    if (!base_kernel_) {
        throw InvariantViolation("differential kernel needs a base kernel");
    }
}

std::vector<NamedParameter> DifferentialObservationsKernel::named_parameters() const {
    return base_kernel_->named_parameters();
}

Eigen::VectorXd DifferentialObservationsKernel::compute_Kdiag(const Eigen::MatrixXd& X) const {
    return compute_K(X, nullptr).diagonal();
}

Dual DifferentialObservationsKernel::compute_pair(const DualVector& /*x*/, const DualVector& /*z*/) const {
    throw ConfigurationError(type_name() + " has no pairwise form and cannot be nested inside another kernel");
}

Eigen::MatrixXd DifferentialObservationsKernel::differential_covariance(const Eigen::MatrixXd& X,
                                                                        const std::vector<DerivativeDescriptor>& left,
                                                                        const Eigen::MatrixXd* X2,
                                                                        const std::vector<DerivativeDescriptor>& right) const {
    const Eigen::MatrixXd& Z = X2 == nullptr ? X : *X2;
    check_descriptor_rows(left, X.rows(), "X");
    check_descriptor_rows(right, Z.rows(), X2 == nullptr ? "X" : "X2");
    check_descriptor_dims(left, X.cols(), "left");
    check_descriptor_dims(right, Z.cols(), "right");

    Eigen::MatrixXd K = X2 == nullptr ? base_kernel_->K(X) : base_kernel_->K(X, *X2);

    // Separate copies per side: seeding a coordinate must not leak to the other.
    std::vector<DualVector> left_rows = dual_rows(X);
    std::vector<DualVector> right_rows = dual_rows(Z);
    const auto& branches = derivative_branches();

    for (Eigen::Index i = 0; i < K.rows(); ++i) {
        const DerivativeDescriptor& l = left[static_cast<std::size_t>(i)];
        for (Eigen::Index j = 0; j < K.cols(); ++j) {
            const DerivativeDescriptor& r = right[static_cast<std::size_t>(j)];
            const auto branch = branches.find({l.count, r.count});
            if (branch == branches.end()) {
                continue;
            }
            K(i, j) = branch->second(*base_kernel_, left_rows[static_cast<std::size_t>(i)],
                                     right_rows[static_cast<std::size_t>(j)], l, r);
        }
    }
    return K;
}

DifferentialObservationsKernelStatic::DifferentialObservationsKernelStatic(
    std::size_t input_dim,
    std::unique_ptr<Kernel> base_kernel,
    const Eigen::MatrixXi& derivative_info_x,
    const std::optional<Eigen::MatrixXi>& derivative_info_x2)
    : DifferentialObservationsKernel(input_dim, std::move(base_kernel)),
      derivatives_x_(parse_derivative_info(derivative_info_x)),
      derivatives_x2_(derivative_info_x2 ? parse_derivative_info(*derivative_info_x2) : derivatives_x_) {}

Eigen::MatrixXd DifferentialObservationsKernelStatic::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    if (X2 == nullptr) {
        return differential_covariance(X, derivatives_x_, nullptr, derivatives_x_);
    }
    return differential_covariance(X, derivatives_x_, X2, derivatives_x2_);
}

DifferentialObservationsKernelDynamic::DifferentialObservationsKernelDynamic(std::size_t input_dim,
                                                                             std::unique_ptr<Kernel> base_kernel,
                                                                             std::size_t obs_dims,
                                                                             std::optional<ActiveDims> active_dims)
    : DifferentialObservationsKernel(input_dim, std::move(base_kernel), std::move(active_dims)), obs_dims_(obs_dims) {
    if (obs_dims_ == 0 || 2 * obs_dims_ > input_dim) {
        throw InvariantViolation("dynamic differential kernel with input_dim " + std::to_string(input_dim) +
                                 " cannot hold " + std::to_string(obs_dims_) +
                                 " coordinate and mask columns each");
    }
}

Eigen::MatrixXd DifferentialObservationsKernelDynamic::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    const auto dims = static_cast<Eigen::Index>(obs_dims_);
    if (X.cols() < 2 * dims || (X2 != nullptr && X2->cols() < 2 * dims)) {
        throw ShapeError("dynamic differential kernel needs " + std::to_string(2 * dims) +
                         " columns (coordinates then derivative mask)");
    }
    const Eigen::MatrixXd coordinates = X.leftCols(dims);
    const std::vector<DerivativeDescriptor> left = decode_derivative_mask(X.rightCols(dims));
    if (X2 == nullptr) {
        return differential_covariance(coordinates, left, nullptr, left);
    }
    const Eigen::MatrixXd coordinates2 = X2->leftCols(dims);
    const std::vector<DerivativeDescriptor> right = decode_derivative_mask(X2->rightCols(dims));
    return differential_covariance(coordinates, left, &coordinates2, right);
}

}  // namespace libgpcov
