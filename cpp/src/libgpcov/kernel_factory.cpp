#include "libgpcov/kernel_factory.hpp"

#include <cctype>
#include <utility>

#include "libgpcov/arc_cosine_kernel.hpp"
#include "libgpcov/errors.hpp"
#include "libgpcov/linear_kernels.hpp"
#include "libgpcov/periodic_kernel.hpp"
#include "libgpcov/static_kernels.hpp"
#include "libgpcov/stationary_kernels.hpp"

namespace libgpcov {

namespace {

std::string normalize_kernel_id(const std::string& id) {
    std::string lowered;
    lowered.reserve(id.size());
    for (unsigned char ch : id) {
        if (ch == '-') {
            lowered.push_back('_');
        } else {
            lowered.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return lowered;
}

}  // namespace

std::unique_ptr<Kernel> create_kernel(const std::string& id, std::size_t input_dim, std::optional<ActiveDims> active_dims) {
    const std::string normalized = normalize_kernel_id(id);

    if (normalized == "white") {
        return std::make_unique<White>(input_dim, 1.0, std::move(active_dims));
    } else if (normalized == "constant") {
        return std::make_unique<Constant>(input_dim, 1.0, std::move(active_dims));
    } else if (normalized == "bias") {
        return std::make_unique<Bias>(input_dim, 1.0, std::move(active_dims));
    } else if (normalized == "rbf" || normalized == "squared_exponential" || normalized == "se") {
        return std::make_unique<RBF>(input_dim, StationaryOptions{}, std::move(active_dims));
    } else if (normalized == "exponential") {
        return std::make_unique<Exponential>(input_dim, StationaryOptions{}, std::move(active_dims));
    } else if (normalized == "matern12") {
        return std::make_unique<Matern12>(input_dim, StationaryOptions{}, std::move(active_dims));
    } else if (normalized == "matern32") {
        return std::make_unique<Matern32>(input_dim, StationaryOptions{}, std::move(active_dims));
    } else if (normalized == "matern52") {
        return std::make_unique<Matern52>(input_dim, StationaryOptions{}, std::move(active_dims));
    } else if (normalized == "cosine") {
        return std::make_unique<Cosine>(input_dim, StationaryOptions{}, std::move(active_dims));
    } else if (normalized == "linear") {
        return std::make_unique<Linear>(input_dim, LinearOptions{}, std::move(active_dims));
    } else if (normalized == "polynomial") {
        return std::make_unique<Polynomial>(input_dim, PolynomialOptions{}, std::move(active_dims));
    } else if (normalized == "periodic") {
        return std::make_unique<Periodic>(input_dim, PeriodicOptions{}, std::move(active_dims));
    } else if (normalized == "arccosine" || normalized == "arc_cosine") {
        return std::make_unique<ArcCosine>(input_dim, ArcCosineOptions{}, std::move(active_dims));
    }
    throw ConfigurationError("unknown kernel: " + id);
}

}  // namespace libgpcov
