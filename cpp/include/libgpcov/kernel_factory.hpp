#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "libgpcov/active_dims.hpp"
#include "libgpcov/kernel.hpp"

namespace libgpcov {

// Builds a kernel with default hyperparameters from its identifier, e.g.
// "rbf", "Matern32", "arc-cosine". Identifiers are case-insensitive and '-'
// is read as '_'. Coregion needs its output shape and is not built here.
[[nodiscard]] std::unique_ptr<Kernel> create_kernel(const std::string& id,
                                                    std::size_t input_dim,
                                                    std::optional<ActiveDims> active_dims = std::nullopt);

}  // namespace libgpcov
