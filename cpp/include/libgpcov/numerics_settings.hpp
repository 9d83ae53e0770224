#pragma once

#include <string>

namespace libgpcov {

// How kernels without closed-form expectations react when asked for one.
enum class QuadraturePolicy {
    Allow,  // integrate numerically without comment
    Warn,   // integrate numerically and print a warning
    Error   // refuse with ConfigurationError
};

struct NumericsSettings {
    QuadraturePolicy quadrature_policy{QuadraturePolicy::Warn};
};

// Process-wide settings. The first call reads LIBGPCOV_EKERN_QUADRATURE from
// the environment when it is set.
[[nodiscard]] NumericsSettings& numerics_settings();

[[nodiscard]] QuadraturePolicy parse_quadrature_policy(const std::string& id);

[[nodiscard]] std::string to_string(QuadraturePolicy policy);

}  // namespace libgpcov
