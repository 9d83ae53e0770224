#include "libgpcov/numerics_settings.hpp"

#include "libgpcov/errors.hpp"

#include <cctype>
#include <cstdlib>

namespace libgpcov {

namespace {

std::string normalize_policy_id(const std::string& id) {
    std::string lowered;
    lowered.reserve(id.size());
    for (unsigned char ch : id) {
        if (!std::isspace(ch)) {
            lowered.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return lowered;
}

NumericsSettings initial_settings() {
    NumericsSettings settings;
    if (const char* env = std::getenv("LIBGPCOV_EKERN_QUADRATURE")) {
        settings.quadrature_policy = parse_quadrature_policy(env);
    }
    return settings;
}

}  // namespace

NumericsSettings& numerics_settings() {
    static NumericsSettings settings = initial_settings();
    return settings;
}

QuadraturePolicy parse_quadrature_policy(const std::string& id) {
    const std::string normalized = normalize_policy_id(id);
    if (normalized == "allow" || normalized == "ignore" || normalized == "silent") {
        return QuadraturePolicy::Allow;
    }
    if (normalized == "warn" || normalized == "warning") {
        return QuadraturePolicy::Warn;
    }
    if (normalized == "error" || normalized == "raise" || normalized == "refuse") {
        return QuadraturePolicy::Error;
    }
    throw ConfigurationError("unknown quadrature policy '" + id + "' (expected allow, warn or error)");
}

std::string to_string(QuadraturePolicy policy) {
    switch (policy) {
        case QuadraturePolicy::Allow:
            return "allow";
        case QuadraturePolicy::Warn:
            return "warn";
        case QuadraturePolicy::Error:
            return "error";
    }
    return "unknown";
}

}  // namespace libgpcov
