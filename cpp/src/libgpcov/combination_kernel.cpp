#include "libgpcov/combination_kernel.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "libgpcov/errors.hpp"

namespace libgpcov {

namespace {

[[nodiscard]] std::string lowercase(const std::string& id) {
    std::string lowered;
    lowered.reserve(id.size());
    for (unsigned char ch : id) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lowered;
}

}  // namespace

std::vector<std::string> make_kernel_names(const std::vector<const Kernel*>& kernels) {
    std::vector<std::string> base_names;
    base_names.reserve(kernels.size());
    std::unordered_map<std::string, std::size_t> totals;
    for (const Kernel* kernel : kernels) {
        base_names.push_back(lowercase(kernel->type_name()));
        ++totals[base_names.back()];
    }

    std::unordered_map<std::string, std::size_t> seen;
    std::vector<std::string> names;
    names.reserve(kernels.size());
    for (const auto& base : base_names) {
        if (totals[base] == 1) {
            names.push_back(base);
        } else {
            names.push_back(base + "_" + std::to_string(++seen[base]));
        }
    }
    return names;
}

Combination::Combination(CombinationOperator op, std::vector<std::unique_ptr<Kernel>> kernels)
    : Kernel(infer_input_dim(kernels), std::nullopt), operator_(op), children_(flatten(op, std::move(kernels))) {
    std::vector<const Kernel*> raw;
    raw.reserve(children_.size());
    for (const auto& kernel : children_) {
        raw.push_back(kernel.get());
    }
    child_names_ = make_kernel_names(raw);
}

std::size_t Combination::infer_input_dim(const std::vector<std::unique_ptr<Kernel>>& kernels) {
    if (kernels.empty()) {
        throw InvariantViolation("combination kernel needs at least one child");
    }
    std::size_t width = 0;
    for (const auto& kernel : kernels) {
        if (!kernel) {
            throw InvariantViolation("combination kernel child is null");
        }
        width = std::max(width, kernel->active_dims().required_width());
    }
    return width;
}

std::vector<std::unique_ptr<Kernel>> Combination::flatten(CombinationOperator op,
                                                          std::vector<std::unique_ptr<Kernel>> kernels) {
    std::vector<std::unique_ptr<Kernel>> flat;
    flat.reserve(kernels.size());
    for (auto& kernel : kernels) {
        auto* nested = dynamic_cast<Combination*>(kernel.get());
        if (nested != nullptr && nested->operator_ == op) {
            for (auto& grandchild : nested->children_) {
                flat.push_back(std::move(grandchild));
            }
        } else {
            flat.push_back(std::move(kernel));
        }
    }
    return flat;
}

std::size_t Combination::child_index(const std::string& name) const {
    const auto it = std::find(child_names_.begin(), child_names_.end(), name);
    if (it == child_names_.end()) {
        throw std::invalid_argument("unknown child kernel: " + name);
    }
    return static_cast<std::size_t>(it - child_names_.begin());
}

const Kernel& Combination::child(const std::string& name) const {
    return *children_[child_index(name)];
}

Kernel& Combination::child(const std::string& name) {
    return *children_[child_index(name)];
}

bool Combination::on_separate_dimensions() const {
    std::set<std::size_t> used;
    for (const auto& kernel : children_) {
        const ActiveDims& dims = kernel->active_dims();
        if (dims.is_range()) {
            return false;
        }
        for (std::size_t column : dims.columns()) {
            if (!used.insert(column).second) {
                return false;
            }
        }
    }
    return true;
}

std::vector<NamedParameter> Combination::named_parameters() const {
    std::vector<NamedParameter> named;
    for (std::size_t i = 0; i < children_.size(); ++i) {
        for (const auto& [name, parameter] : children_[i]->named_parameters()) {
            named.emplace_back(child_names_[i] + "." + name, parameter);
        }
    }
    return named;
}

Eigen::MatrixXd Combination::compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const {
    Eigen::MatrixXd result = X2 == nullptr ? children_.front()->K(X) : children_.front()->K(X, *X2);
    for (std::size_t i = 1; i < children_.size(); ++i) {
        const Eigen::MatrixXd term = X2 == nullptr ? children_[i]->K(X) : children_[i]->K(X, *X2);
        if (operator_ == CombinationOperator::Sum) {
            result += term;
        } else {
            result = result.cwiseProduct(term);
        }
    }
    return result;
}

Eigen::VectorXd Combination::compute_Kdiag(const Eigen::MatrixXd& X) const {
    Eigen::VectorXd result = children_.front()->Kdiag(X);
    for (std::size_t i = 1; i < children_.size(); ++i) {
        const Eigen::VectorXd term = children_[i]->Kdiag(X);
        if (operator_ == CombinationOperator::Sum) {
            result += term;
        } else {
            result = result.cwiseProduct(term);
        }
    }
    return result;
}

Dual Combination::compute_pair(const DualVector& x, const DualVector& z) const {
    Dual result = children_.front()->K_pair(x, z);
    for (std::size_t i = 1; i < children_.size(); ++i) {
        const Dual term = children_[i]->K_pair(x, z);
        if (operator_ == CombinationOperator::Sum) {
            result += term;
        } else {
            result *= term;
        }
    }
    return result;
}

Add::Add(std::vector<std::unique_ptr<Kernel>> kernels) : Combination(CombinationOperator::Sum, std::move(kernels)) {}

Prod::Prod(std::vector<std::unique_ptr<Kernel>> kernels)
    : Combination(CombinationOperator::Product, std::move(kernels)) {}

std::unique_ptr<Kernel> operator+(std::unique_ptr<Kernel> lhs, std::unique_ptr<Kernel> rhs) {
    std::vector<std::unique_ptr<Kernel>> kernels;
    kernels.push_back(std::move(lhs));
    kernels.push_back(std::move(rhs));
    return std::make_unique<Add>(std::move(kernels));
}

std::unique_ptr<Kernel> operator*(std::unique_ptr<Kernel> lhs, std::unique_ptr<Kernel> rhs) {
    std::vector<std::unique_ptr<Kernel>> kernels;
    kernels.push_back(std::move(lhs));
    kernels.push_back(std::move(rhs));
    return std::make_unique<Prod>(std::move(kernels));
}

}  // namespace libgpcov
