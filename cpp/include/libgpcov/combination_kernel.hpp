#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/kernel.hpp"

namespace libgpcov {

enum class CombinationOperator {
    Sum,
    Product
};

// Names for a list of kernels: the lower-cased type name, with _1, _2, ...
// appended to every kernel whose type occurs more than once.
[[nodiscard]] std::vector<std::string> make_kernel_names(const std::vector<const Kernel*>& kernels);

// Sum or product of owned child kernels. Children combined with the same
// operator are absorbed, so Add(Add(a, b), c) holds a, b and c directly.
class Combination : public Kernel {
public:
    [[nodiscard]] CombinationOperator combination_operator() const noexcept { return operator_; }

    [[nodiscard]] const std::vector<std::unique_ptr<Kernel>>& children() const noexcept { return children_; }

    [[nodiscard]] const std::vector<std::string>& child_names() const noexcept { return child_names_; }

    [[nodiscard]] const Kernel& child(const std::string& name) const;

    [[nodiscard]] Kernel& child(const std::string& name);

    // True when every child selects an explicit index set and no two sets
    // overlap. Range selectors always answer false.
    [[nodiscard]] bool on_separate_dimensions() const;

    [[nodiscard]] std::vector<NamedParameter> named_parameters() const override;

protected:
    Combination(CombinationOperator op, std::vector<std::unique_ptr<Kernel>> kernels);

    [[nodiscard]] Eigen::MatrixXd compute_K(const Eigen::MatrixXd& X, const Eigen::MatrixXd* X2) const override;

    [[nodiscard]] Eigen::VectorXd compute_Kdiag(const Eigen::MatrixXd& X) const override;

    [[nodiscard]] Dual compute_pair(const DualVector& x, const DualVector& z) const override;

private:
    [[nodiscard]] static std::size_t infer_input_dim(const std::vector<std::unique_ptr<Kernel>>& kernels);

    [[nodiscard]] static std::vector<std::unique_ptr<Kernel>> flatten(CombinationOperator op,
                                                                      std::vector<std::unique_ptr<Kernel>> kernels);

    [[nodiscard]] std::size_t child_index(const std::string& name) const;

    CombinationOperator operator_;
    std::vector<std::unique_ptr<Kernel>> children_;
    std::vector<std::string> child_names_;
};

class Add final : public Combination {
public:
    explicit Add(std::vector<std::unique_ptr<Kernel>> kernels);

    [[nodiscard]] std::string type_name() const override { return "Add"; }
};

class Prod final : public Combination {
public:
    explicit Prod(std::vector<std::unique_ptr<Kernel>> kernels);

    [[nodiscard]] std::string type_name() const override { return "Prod"; }
};

[[nodiscard]] std::unique_ptr<Kernel> operator+(std::unique_ptr<Kernel> lhs, std::unique_ptr<Kernel> rhs);

[[nodiscard]] std::unique_ptr<Kernel> operator*(std::unique_ptr<Kernel> lhs, std::unique_ptr<Kernel> rhs);

}  // namespace libgpcov
