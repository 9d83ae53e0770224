#pragma once

#include <string>

#include <Eigen/Dense>

namespace libgpcov {

enum class ParameterConstraint {
    Free,
    Positive
};

// Named kernel hyperparameter. Scalars are stored as 1 x 1 matrices and vectors
// as n x 1. Positive parameters live in log space so that any unconstrained
// reading maps back into the domain.
class Parameter {
public:
    Parameter(std::string name, double value, ParameterConstraint constraint = ParameterConstraint::Positive);

    Parameter(std::string name, const Eigen::MatrixXd& value,
              ParameterConstraint constraint = ParameterConstraint::Positive);

    [[nodiscard]] const std::string& name() const noexcept;

    [[nodiscard]] ParameterConstraint constraint() const noexcept;

    [[nodiscard]] Eigen::MatrixXd value() const;

    [[nodiscard]] double scalar() const;

    [[nodiscard]] Eigen::VectorXd vector() const;

    [[nodiscard]] bool is_scalar() const noexcept;

    [[nodiscard]] Eigen::Index size() const noexcept;

    void set_value(double value);

    void set_value(const Eigen::MatrixXd& value);

    [[nodiscard]] const Eigen::MatrixXd& unconstrained_value() const noexcept;

    void set_unconstrained_value(const Eigen::MatrixXd& value);

    void set_fixed(bool fixed) noexcept;

    [[nodiscard]] bool is_fixed() const noexcept;

private:
    void validate(const Eigen::MatrixXd& value) const;

    std::string name_;
    ParameterConstraint constraint_;
    Eigen::MatrixXd unconstrained_value_;
    bool fixed_{false};
};

}  // namespace libgpcov
