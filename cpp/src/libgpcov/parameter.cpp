#include "libgpcov/parameter.hpp"

#include "libgpcov/errors.hpp"

#include <string>
#include <utility>

namespace libgpcov {

namespace {

[[nodiscard]] Eigen::MatrixXd to_unconstrained(const Eigen::MatrixXd& value, ParameterConstraint constraint) {
    if (constraint == ParameterConstraint::Positive) {
        return value.array().log().matrix();
    }
    return value;
}

[[nodiscard]] std::string shape_string(const Eigen::MatrixXd& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

}  // namespace

Parameter::Parameter(std::string name, double value, ParameterConstraint constraint)
    : Parameter(std::move(name), Eigen::MatrixXd::Constant(1, 1, value), constraint) {}

Parameter::Parameter(std::string name, const Eigen::MatrixXd& value, ParameterConstraint constraint)
    : name_(std::move(name)), constraint_(constraint) {
    if (name_.empty()) {
        throw InvariantViolation("parameter name must be non-empty");
    }
    if (value.size() == 0) {
        throw InvariantViolation("parameter '" + name_ + "' must hold at least one value");
    }
    validate(value);
    unconstrained_value_ = to_unconstrained(value, constraint_);
}

const std::string& Parameter::name() const noexcept {
    return name_;
}

ParameterConstraint Parameter::constraint() const noexcept {
    return constraint_;
}

Eigen::MatrixXd Parameter::value() const {
    if (constraint_ == ParameterConstraint::Positive) {
        return unconstrained_value_.array().exp().matrix();
    }
    return unconstrained_value_;
}

double Parameter::scalar() const {
    if (!is_scalar()) {
        throw ShapeError("parameter '" + name_ + "' is " + shape_string(unconstrained_value_) +
                         ", not a scalar");
    }
    return value()(0, 0);
}

Eigen::VectorXd Parameter::vector() const {
    const Eigen::MatrixXd current = value();
    return Eigen::Map<const Eigen::VectorXd>(current.data(), current.size());
}

bool Parameter::is_scalar() const noexcept {
    return unconstrained_value_.size() == 1;
}

Eigen::Index Parameter::size() const noexcept {
    return unconstrained_value_.size();
}

void Parameter::set_value(double value) {
    set_value(Eigen::MatrixXd::Constant(1, 1, value));
}

void Parameter::set_value(const Eigen::MatrixXd& value) {
    if (value.rows() != unconstrained_value_.rows() || value.cols() != unconstrained_value_.cols()) {
        throw ShapeError("parameter '" + name_ + "' expects a " + shape_string(unconstrained_value_) +
                         " value, got " + shape_string(value));
    }
    validate(value);
    unconstrained_value_ = to_unconstrained(value, constraint_);
}

const Eigen::MatrixXd& Parameter::unconstrained_value() const noexcept {
    return unconstrained_value_;
}

void Parameter::set_unconstrained_value(const Eigen::MatrixXd& value) {
    if (value.rows() != unconstrained_value_.rows() || value.cols() != unconstrained_value_.cols()) {
        throw ShapeError("parameter '" + name_ + "' expects a " + shape_string(unconstrained_value_) +
                         " unconstrained value, got " + shape_string(value));
    }
    unconstrained_value_ = value;
}

void Parameter::set_fixed(bool fixed) noexcept {
    fixed_ = fixed;
}

bool Parameter::is_fixed() const noexcept {
    return fixed_;
}

void Parameter::validate(const Eigen::MatrixXd& value) const {
    if (!value.allFinite()) {
        throw InvariantViolation("parameter '" + name_ + "' must be finite");
    }
    if (constraint_ == ParameterConstraint::Positive && !(value.array() > 0.0).all()) {
        throw InvariantViolation("parameter '" + name_ + "' must be strictly positive");
    }
}

}  // namespace libgpcov
