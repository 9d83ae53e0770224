#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libgpcov/errors.hpp"
#include "libgpcov/types.hpp"

namespace libgpcov {

// Covariances of a set of Gaussian inputs, either as full D x D matrices or
// as an N x D matrix of per-dimension variances. The variance form is expanded
// to diagonal matrices on construction.
class InputCovariance {
public:
    InputCovariance(CovarianceBatch full);  // NOLINT(google-explicit-constructor)

    InputCovariance(const Eigen::MatrixXd& variances);  // NOLINT(google-explicit-constructor)

    [[nodiscard]] std::size_t rows() const noexcept { return batch_.size(); }

    [[nodiscard]] const CovarianceBatch& batch() const noexcept { return batch_; }

private:
    CovarianceBatch batch_;
};

// Selection of the input columns a kernel consumes: either the contiguous block
// [start, start + count) or an explicit ordered list of column indices.
class ActiveDims {
public:
    [[nodiscard]] static ActiveDims range(std::size_t count, std::size_t start = 0);

    [[nodiscard]] static ActiveDims indices(std::vector<std::size_t> columns);

    [[nodiscard]] bool is_range() const noexcept { return is_range_; }

    [[nodiscard]] std::size_t size() const noexcept { return columns_.size(); }

    [[nodiscard]] std::size_t start() const noexcept { return start_; }

    [[nodiscard]] const std::vector<std::size_t>& columns() const noexcept { return columns_; }

    // Number of leading input columns that must exist for this selection to apply.
    [[nodiscard]] std::size_t required_width() const noexcept;

    [[nodiscard]] Eigen::MatrixXd slice(const Eigen::MatrixXd& X) const;

    [[nodiscard]] CovarianceBatch slice_cov(const InputCovariance& cov) const;

    [[nodiscard]] DualVector slice_row(const DualVector& row) const;

    [[nodiscard]] std::string to_string() const;

private:
    ActiveDims(bool is_range, std::size_t start, std::vector<std::size_t> columns);

    void check_width(Eigen::Index width, const char* what) const;

    bool is_range_;
    std::size_t start_;
    std::vector<std::size_t> columns_;
};

}  // namespace libgpcov
