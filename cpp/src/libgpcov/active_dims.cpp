#include "libgpcov/active_dims.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <utility>

namespace libgpcov {

InputCovariance::InputCovariance(CovarianceBatch full) : batch_(std::move(full)) {
    for (std::size_t n = 0; n < batch_.size(); ++n) {
        if (batch_[n].rows() != batch_[n].cols()) {
            throw ShapeError("input covariance " + std::to_string(n) + " is " +
                             std::to_string(batch_[n].rows()) + "x" + std::to_string(batch_[n].cols()) +
                             ", expected a square matrix");
        }
    }
}

InputCovariance::InputCovariance(const Eigen::MatrixXd& variances) {
    batch_.reserve(static_cast<std::size_t>(variances.rows()));
    for (Eigen::Index n = 0; n < variances.rows(); ++n) {
        const Eigen::VectorXd diagonal = variances.row(n).transpose();
        Eigen::MatrixXd full = diagonal.asDiagonal();
        batch_.push_back(std::move(full));
    }
}

ActiveDims::ActiveDims(bool is_range, std::size_t start, std::vector<std::size_t> columns)
    : is_range_(is_range), start_(start), columns_(std::move(columns)) {}

ActiveDims ActiveDims::range(std::size_t count, std::size_t start) {
    std::vector<std::size_t> columns(count);
    std::iota(columns.begin(), columns.end(), start);
    return ActiveDims(true, start, std::move(columns));
}

ActiveDims ActiveDims::indices(std::vector<std::size_t> columns) {
    return ActiveDims(false, 0, std::move(columns));
}

std::size_t ActiveDims::required_width() const noexcept {
    if (columns_.empty()) {
        return start_;
    }
    return *std::max_element(columns_.begin(), columns_.end()) + 1;
}

void ActiveDims::check_width(Eigen::Index width, const char* what) const {
    if (static_cast<std::size_t>(width) < required_width()) {
        throw ShapeError(std::string(what) + " has " + std::to_string(width) + " columns but active dims " +
                         to_string() + " require " + std::to_string(required_width()));
    }
}

Eigen::MatrixXd ActiveDims::slice(const Eigen::MatrixXd& X) const {
    check_width(X.cols(), "input");
    const auto count = static_cast<Eigen::Index>(columns_.size());
    Eigen::MatrixXd sliced;
    if (is_range_) {
        sliced = X.middleCols(static_cast<Eigen::Index>(start_), count);
    } else {
        sliced.resize(X.rows(), count);
        for (Eigen::Index c = 0; c < count; ++c) {
            sliced.col(c) = X.col(static_cast<Eigen::Index>(columns_[c]));
        }
    }
    if (sliced.cols() != count) {
        throw ShapeError("sliced input has " + std::to_string(sliced.cols()) + " columns, expected " +
                         std::to_string(count));
    }
    return sliced;
}

CovarianceBatch ActiveDims::slice_cov(const InputCovariance& cov) const {
    const auto count = static_cast<Eigen::Index>(columns_.size());
    CovarianceBatch sliced;
    sliced.reserve(cov.rows());
    for (const auto& full : cov.batch()) {
        check_width(full.cols(), "input covariance");
        if (is_range_) {
            const auto offset = static_cast<Eigen::Index>(start_);
            sliced.emplace_back(full.block(offset, offset, count, count));
        } else {
            Eigen::MatrixXd gathered(count, count);
            for (Eigen::Index r = 0; r < count; ++r) {
                for (Eigen::Index c = 0; c < count; ++c) {
                    gathered(r, c) = full(static_cast<Eigen::Index>(columns_[r]),
                                          static_cast<Eigen::Index>(columns_[c]));
                }
            }
            sliced.push_back(std::move(gathered));
        }
    }
    return sliced;
}

DualVector ActiveDims::slice_row(const DualVector& row) const {
    check_width(row.size(), "input row");
    const auto count = static_cast<Eigen::Index>(columns_.size());
    if (is_range_) {
        return row.segment(static_cast<Eigen::Index>(start_), count);
    }
    DualVector sliced(count);
    for (Eigen::Index c = 0; c < count; ++c) {
        sliced(c) = row(static_cast<Eigen::Index>(columns_[c]));
    }
    return sliced;
}

std::string ActiveDims::to_string() const {
    std::ostringstream out;
    if (is_range_) {
        out << "[" << start_ << ":" << start_ + columns_.size() << ")";
        return out.str();
    }
    out << "{";
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        out << (i == 0 ? "" : ", ") << columns_[i];
    }
    out << "}";
    return out.str();
}

}  // namespace libgpcov
