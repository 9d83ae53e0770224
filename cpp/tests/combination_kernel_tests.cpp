#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "libgpcov/combination_kernel.hpp"
#include "libgpcov/errors.hpp"
#include "libgpcov/linear_kernels.hpp"
#include "libgpcov/static_kernels.hpp"
#include "libgpcov/stationary_kernels.hpp"

namespace {

Eigen::MatrixXd sample_inputs() {
    Eigen::MatrixXd X(3, 3);
    X << 0.2, -0.4, 1.0,
         1.1, 0.6, -0.3,
         -0.8, 0.1, 0.5;
    return X;
}

std::unique_ptr<libgpcov::Kernel> rbf(double variance, std::optional<libgpcov::ActiveDims> dims = std::nullopt) {
    libgpcov::StationaryOptions options;
    options.variance = variance;
    const std::size_t input_dim = dims ? dims->size() : 3;
    return std::make_unique<libgpcov::RBF>(input_dim, options, std::move(dims));
}

std::unique_ptr<libgpcov::Kernel> linear(std::optional<libgpcov::ActiveDims> dims = std::nullopt) {
    const std::size_t input_dim = dims ? dims->size() : 3;
    return std::make_unique<libgpcov::Linear>(input_dim, libgpcov::LinearOptions{}, std::move(dims));
}

std::vector<std::unique_ptr<libgpcov::Kernel>> kernel_list(std::unique_ptr<libgpcov::Kernel> a,
                                                           std::unique_ptr<libgpcov::Kernel> b) {
    std::vector<std::unique_ptr<libgpcov::Kernel>> kernels;
    kernels.push_back(std::move(a));
    kernels.push_back(std::move(b));
    return kernels;
}

}  // namespace

TEST_CASE("Kernel names are numbered for repeated types", "[combination]") {
    const libgpcov::RBF first(1);
    const libgpcov::Linear second(1);
    const libgpcov::RBF third(1);

    const auto names = libgpcov::make_kernel_names({&first, &second, &third});
    REQUIRE(names == std::vector<std::string>{"rbf_1", "linear", "rbf_2"});

    const auto unique = libgpcov::make_kernel_names({&first, &second});
    REQUIRE(unique == std::vector<std::string>{"rbf", "linear"});
}

TEST_CASE("Add and Prod reduce their children elementwise", "[combination]") {
    const Eigen::MatrixXd X = sample_inputs();
    const Eigen::MatrixXd K_rbf = rbf(0.7)->K(X);
    const Eigen::MatrixXd K_linear = linear()->K(X);
    const Eigen::VectorXd diag_rbf = rbf(0.7)->Kdiag(X);
    const Eigen::VectorXd diag_linear = linear()->Kdiag(X);

    SECTION("Sum") {
        const libgpcov::Add sum(kernel_list(rbf(0.7), linear()));
        REQUIRE(sum.K(X).isApprox(K_rbf + K_linear));
        REQUIRE(sum.Kdiag(X).isApprox(diag_rbf + diag_linear));
        REQUIRE(sum.input_dim() == 3);
    }

    SECTION("Product") {
        const libgpcov::Prod product(kernel_list(rbf(0.7), linear()));
        REQUIRE(product.K(X).isApprox(K_rbf.cwiseProduct(K_linear)));
        REQUIRE(product.Kdiag(X).isApprox(diag_rbf.cwiseProduct(diag_linear)));
    }

    SECTION("Operators") {
        const auto sum = rbf(0.7) + linear();
        const auto product = rbf(0.7) * linear();
        REQUIRE(sum->type_name() == "Add");
        REQUIRE(product->type_name() == "Prod");
        REQUIRE(sum->K(X).isApprox(K_rbf + K_linear));
        REQUIRE(product->K(X, X).isApprox(K_rbf.cwiseProduct(K_linear)));
    }
}

TEST_CASE("Nested combinations of the same operator are flattened", "[combination]") {
    const Eigen::MatrixXd X = sample_inputs();
    auto nested = (rbf(1.0) + linear()) + rbf(2.0);
    const auto& sum = dynamic_cast<const libgpcov::Add&>(*nested);

    REQUIRE(sum.children().size() == 3);
    REQUIRE(sum.child_names() == std::vector<std::string>{"rbf_1", "linear", "rbf_2"});
    REQUIRE(sum.K(X).isApprox(rbf(1.0)->K(X) + linear()->K(X) + rbf(2.0)->K(X)));

    SECTION("Different operators are kept nested") {
        auto mixed = (rbf(1.0) * linear()) + rbf(2.0);
        const auto& outer = dynamic_cast<const libgpcov::Add&>(*mixed);
        REQUIRE(outer.children().size() == 2);
        REQUIRE(outer.child_names() == std::vector<std::string>{"prod", "rbf"});
    }
}

TEST_CASE("Combination parameters are prefixed with child names", "[combination]") {
    auto sum = rbf(1.0) + linear() + rbf(2.0);
    const auto named = sum->named_parameters();
    REQUIRE(named.size() == 5);
    REQUIRE(named[0].first == "rbf_1.variance");
    REQUIRE(named[1].first == "rbf_1.lengthscales");
    REQUIRE(named[2].first == "linear.variance");
    REQUIRE(named[4].first == "rbf_2.lengthscales");
    REQUIRE(named[3].second->scalar() == Catch::Approx(2.0));

    auto& combination = dynamic_cast<libgpcov::Combination&>(*sum);
    REQUIRE(combination.child("linear").type_name() == "Linear");
    REQUIRE_THROWS_AS(combination.child("matern32"), std::invalid_argument);
}

TEST_CASE("Combination input_dim covers every child's columns", "[combination]") {
    auto sum = rbf(1.0, libgpcov::ActiveDims::indices({0})) + linear(libgpcov::ActiveDims::range(2, 3));
    REQUIRE(sum->input_dim() == 5);

    Eigen::MatrixXd X = Eigen::MatrixXd::Random(4, 5);
    const Eigen::MatrixXd expected = rbf(1.0, libgpcov::ActiveDims::indices({0}))->K(X) +
                                     linear(libgpcov::ActiveDims::range(2, 3))->K(X);
    REQUIRE(sum->K(X).isApprox(expected));

    Eigen::MatrixXd narrow = Eigen::MatrixXd::Random(4, 4);
    REQUIRE_THROWS_AS(sum->K(narrow), libgpcov::ShapeError);
}

TEST_CASE("Separate dimensions need explicit disjoint index sets", "[combination]") {
    const libgpcov::Add disjoint(kernel_list(rbf(1.0, libgpcov::ActiveDims::indices({0, 2})),
                                             linear(libgpcov::ActiveDims::indices({1}))));
    REQUIRE(disjoint.on_separate_dimensions());

    const libgpcov::Add overlapping(kernel_list(rbf(1.0, libgpcov::ActiveDims::indices({0, 2})),
                                                linear(libgpcov::ActiveDims::indices({2}))));
    REQUIRE_FALSE(overlapping.on_separate_dimensions());

    const libgpcov::Add ranged(kernel_list(rbf(1.0, libgpcov::ActiveDims::range(1, 0)),
                                           linear(libgpcov::ActiveDims::range(1, 1))));
    REQUIRE_FALSE(ranged.on_separate_dimensions());
}

TEST_CASE("Combination pairwise value reduces the children", "[combination]") {
    const Eigen::MatrixXd X = sample_inputs();
    auto product = rbf(0.5) * linear() * (rbf(1.5) + std::make_unique<libgpcov::White>(3));
    const Eigen::MatrixXd K = product->K(X, X);

    const libgpcov::DualVector x = libgpcov::to_dual(X.row(0));
    const libgpcov::DualVector z = libgpcov::to_dual(X.row(1));
    REQUIRE(autodiff::val(product->K_pair(x, z)) == Catch::Approx(K(0, 1)));
}

TEST_CASE("Combination construction rejects empty or null children", "[combination][errors]") {
    REQUIRE_THROWS_AS(libgpcov::Add(std::vector<std::unique_ptr<libgpcov::Kernel>>{}), libgpcov::InvariantViolation);

    std::vector<std::unique_ptr<libgpcov::Kernel>> with_null;
    with_null.push_back(rbf(1.0));
    with_null.push_back(nullptr);
    REQUIRE_THROWS_AS(libgpcov::Prod(std::move(with_null)), libgpcov::InvariantViolation);
}
