#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <memory>
#include <numbers>

#include "libgpcov/combination_kernel.hpp"
#include "libgpcov/differential_kernel.hpp"
#include "libgpcov/errors.hpp"
#include "libgpcov/linear_kernels.hpp"
#include "libgpcov/periodic_kernel.hpp"
#include "libgpcov/static_kernels.hpp"
#include "libgpcov/stationary_kernels.hpp"

namespace {

std::unique_ptr<libgpcov::Kernel> unit_rbf(std::size_t input_dim) {
    return std::make_unique<libgpcov::RBF>(input_dim);
}

}  // namespace

TEST_CASE("Derivative info rows parse into descriptors", "[differential]") {
    Eigen::MatrixXi info(3, 3);
    info << 0, -1, -1,
            1, 2, -1,
            2, 0, 1;
    const auto descriptors = libgpcov::parse_derivative_info(info);
    REQUIRE(descriptors.size() == 3);
    REQUIRE(descriptors[0].count == 0);
    REQUIRE(descriptors[1].count == 1);
    REQUIRE(descriptors[1].dims[0] == 2);
    REQUIRE(descriptors[1].dims[1] == -1);
    REQUIRE(descriptors[2].dims[0] == 0);
    REQUIRE(descriptors[2].dims[1] == 1);

    Eigen::MatrixXi too_high(1, 3);
    too_high << 3, 0, 0;
    REQUIRE_THROWS_AS(libgpcov::parse_derivative_info(too_high), libgpcov::ConfigurationError);

    Eigen::MatrixXi missing_slot(1, 2);
    missing_slot << 2, 0;
    REQUIRE_THROWS_AS(libgpcov::parse_derivative_info(missing_slot), libgpcov::ShapeError);
}

TEST_CASE("Derivative masks decode to count and dimensions", "[differential]") {
    Eigen::MatrixXd mask(4, 3);
    mask << 0, 0, 0,
            0, 1, 0,
            0, 2, 0,
            1, 0, 1;
    const auto descriptors = libgpcov::decode_derivative_mask(mask);
    REQUIRE(descriptors[0].count == 0);
    REQUIRE(descriptors[1].count == 1);
    REQUIRE(descriptors[1].dims[0] == 1);
    REQUIRE(descriptors[2].count == 2);
    REQUIRE(descriptors[2].dims[0] == 1);
    REQUIRE(descriptors[2].dims[1] == 1);
    REQUIRE(descriptors[3].count == 2);
    REQUIRE(descriptors[3].dims[0] == 0);
    REQUIRE(descriptors[3].dims[1] == 2);

    Eigen::MatrixXd third_order(1, 2);
    third_order << 2, 1;
    REQUIRE_THROWS_AS(libgpcov::decode_derivative_mask(third_order), libgpcov::ConfigurationError);

    Eigen::MatrixXd negative(1, 2);
    negative << -1, 1;
    REQUIRE_THROWS_AS(libgpcov::decode_derivative_mask(negative), libgpcov::ConfigurationError);
}

TEST_CASE("Zero-order observations reproduce the base kernel", "[differential]") {
    Eigen::MatrixXd X(3, 2);
    X << 0.1, 0.4,
         -0.5, 1.0,
         0.9, -0.2;

    SECTION("Static layout") {
        const Eigen::MatrixXi info = Eigen::MatrixXi::Zero(3, 3);
        auto base = unit_rbf(2) + std::make_unique<libgpcov::White>(2, 0.1);
        const Eigen::MatrixXd expected = base->K(X);
        const libgpcov::DifferentialObservationsKernelStatic kernel(2, std::move(base), info);
        REQUIRE(kernel.K(X).isApprox(expected));
        REQUIRE(kernel.Kdiag(X).isApprox(expected.diagonal()));
    }

    SECTION("Dynamic layout") {
        Eigen::MatrixXd with_mask = Eigen::MatrixXd::Zero(3, 4);
        with_mask.leftCols(2) = X;
        const libgpcov::DifferentialObservationsKernelDynamic kernel(4, unit_rbf(2), 2);
        REQUIRE(kernel.input_dim() == 4);
        REQUIRE(kernel.K(with_mask).isApprox(libgpcov::RBF(2).K(X)));
    }
}

TEST_CASE("RBF derivative covariances match the analytic expressions", "[differential]") {
    // k(x, z) = exp(-r^2 / 2) with r = x - z.
    const auto k = [](double r) { return std::exp(-0.5 * r * r); };

    Eigen::MatrixXd X(3, 1);
    X << 0.0, 0.5, 1.2;
    Eigen::MatrixXi info(3, 3);
    info << 0, -1, -1,
            1, 0, -1,
            2, 0, 0;
    const libgpcov::DifferentialObservationsKernelStatic kernel(1, unit_rbf(1), info);
    const Eigen::MatrixXd K = kernel.K(X);

    REQUIRE(K(0, 0) == Catch::Approx(1.0));

    const double r01 = -0.5;
    REQUIRE(K(0, 1) == Catch::Approx(r01 * k(r01)));
    REQUIRE(K(1, 0) == Catch::Approx(K(0, 1)));

    REQUIRE(K(1, 1) == Catch::Approx(1.0));

    const double r02 = -1.2;
    REQUIRE(K(0, 2) == Catch::Approx((r02 * r02 - 1.0) * k(r02)));
    REQUIRE(K(2, 0) == Catch::Approx(K(0, 2)));

    const double r12 = -0.7;
    REQUIRE(K(1, 2) == Catch::Approx((3.0 * r12 - r12 * r12 * r12) * k(r12)));
    REQUIRE(K(2, 1) == Catch::Approx(K(1, 2)));

    REQUIRE(K(2, 2) == Catch::Approx(3.0));
    REQUIRE(kernel.Kdiag(X).isApprox(K.diagonal()));
}

TEST_CASE("Fourth order mixed derivatives use every seeded direction", "[differential]") {
    const auto k = [](double r) { return std::exp(-0.5 * r * r); };
    Eigen::MatrixXd X(1, 1);
    X << 0.3;
    Eigen::MatrixXd Z(1, 1);
    Z << -0.4;
    Eigen::MatrixXi second(1, 3);
    second << 2, 0, 0;

    const libgpcov::DifferentialObservationsKernelStatic kernel(1, unit_rbf(1), second, second);
    const double r = 0.7;
    const double r2 = r * r;
    REQUIRE(kernel.K(X, Z)(0, 0) == Catch::Approx((r2 * r2 - 6.0 * r2 + 3.0) * k(r)));
}

TEST_CASE("Static layout uses separate descriptors for X2", "[differential]") {
    Eigen::MatrixXd X(2, 1);
    X << 0.0, 1.0;
    Eigen::MatrixXd X2(1, 1);
    X2 << 0.25;
    Eigen::MatrixXi info_x(2, 2);
    info_x << 0, -1,
              0, -1;
    Eigen::MatrixXi info_x2(1, 2);
    info_x2 << 1, 0;

    const libgpcov::DifferentialObservationsKernelStatic kernel(1, unit_rbf(1), info_x, info_x2);
    const Eigen::MatrixXd K = kernel.K(X, X2);
    REQUIRE(K.rows() == 2);
    REQUIRE(K.cols() == 1);
    // dk/dz = r k
    const double r = 1.0 - 0.25;
    REQUIRE(K(1, 0) == Catch::Approx(r * std::exp(-0.5 * r * r)));

    REQUIRE(kernel.K(X).isApprox(libgpcov::RBF(1).K(X)));
}

TEST_CASE("Dynamic layout differentiates along the masked dimensions", "[differential]") {
    libgpcov::StationaryOptions options;
    options.ard = true;
    options.lengthscales = {1.0, 2.0};
    const libgpcov::DifferentialObservationsKernelDynamic kernel(4, std::make_unique<libgpcov::RBF>(2, options), 2);

    Eigen::MatrixXd X(3, 4);
    X << 0.3, -0.2, 1, 0,
         -0.4, 0.5, 0, 1,
         0.1, 0.1, 0, 2;
    const Eigen::MatrixXd K = kernel.K(X);

    const double r0 = 0.7;
    const double r1 = -0.7;
    const double k01 = std::exp(-0.5 * (r0 * r0 + r1 * r1 / 4.0));
    REQUIRE(K(0, 1) == Catch::Approx(-r0 * r1 / 4.0 * k01));
    REQUIRE(K(1, 0) == Catch::Approx(K(0, 1)));

    // At r = 0: d2k/dx dz = 1 / l^2 and d4k/dx^2 dz^2 = 3 / l^4.
    REQUIRE(K(0, 0) == Catch::Approx(1.0));
    REQUIRE(K(2, 2) == Catch::Approx(3.0 / 16.0));
    REQUIRE(K(1, 1) == Catch::Approx(1.0 / 4.0));
    REQUIRE(kernel.Kdiag(X).isApprox(K.diagonal()));
}

TEST_CASE("Dynamic layout reads the mask from the trailing columns", "[differential]") {
    // dk/dz = r k with r = x - z for the unit RBF.
    const double r = -0.5;
    const double expected = r * std::exp(-0.5 * r * r);

    SECTION("Unused columns between coordinates and mask") {
        const libgpcov::DifferentialObservationsKernelDynamic kernel(3, unit_rbf(1), 1);
        Eigen::MatrixXd X(2, 3);
        X << 0.0, 5.0, 0,
             0.5, -3.0, 1;
        const Eigen::MatrixXd K = kernel.K(X);
        REQUIRE(K(0, 0) == Catch::Approx(1.0));
        REQUIRE(K(0, 1) == Catch::Approx(expected));
        REQUIRE(K(1, 0) == Catch::Approx(expected));
        REQUIRE(K(1, 1) == Catch::Approx(1.0));
    }

    SECTION("Index active dimensions") {
        const libgpcov::DifferentialObservationsKernelDynamic kernel(2, unit_rbf(1), 1,
                                                                     libgpcov::ActiveDims::indices({0, 3}));
        Eigen::MatrixXd X(2, 4);
        X << 0.0, 7.0, 9.0, 0,
             0.5, 7.0, 9.0, 1;
        const Eigen::MatrixXd K = kernel.K(X);
        REQUIRE(K(0, 1) == Catch::Approx(expected));
        REQUIRE(K(1, 1) == Catch::Approx(1.0));
    }
}

TEST_CASE("Polynomial derivative covariances match the analytic expressions", "[differential]") {
    // k(x, z) = (x z + 1)^3
    Eigen::MatrixXd X(2, 1);
    X << 0.5, 2.0;
    Eigen::MatrixXi info(2, 2);
    info << 0, -1,
            1, 0;
    const libgpcov::DifferentialObservationsKernelStatic kernel(1, std::make_unique<libgpcov::Polynomial>(1), info);
    const Eigen::MatrixXd K = kernel.K(X);

    REQUIRE(K(0, 0) == Catch::Approx(1.953125));
    // dk/dz = 3 x (x z + 1)^2
    REQUIRE(K(0, 1) == Catch::Approx(6.0));
    REQUIRE(K(1, 0) == Catch::Approx(6.0));
    // d2k/dx dz = 3 (x z + 1)^2 + 6 x z (x z + 1)
    REQUIRE(K(1, 1) == Catch::Approx(195.0));

    Eigen::MatrixXi curvature(1, 3);
    curvature << 2, 0, 0;
    Eigen::MatrixXi value(1, 2);
    value << 0, -1;
    Eigen::MatrixXd x(1, 1);
    x << 1.0;
    Eigen::MatrixXd z(1, 1);
    z << 0.5;
    const libgpcov::DifferentialObservationsKernelStatic second(1, std::make_unique<libgpcov::Polynomial>(1), curvature,
                                                                value);
    // d2k/dx2 = 6 z^2 (x z + 1)
    REQUIRE(second.K(x, z)(0, 0) == Catch::Approx(2.25));
}

TEST_CASE("Linear derivative covariances are constant", "[differential]") {
    libgpcov::LinearOptions options;
    options.variances = {2.0};
    Eigen::MatrixXd X(2, 1);
    X << 0.5, 1.5;
    Eigen::MatrixXi info(2, 3);
    info << 1, 0, -1,
            2, 0, 0;
    const libgpcov::DifferentialObservationsKernelStatic kernel(1, std::make_unique<libgpcov::Linear>(1, options),
                                                                info);
    const Eigen::MatrixXd K = kernel.K(X);
    REQUIRE(K(0, 0) == Catch::Approx(2.0));
    REQUIRE(K(0, 1) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(K(1, 1) == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("Periodic derivative covariances match the analytic expressions", "[differential]") {
    // k(r) = exp(-sin^2(w r) / 2) with w = pi / 2 and r = x - z.
    libgpcov::PeriodicOptions options;
    options.period = 2.0;
    const double w = std::numbers::pi / 2.0;

    Eigen::MatrixXd X(2, 1);
    X << 0.3, -0.2;
    Eigen::MatrixXi info(2, 2);
    info << 0, -1,
            1, 0;
    const libgpcov::DifferentialObservationsKernelStatic kernel(1, std::make_unique<libgpcov::Periodic>(1, options),
                                                                info);
    const Eigen::MatrixXd K = kernel.K(X);

    // At r = 0.5: dk/dz = (w / 2) sin(2 w r) k = (w / 2) exp(-1 / 4).
    REQUIRE(K(0, 1) == Catch::Approx(0.5 * w * std::exp(-0.25)));
    REQUIRE(K(1, 0) == Catch::Approx(K(0, 1)));
    // At r = 0: d2k/dx dz = w^2.
    REQUIRE(K(1, 1) == Catch::Approx(w * w));
}

TEST_CASE("Product base kernels differentiate through every factor", "[differential][combination]") {
    // k(x, z) = x z exp(-r^2 / 2) with r = x - z.
    Eigen::MatrixXd X(2, 1);
    X << 0.5, 1.0;
    Eigen::MatrixXi info(2, 2);
    info << 0, -1,
            1, 0;
    auto base = unit_rbf(1) * std::make_unique<libgpcov::Linear>(1);
    const libgpcov::DifferentialObservationsKernelStatic kernel(1, std::move(base), info);
    const Eigen::MatrixXd K = kernel.K(X);

    // dk/dz = x exp(-r^2 / 2) (1 + z r)
    REQUIRE(K(0, 1) == Catch::Approx(0.25 * std::exp(-0.125)));
    // d2k/dx dz at x = z = 1 is 2.
    REQUIRE(K(1, 1) == Catch::Approx(2.0));
}

TEST_CASE("Derivatives along columns the base kernel ignores vanish", "[differential][active_dims]") {
    auto base = std::make_unique<libgpcov::RBF>(1, libgpcov::StationaryOptions{}, libgpcov::ActiveDims::indices({1}));
    Eigen::MatrixXd X(2, 2);
    X << 0.2, 0.4,
         0.9, -0.3;
    Eigen::MatrixXi info(2, 2);
    info << 1, 0,
            1, 1;
    const libgpcov::DifferentialObservationsKernelStatic kernel(2, std::move(base), info);
    const Eigen::MatrixXd K = kernel.K(X);

    REQUIRE(K(0, 0) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(K(0, 1) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(K(1, 0) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(K(1, 1) == Catch::Approx(1.0));
}

TEST_CASE("Differential kernels reject inconsistent inputs", "[differential][errors]") {
    Eigen::MatrixXd X(2, 1);
    X << 0.0, 1.0;

    SECTION("Descriptor count differs from row count") {
        const Eigen::MatrixXi info = Eigen::MatrixXi::Zero(3, 2);
        const libgpcov::DifferentialObservationsKernelStatic kernel(1, unit_rbf(1), info);
        REQUIRE_THROWS_AS(kernel.K(X), libgpcov::ShapeError);
    }

    SECTION("Derivative dimension outside the inputs") {
        Eigen::MatrixXi info(2, 2);
        info << 1, 1,
                0, -1;
        const libgpcov::DifferentialObservationsKernelStatic kernel(1, unit_rbf(1), info);
        REQUIRE_THROWS_AS(kernel.K(X), libgpcov::ShapeError);
    }

    SECTION("Dynamic layout without mask columns") {
        const libgpcov::DifferentialObservationsKernelDynamic kernel(2, unit_rbf(1), 1);
        REQUIRE_THROWS_AS(kernel.K(X), libgpcov::ShapeError);
    }

    SECTION("Dynamic layout above second order") {
        const libgpcov::DifferentialObservationsKernelDynamic kernel(2, unit_rbf(1), 1);
        Eigen::MatrixXd masked(1, 2);
        masked << 0.5, 3.0;
        REQUIRE_THROWS_AS(kernel.K(masked), libgpcov::ConfigurationError);
    }

    SECTION("Differential kernels cannot serve as a base kernel") {
        Eigen::MatrixXi info(2, 2);
        info << 1, 0,
                0, -1;
        auto inner = std::make_unique<libgpcov::DifferentialObservationsKernelStatic>(1, unit_rbf(1), info);
        const libgpcov::DifferentialObservationsKernelStatic outer(1, std::move(inner), info);
        REQUIRE_THROWS_AS(outer.K(X), libgpcov::ConfigurationError);
    }

    SECTION("Missing base kernel") {
        REQUIRE_THROWS_AS(libgpcov::DifferentialObservationsKernelDynamic(2, nullptr, 1), libgpcov::InvariantViolation);
    }

    SECTION("Dynamic layout narrower than coordinates plus mask") {
        REQUIRE_THROWS_AS(libgpcov::DifferentialObservationsKernelDynamic(3, unit_rbf(2), 2),
                          libgpcov::InvariantViolation);
        REQUIRE_THROWS_AS(libgpcov::DifferentialObservationsKernelDynamic(2, unit_rbf(1), 0),
                          libgpcov::InvariantViolation);
    }
}
