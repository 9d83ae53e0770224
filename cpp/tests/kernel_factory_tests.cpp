#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "libgpcov/errors.hpp"
#include "libgpcov/kernel_factory.hpp"

TEST_CASE("Kernel factory builds kernels from identifiers", "[factory]") {
    const auto rbf = libgpcov::create_kernel("RBF", 2);
    REQUIRE(rbf->type_name() == "RBF");
    REQUIRE(rbf->input_dim() == 2);

    REQUIRE(libgpcov::create_kernel("squared-exponential", 1)->type_name() == "RBF");
    REQUIRE(libgpcov::create_kernel("Matern52", 1)->type_name() == "Matern52");
    REQUIRE(libgpcov::create_kernel("arc-cosine", 1)->type_name() == "ArcCosine");
    REQUIRE(libgpcov::create_kernel("bias", 1)->type_name() == "Bias");

    const auto sliced = libgpcov::create_kernel("linear", 1, libgpcov::ActiveDims::indices({2}));
    REQUIRE(sliced->active_dims().columns().front() == 2);
}

TEST_CASE("Kernel factory rejects unknown identifiers", "[factory][errors]") {
    REQUIRE_THROWS_AS(libgpcov::create_kernel("spectral_mixture", 1), libgpcov::ConfigurationError);
}

TEST_CASE("Every kernel has a symmetric K with Kdiag on its diagonal", "[factory][kernel]") {
    Eigen::MatrixXd X(4, 2);
    X << 0.2, -0.1,
         0.9, 0.4,
         -0.6, 1.3,
         0.0, 0.5;

    const std::vector<std::string> ids{"white", "constant", "bias", "rbf", "exponential", "matern12", "matern32",
                                       "matern52", "cosine", "linear", "polynomial", "periodic", "arccosine"};
    for (const auto& id : ids) {
        INFO("kernel " << id);
        const auto kernel = libgpcov::create_kernel(id, 2);
        const Eigen::MatrixXd K = kernel->K(X);
        const Eigen::VectorXd diag = kernel->Kdiag(X);
        for (Eigen::Index i = 0; i < X.rows(); ++i) {
            REQUIRE(diag(i) == Catch::Approx(K(i, i)).margin(1e-5));
            for (Eigen::Index j = 0; j < i; ++j) {
                REQUIRE(K(i, j) == Catch::Approx(K(j, i)));
            }
        }
    }
}
