#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "libgpcov/active_dims.hpp"
#include "libgpcov/arc_cosine_kernel.hpp"
#include "libgpcov/combination_kernel.hpp"
#include "libgpcov/coregion_kernel.hpp"
#include "libgpcov/differential_kernel.hpp"
#include "libgpcov/errors.hpp"
#include "libgpcov/kernel_factory.hpp"
#include "libgpcov/linear_kernels.hpp"
#include "libgpcov/numerics_settings.hpp"
#include "libgpcov/periodic_kernel.hpp"
#include "libgpcov/quadrature.hpp"
#include "libgpcov/static_kernels.hpp"
#include "libgpcov/stationary_kernels.hpp"

namespace py = pybind11;
using namespace libgpcov;

namespace {

// (kernel id, active columns) pairs as passed from Python.
using ChildSpec = std::tuple<std::string, std::vector<std::size_t>>;

std::optional<ActiveDims> to_active_dims(const std::optional<std::vector<std::size_t>>& columns) {
    if (!columns) {
        return std::nullopt;
    }
    return ActiveDims::indices(*columns);
}

std::vector<std::unique_ptr<Kernel>> build_children(const std::vector<ChildSpec>& specs) {
    std::vector<std::unique_ptr<Kernel>> children;
    children.reserve(specs.size());
    for (const auto& [id, columns] : specs) {
        children.push_back(create_kernel(id, columns.size(), ActiveDims::indices(columns)));
    }
    return children;
}

std::vector<std::pair<std::string, Eigen::MatrixXd>> parameter_values(const Kernel& kernel) {
    std::vector<std::pair<std::string, Eigen::MatrixXd>> values;
    for (const auto& [name, parameter] : kernel.named_parameters()) {
        values.emplace_back(name, parameter->value());
    }
    return values;
}

}  // namespace

PYBIND11_MODULE(_libgpcov, m) {
    m.doc() = "libgpcov python bindings";

    py::register_exception<ShapeError>(m, "ShapeError", PyExc_ValueError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_RuntimeError);
    py::register_exception<InvariantViolation>(m, "InvariantViolation", PyExc_ValueError);

    py::enum_<QuadraturePolicy>(m, "QuadraturePolicy")
        .value("Allow", QuadraturePolicy::Allow)
        .value("Warn", QuadraturePolicy::Warn)
        .value("Error", QuadraturePolicy::Error)
        .export_values();

    py::enum_<ParameterConstraint>(m, "ParameterConstraint")
        .value("Free", ParameterConstraint::Free)
        .value("Positive", ParameterConstraint::Positive)
        .export_values();

    m.def("get_quadrature_policy", []() { return numerics_settings().quadrature_policy; });
    m.def("set_quadrature_policy", [](QuadraturePolicy policy) { numerics_settings().quadrature_policy = policy; });
    m.def("parse_quadrature_policy", &parse_quadrature_policy, py::arg("id"));

    m.def("hermgauss", [](std::size_t points) {
        const GaussHermiteRule rule = hermgauss(points);
        return std::make_pair(rule.nodes, rule.weights);
    }, py::arg("points"));
    m.def("mvhermgauss", [](std::size_t points, std::size_t dim) {
        const GaussHermiteGrid grid = mvhermgauss(points, dim);
        return std::make_pair(grid.nodes, grid.weights);
    }, py::arg("points"), py::arg("dim"));

    py::class_<Kernel>(m, "Kernel")
        .def_property_readonly("input_dim", &Kernel::input_dim)
        .def_property_readonly("name", &Kernel::type_name)
        .def_property("num_gauss_hermite_points", &Kernel::num_gauss_hermite_points,
                      &Kernel::set_num_gauss_hermite_points)
        .def("K", py::overload_cast<const Eigen::MatrixXd&, bool>(&Kernel::K, py::const_),
             py::arg("X"), py::arg("presliced") = false)
        .def("K", py::overload_cast<const Eigen::MatrixXd&, const Eigen::MatrixXd&, bool>(&Kernel::K, py::const_),
             py::arg("X"), py::arg("X2"), py::arg("presliced") = false)
        .def("Kdiag", &Kernel::Kdiag, py::arg("X"), py::arg("presliced") = false)
        .def("parameters", &parameter_values)
        .def("eKdiag", [](const Kernel& k, const Eigen::MatrixXd& Xmu, const CovarianceBatch& Xcov) {
            return k.eKdiag(Xmu, Xcov);
        }, py::arg("Xmu"), py::arg("Xcov"))
        .def("eKdiag", [](const Kernel& k, const Eigen::MatrixXd& Xmu, const Eigen::MatrixXd& Xvar) {
            return k.eKdiag(Xmu, Xvar);
        }, py::arg("Xmu"), py::arg("Xvar"))
        .def("eKxz", [](const Kernel& k, const Eigen::MatrixXd& Z, const Eigen::MatrixXd& Xmu,
                        const CovarianceBatch& Xcov) { return k.eKxz(Z, Xmu, Xcov); },
             py::arg("Z"), py::arg("Xmu"), py::arg("Xcov"))
        .def("eKxz", [](const Kernel& k, const Eigen::MatrixXd& Z, const Eigen::MatrixXd& Xmu,
                        const Eigen::MatrixXd& Xvar) { return k.eKxz(Z, Xmu, Xvar); },
             py::arg("Z"), py::arg("Xmu"), py::arg("Xvar"))
        .def("eKzxKxz", [](const Kernel& k, const Eigen::MatrixXd& Z, const Eigen::MatrixXd& Xmu,
                           const CovarianceBatch& Xcov) { return k.eKzxKxz(Z, Xmu, Xcov); },
             py::arg("Z"), py::arg("Xmu"), py::arg("Xcov"))
        .def("exKxz", [](const Kernel& k, const Eigen::MatrixXd& Z, const Eigen::MatrixXd& Xmu,
                         const CovarianceBatch& marginal, const CovarianceBatch& cross) {
            return k.exKxz(Z, Xmu, MarkovCovariance{marginal, cross});
        }, py::arg("Z"), py::arg("Xmu"), py::arg("marginal"), py::arg("cross"));

    py::class_<StationaryOptions>(m, "StationaryOptions")
        .def(py::init<>())
        .def_readwrite("variance", &StationaryOptions::variance)
        .def_readwrite("lengthscales", &StationaryOptions::lengthscales)
        .def_readwrite("ard", &StationaryOptions::ard);

    py::class_<RBF, Kernel>(m, "RBF")
        .def(py::init([](std::size_t input_dim, const StationaryOptions& options,
                         const std::optional<std::vector<std::size_t>>& active_dims) {
            return std::make_unique<RBF>(input_dim, options, to_active_dims(active_dims));
        }), py::arg("input_dim"), py::arg("options") = StationaryOptions{}, py::arg("active_dims") = py::none());

    py::class_<Coregion, Kernel>(m, "Coregion")
        .def(py::init([](std::size_t output_dim, std::size_t rank,
                         const std::optional<std::vector<std::size_t>>& active_dims) {
            return std::make_unique<Coregion>(1, output_dim, rank, to_active_dims(active_dims));
        }), py::arg("output_dim"), py::arg("rank"), py::arg("active_dims") = py::none())
        .def("set_W", [](Coregion& k, const Eigen::MatrixXd& W) { k.W().set_value(W); }, py::arg("W"))
        .def("set_kappa", [](Coregion& k, const Eigen::VectorXd& kappa) { k.kappa().set_value(kappa); },
             py::arg("kappa"))
        .def_property_readonly("B", &Coregion::B);

    py::class_<Combination, Kernel>(m, "Combination")
        .def_property_readonly("child_names", &Combination::child_names)
        .def("on_separate_dimensions", &Combination::on_separate_dimensions);

    py::class_<Add, Combination>(m, "Add")
        .def(py::init([](const std::vector<ChildSpec>& children) {
            return std::make_unique<Add>(build_children(children));
        }), py::arg("children"));

    py::class_<Prod, Combination>(m, "Prod")
        .def(py::init([](const std::vector<ChildSpec>& children) {
            return std::make_unique<Prod>(build_children(children));
        }), py::arg("children"));

    py::class_<DifferentialObservationsKernelDynamic, Kernel>(m, "DifferentialObservationsKernelDynamic")
        .def(py::init([](std::size_t input_dim, const std::string& base, std::size_t obs_dims) {
            return std::make_unique<DifferentialObservationsKernelDynamic>(input_dim, create_kernel(base, obs_dims),
                                                                           obs_dims);
        }), py::arg("input_dim"), py::arg("base"), py::arg("obs_dims"));

    py::class_<DifferentialObservationsKernelStatic, Kernel>(m, "DifferentialObservationsKernelStatic")
        .def(py::init([](const std::string& base, std::size_t input_dim, const Eigen::MatrixXi& info_x,
                         const std::optional<Eigen::MatrixXi>& info_x2) {
            return std::make_unique<DifferentialObservationsKernelStatic>(input_dim, create_kernel(base, input_dim),
                                                                          info_x, info_x2);
        }), py::arg("base"), py::arg("input_dim"), py::arg("derivative_info_x"),
            py::arg("derivative_info_x2") = py::none());

    m.def("create_kernel", [](const std::string& id, std::size_t input_dim,
                              const std::optional<std::vector<std::size_t>>& active_dims) {
        return create_kernel(id, input_dim, to_active_dims(active_dims));
    }, py::arg("id"), py::arg("input_dim"), py::arg("active_dims") = py::none());
}
