#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "libtune/categorical_distribution.hpp"
#include "libtune/grid.hpp"
#include "libtune/integer_distribution.hpp"
#include "libtune/logging.hpp"
#include "libtune/random_state.hpp"
#include "libtune/real_distribution.hpp"
#include "libtune/sampler.hpp"
#include "libtune/transformer_factory.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace libtune;

namespace {

template <typename T>
std::shared_ptr<T> unconst(std::shared_ptr<const T> ptr) {
    return std::const_pointer_cast<T>(std::move(ptr));
}

TransformerSpec to_transformer_spec(const py::object& obj) {
    if (py::isinstance<py::str>(obj)) {
        return obj.cast<std::string>();
    }
    if (!py::isinstance<Transformer>(obj)) {
        throw std::invalid_argument("transformer must be a name or a Transformer, got " +
                                    py::repr(obj).cast<std::string>());
    }
    return std::shared_ptr<const Transformer>(obj.cast<std::shared_ptr<Transformer>>());
}

PriorSpec to_prior_spec(const py::object& obj) {
    if (py::isinstance<py::str>(obj)) {
        return obj.cast<std::string>();
    }
    if (!py::isinstance<Prior>(obj)) {
        throw std::invalid_argument("prior must be a name or a Prior, got " + py::repr(obj).cast<std::string>());
    }
    return std::shared_ptr<const Prior>(obj.cast<std::shared_ptr<Prior>>());
}

// Follows Python's numeric tower, so numpy scalars are accepted too.
// The ABCs are looked up per call; the import is cached in sys.modules.
std::optional<Value> to_value(py::handle obj) {
    if (py::isinstance<py::str>(obj)) {
        return Value(obj.cast<std::string>());
    }
    const py::module_ numbers = py::module_::import("numbers");
    if (py::isinstance(obj, numbers.attr("Integral"))) {
        return Value(obj.cast<std::int64_t>());
    }
    if (py::isinstance(obj, numbers.attr("Real"))) {
        return Value(obj.cast<double>());
    }
    return std::nullopt;
}

GridSpec to_grid_spec(py::handle obj) {
    if (py::isinstance<Distribution>(obj)) {
        return GridSpec(obj.cast<std::shared_ptr<Distribution>>());
    }
    if (auto value = to_value(obj)) {
        return GridSpec(std::move(*value));
    }
    if (py::isinstance<py::sequence>(obj)) {
        std::vector<GridSpec> items;
        for (auto item : obj.cast<py::sequence>()) {
            items.push_back(to_grid_spec(item));
        }
        return GridSpec(std::move(items));
    }
    throw std::invalid_argument("grid entries must be distributions, numbers, strings or sequences, got " +
                                py::repr(obj).cast<std::string>());
}

py::tuple to_tuple(const Point& point) {
    py::tuple out(point.size());
    for (std::size_t i = 0; i < point.size(); ++i) {
        out[i] = py::cast(point[i]);
    }
    return out;
}

std::vector<Value> to_values(const py::args& args) {
    std::vector<Value> values;
    values.reserve(args.size());
    for (auto item : args) {
        auto value = to_value(item);
        if (!value) {
            throw std::invalid_argument("categories must be numbers or strings");
        }
        values.push_back(std::move(*value));
    }
    return values;
}

}  // namespace

PYBIND11_MODULE(_libtune, m) {
    m.doc() = "libtune python bindings";

    py::enum_<DistributionKind>(m, "DistributionKind")
        .value("Real", DistributionKind::Real)
        .value("Integer", DistributionKind::Integer)
        .value("Categorical", DistributionKind::Categorical)
        .export_values();

    py::class_<Transformer, std::shared_ptr<Transformer>>(m, "Transformer")
        .def_property_readonly("name", &Transformer::name)
        .def_property_readonly("transformed_size", &Transformer::transformed_size)
        .def("fit", [](const Transformer& self, const std::vector<Value>& values) {
            return unconst(self.fit(values));
        })
        .def("transform", &Transformer::transform, py::arg("values"))
        .def("inverse_transform", &Transformer::inverse_transform, py::arg("values"));

    m.def("make_transformer",
          [](const std::string& name, const std::vector<Value>& categories) {
              return unconst(TransformerFactory::create(name, categories));
          },
          py::arg("name"), py::arg("categories") = std::vector<Value>());

    py::class_<Prior, std::shared_ptr<Prior>>(m, "Prior")
        .def_property_readonly("name", &Prior::name)
        .def("rvs", [](const Prior& self, std::size_t n_samples, std::optional<std::uint64_t> random_state) {
            auto rng = make_random_engine(random_state);
            std::vector<double> draws(n_samples);
            for (auto& draw : draws) {
                draw = self.draw(rng);
            }
            return draws;
        }, py::arg("n_samples") = 1, py::arg("random_state") = py::none());

    m.def("uniform_prior", [](double low, double high) { return unconst(make_uniform_prior(low, high)); },
          py::arg("low"), py::arg("high"));
    m.def("uniform_integer_prior",
          [](std::int64_t low, std::int64_t high) { return unconst(make_uniform_integer_prior(low, high)); },
          py::arg("low"), py::arg("high"));
    m.def("normal_prior", [](double mean, double stddev) { return unconst(make_normal_prior(mean, stddev)); },
          py::arg("mean"), py::arg("stddev"));
    m.def("log_uniform_prior", [](double low, double high) { return unconst(make_log_uniform_prior(low, high)); },
          py::arg("low"), py::arg("high"));
    m.def("discrete_prior",
          [](std::vector<double> weights) { return unconst(make_discrete_prior(std::move(weights))); },
          py::arg("weights"));

    py::class_<Distribution, std::shared_ptr<Distribution>>(m, "Distribution")
        .def_property_readonly("kind", &Distribution::kind)
        .def_property_readonly("transformer", [](const Distribution& self) { return unconst(self.transformer()); })
        .def("rvs", [](const Distribution& self, std::optional<std::size_t> n_samples,
                       std::optional<std::uint64_t> random_state) -> py::object {
            auto rng = make_random_engine(random_state);
            if (!n_samples) {
                return py::cast(self.rvs(rng));
            }
            return py::cast(self.rvs(*n_samples, rng));
        }, py::arg("n_samples") = py::none(), py::arg("random_state") = py::none())
        .def("transform", &Distribution::transform, py::arg("values"))
        .def("inverse_transform", &Distribution::inverse_transform, py::arg("values"))
        .def("__repr__", &Distribution::to_string);

    py::class_<Real, Distribution, std::shared_ptr<Real>>(m, "Real")
        .def(py::init([](double low, double high, const py::object& prior, const py::object& transformer) {
                 return std::make_shared<Real>(low, high, to_prior_spec(prior), to_transformer_spec(transformer));
             }),
             py::arg("low"), py::arg("high"), py::arg("prior") = "uniform", py::arg("transformer") = "identity")
        .def_property_readonly("low", &Real::low)
        .def_property_readonly("high", &Real::high);

    py::class_<Integer, Distribution, std::shared_ptr<Integer>>(m, "Integer")
        .def(py::init([](std::int64_t low, std::int64_t high, const py::object& prior, const py::object& transformer) {
                 return std::make_shared<Integer>(low, high, to_prior_spec(prior), to_transformer_spec(transformer));
             }),
             py::arg("low"), py::arg("high"), py::arg("prior") = "uniform", py::arg("transformer") = "identity")
        .def_property_readonly("low", &Integer::low)
        .def_property_readonly("high", &Integer::high);

    py::class_<Categorical, Distribution, std::shared_ptr<Categorical>>(m, "Categorical")
        .def(py::init([](const py::args& categories, std::optional<std::vector<double>> prior,
                         const py::object& transformer) {
                 return std::make_shared<Categorical>(to_values(categories), std::move(prior),
                                                      to_transformer_spec(transformer));
             }),
             py::arg("prior") = py::none(), py::arg("transformer") = "onehot")
        .def_property_readonly("categories", &Categorical::categories)
        .def_property_readonly("probabilities", &Categorical::probabilities);

    m.def("normalize_grid", [](const py::object& grid) {
        py::list out;
        for (const auto& sub_grid : normalize_grid(to_grid_spec(grid))) {
            py::list dimensions;
            for (const auto& distribution : sub_grid) {
                dimensions.append(py::cast(unconst(distribution)));
            }
            out.append(dimensions);
        }
        return out;
    }, py::arg("grid"));

    m.def("sample_points", [](const py::object& grid, std::size_t n_points, std::optional<std::uint64_t> random_state) {
        py::list out;
        for (const auto& point : sample_points(to_grid_spec(grid), n_points, random_state)) {
            out.append(to_tuple(point));
        }
        return out;
    }, py::arg("grid"), py::arg("n_points") = 1, py::arg("random_state") = py::none());

    m.def("set_log_level", &set_log_level, py::arg("level"));
}
