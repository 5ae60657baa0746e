#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "plaid/plaid.hpp"
#include "pybind_utils.hpp"

namespace plaid {
using core::CumulativeDistributionCache;
using evaluation::PreferenceMatrix;
using interleaving::InterleavedResult;
using interleaving::ProbabilisticU64;
using search::ProbabilisticConfig;

using DocType = std::uint64_t;

PYBIND11_MODULE(libplaid, m) {
    m.doc() = "Python bindings for the plaid library";

    auto m_configs = m.def_submodule("configs", "Configs submodule");
    py::class_<ProbabilisticConfig>(m_configs, "ProbabilisticConfig")
        .def(py::init<double, std::optional<std::uint32_t>>(),
             py::arg("tau") = kDefaultTau, py::arg("seed") = py::none())
        .def_property_readonly("tau", &ProbabilisticConfig::get_tau)
        .def_property_readonly("seed", &ProbabilisticConfig::get_seed)
        .def_property_readonly("has_fixed_seed",
                               &ProbabilisticConfig::has_fixed_seed);

    auto m_core = m.def_submodule("core", "Core submodule");
    py::class_<CumulativeDistributionCache,
               std::shared_ptr<CumulativeDistributionCache>>(
        m_core, "CumulativeDistributionCache")
        .def(py::init<>())
        .def(
            "table",
            [](CumulativeDistributionCache& self, double tau, SizeType n) {
                return as_pyarray_ref(self.table(tau, n));
            },
            py::arg("tau"), py::arg("n"))
        .def_property_readonly("ntables", &CumulativeDistributionCache::ntables);
    m_core.def(
        "cumulative_table",
        [](double tau, SizeType n) {
            CumulativeDistributionCache cache;
            return as_pyarray_ref(cache.table(tau, n));
        },
        py::arg("tau"), py::arg("n"));

    auto m_interleaving =
        m.def_submodule("interleaving", "Interleaving submodule");
    py::class_<InterleavedResult<DocType>>(m_interleaving, "InterleavedResult")
        .def_property_readonly("documents",
                               [](const InterleavedResult<DocType>& self) {
                                   return as_pyarray_ref(self.get_documents());
                               })
        .def_property_readonly(
            "ranker_indices",
            [](const InterleavedResult<DocType>& self) {
                return as_pyarray_ref(self.get_ranker_indices());
            })
        .def_property_readonly("nrankers",
                               &InterleavedResult<DocType>::get_nrankers)
        .def("__len__", &InterleavedResult<DocType>::size);

    py::class_<ProbabilisticU64>(m_interleaving, "Probabilistic")
        .def(py::init<double>(), py::arg("tau") = kDefaultTau)
        .def(py::init<const ProbabilisticConfig&,
                      std::shared_ptr<CumulativeDistributionCache>>(),
             py::arg("cfg"), py::arg("cache") = nullptr)
        .def_property_readonly("tau", &ProbabilisticU64::get_tau)
        .def_property_readonly("seed", &ProbabilisticU64::get_seed)
        .def("reseed", &ProbabilisticU64::reseed, py::arg("seed"))
        .def(
            "interleave",
            [](ProbabilisticU64& self, SizeType k, const PyArrayT<DocType>& a,
               const PyArrayT<DocType>& b) {
                return self.interleave(k, to_span<DocType>(a),
                                       to_span<DocType>(b));
            },
            py::arg("k"), py::arg("a"), py::arg("b"))
        .def(
            "multileave",
            [](ProbabilisticU64& self, SizeType k, const py::list& lists) {
                const auto rankings = as_vector_of_vectors<DocType>(lists);
                return self.multileave(
                    k, std::span<const std::vector<DocType>>(rankings));
            },
            py::arg("k"), py::arg("lists"))
        .def(
            "evaluate",
            [](const ProbabilisticU64& self,
               const InterleavedResult<DocType>& result,
               const PyArrayT<SizeType>& clicks) {
                return self.evaluate(result, to_span<SizeType>(clicks));
            },
            py::arg("result"), py::arg("clicks"));

    auto m_evaluation = m.def_submodule("evaluation", "Evaluation submodule");
    py::class_<PreferenceMatrix>(m_evaluation, "PreferenceMatrix")
        .def(py::init<SizeType>(), py::arg("nrankers"))
        .def("add", &PreferenceMatrix::add, py::arg("outcome"))
        .def("reset", &PreferenceMatrix::reset)
        .def("wins",
             py::overload_cast<SizeType, SizeType>(&PreferenceMatrix::get_wins,
                                                   py::const_),
             py::arg("winner"), py::arg("loser"))
        .def("win_rate", &PreferenceMatrix::win_rate, py::arg("i"),
             py::arg("j"))
        .def_property_readonly("nrankers", &PreferenceMatrix::get_nrankers)
        .def_property_readonly("nimpressions",
                               &PreferenceMatrix::get_nimpressions);

    // Translate library errors into ValueError on the python side
    py::register_exception<error_check::DetailedException>(m, "PlaidError",
                                                           PyExc_ValueError);
}

} // namespace plaid
