// PyBind11 bindings for the kchoice core.
// Exposes instances, scoring, the distribution engine and the report API.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DKCHOICE_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "item/item.hpp"
#include "tree/selection.hpp"
#include "tree/decision_node.hpp"
#include "tree/knapsack_instance.hpp"
#include "scoring/scoring.hpp"
#include "scoring/bounded_rational_scoring.hpp"
#include "distribution/distribution.hpp"
#include "distribution/distribution_engine.hpp"
#include "distribution/exhaustive_search_model.hpp"
#include "distribution/decision_variant.hpp"
#include "report/distribution_report.hpp"

namespace py = pybind11;

namespace {

py::tuple selectionToTuple(const kchoice::Selection& selection) {
    auto bits = selection.toBits();
    py::tuple out(bits.size());
    for (size_t i = 0; i < bits.size(); i++) {
        out[i] = bits[i];
    }
    return out;
}

// Lets Python subclasses of ScoringFunction drive the engine.
class PyScoringFunction : public kchoice::ScoringFunction {
public:
    using kchoice::ScoringFunction::ScoringFunction;

    std::string name() const override {
        PYBIND11_OVERRIDE_PURE(std::string, kchoice::ScoringFunction, name);
    }

    void validate(const kchoice::ScoringParams& params) const override {
        PYBIND11_OVERRIDE_PURE(void, kchoice::ScoringFunction, validate, params);
    }

    double score(const kchoice::CandidateContext& ctx,
                 const kchoice::ScoringParams& params) const override {
        PYBIND11_OVERRIDE_PURE(double, kchoice::ScoringFunction, score, ctx, params);
    }
};

py::dict distributionToDict(const kchoice::Distribution& distribution) {
    py::dict out;
    for (const auto& [selection, mass] : distribution) {
        out[selectionToTuple(selection)] = mass;
    }
    return out;
}

} // namespace

PYBIND11_MODULE(kchoice_bindings, m) {
    m.doc() = "kchoice C++ Core Bindings";

    // ── Errors ──
    py::register_exception<kchoice::InvalidInstanceError>(m, "InvalidInstanceError", PyExc_ValueError);
    py::register_exception<kchoice::InfeasibleQueryError>(m, "InfeasibleQueryError", PyExc_ValueError);
    py::register_exception<kchoice::InvalidParameterError>(m, "InvalidParameterError", PyExc_ValueError);
    py::register_exception<kchoice::NumericDriftError>(m, "NumericDriftError", PyExc_ArithmeticError);
    py::register_exception<kchoice::ScoringError>(m, "ScoringError", PyExc_RuntimeError);
    py::register_exception<kchoice::CacheInconsistencyError>(m, "CacheInconsistencyError", PyExc_RuntimeError);

    // ── Item ──
    py::class_<kchoice::Item>(m, "Item")
        .def(py::init<double, double, kchoice::ItemId>(),
             py::arg("value"), py::arg("weight"), py::arg("id"))
        .def_property_readonly("value", &kchoice::Item::value)
        .def_property_readonly("weight", &kchoice::Item::weight)
        .def_property_readonly("density", &kchoice::Item::density)
        .def_property_readonly("id", &kchoice::Item::id)
        .def_property_readonly("fingerprint", &kchoice::Item::fingerprint)
        .def("__repr__", &kchoice::Item::toString);

    m.def("dominates", &kchoice::dominates, py::arg("a"), py::arg("b"));

    // ── StopPolicy / InstanceConfig ──
    py::enum_<kchoice::StopPolicy>(m, "StopPolicy")
        .value("ROOT_ONLY", kchoice::StopPolicy::kRootOnly)
        .value("EVERY_NODE", kchoice::StopPolicy::kEveryNode)
        .value("NEVER", kchoice::StopPolicy::kNever);

    py::class_<kchoice::InstanceConfig>(m, "InstanceConfig")
        .def(py::init<>())
        .def_readwrite("stop_policy", &kchoice::InstanceConfig::stop_policy)
        .def_readwrite("capacity_resolution", &kchoice::InstanceConfig::capacity_resolution)
        .def_readwrite("prune_dominated", &kchoice::InstanceConfig::prune_dominated);

    // ── ChildEdge / NodeRef ──
    py::class_<kchoice::ChildEdge>(m, "ChildEdge")
        .def_readonly("item", &kchoice::ChildEdge::item)
        .def_readonly("child", &kchoice::ChildEdge::child);

    py::class_<kchoice::NodeRef>(m, "NodeRef")
        .def_readonly("node", &kchoice::NodeRef::node)
        .def_readonly("included_value", &kchoice::NodeRef::included_value)
        .def_readonly("included_weight", &kchoice::NodeRef::included_weight)
        .def_property_readonly("included", [](const kchoice::NodeRef& ref) {
            return selectionToTuple(ref.included);
        });

    // ── KnapsackInstance ──
    py::class_<kchoice::KnapsackInstance, std::shared_ptr<kchoice::KnapsackInstance>>(m, "KnapsackInstance")
        .def(py::init([](const std::vector<double>& values, const std::vector<double>& weights,
                         double capacity, const kchoice::InstanceConfig& config) {
                 return kchoice::KnapsackInstance::create(values, weights, capacity, config);
             }),
             py::arg("values"), py::arg("weights"), py::arg("capacity"),
             py::arg("config") = kchoice::InstanceConfig{})
        .def_property_readonly("items", &kchoice::KnapsackInstance::items)
        .def_property_readonly("capacity", &kchoice::KnapsackInstance::capacity)
        .def("root", &kchoice::KnapsackInstance::root)
        .def("child", &kchoice::KnapsackInstance::child, py::arg("ref"), py::arg("item"))
        .def("children", &kchoice::KnapsackInstance::children)
        .def("available", [](const kchoice::KnapsackInstance& self, kchoice::NodeId id) {
            return self.node(id).available;
        })
        .def("is_terminal", &kchoice::KnapsackInstance::isTerminal)
        .def("offers_stop", &kchoice::KnapsackInstance::offersStop)
        .def("fingerprint", &kchoice::KnapsackInstance::fingerprint)
        .def("optimal_value", &kchoice::KnapsackInstance::optimalValue)
        .def("optimal_selections", [](kchoice::KnapsackInstance& self, const kchoice::NodeRef& ref) {
            std::vector<py::tuple> out;
            for (const auto& s : self.optimalSelections(ref)) out.push_back(selectionToTuple(s));
            return out;
        })
        .def("completions", [](kchoice::KnapsackInstance& self, kchoice::NodeId id) {
            std::vector<py::tuple> out;
            for (const auto& s : self.completions(id)) out.push_back(selectionToTuple(s));
            return out;
        })
        .def("node_count", &kchoice::KnapsackInstance::nodeCount)
        .def("reset_caches", &kchoice::KnapsackInstance::resetCaches);

    // ── ScoringParams ──
    py::class_<kchoice::ScoringParams>(m, "ScoringParams")
        .def(py::init<>())
        .def(py::init([](double alpha, double beta, double gamma, double delta) {
                 return kchoice::ScoringParams{alpha, beta, gamma, delta};
             }),
             py::arg("alpha"), py::arg("beta"), py::arg("gamma"), py::arg("delta"))
        .def_readwrite("alpha", &kchoice::ScoringParams::alpha)
        .def_readwrite("beta", &kchoice::ScoringParams::beta)
        .def_readwrite("gamma", &kchoice::ScoringParams::gamma)
        .def_readwrite("delta", &kchoice::ScoringParams::delta);

    // ── Scoring functions ──
    // Read-only view handed to score(); valid only during the call.
    py::class_<kchoice::CandidateContext>(m, "CandidateContext")
        .def_property_readonly("is_stop", &kchoice::CandidateContext::isStop)
        .def_property_readonly("item", [](const kchoice::CandidateContext& ctx) -> py::object {
            if (ctx.isStop()) return py::none();
            return py::cast(*ctx.item);
        })
        .def_property_readonly("node", [](const kchoice::CandidateContext& ctx) {
            return ctx.node->id;
        })
        .def_property_readonly("available", [](const kchoice::CandidateContext& ctx) {
            return ctx.node->available;
        })
        .def_property_readonly("remaining_capacity", [](const kchoice::CandidateContext& ctx) {
            return ctx.node->remaining_capacity;
        })
        .def_readonly("candidate_gain", &kchoice::CandidateContext::candidate_gain)
        .def_readonly("node_gain", &kchoice::CandidateContext::node_gain);

    py::class_<kchoice::ScoringFunction, PyScoringFunction,
               std::shared_ptr<kchoice::ScoringFunction>>(m, "ScoringFunction")
        .def(py::init<>())
        .def("name", &kchoice::ScoringFunction::name)
        .def("validate", &kchoice::ScoringFunction::validate)
        .def("score", &kchoice::ScoringFunction::score, py::arg("ctx"), py::arg("params"));

    py::class_<kchoice::BoundedRationalScoring, kchoice::ScoringFunction,
               std::shared_ptr<kchoice::BoundedRationalScoring>>(m, "BoundedRationalScoring")
        .def(py::init<>());

    py::class_<kchoice::UniformScoring, kchoice::ScoringFunction,
               std::shared_ptr<kchoice::UniformScoring>>(m, "UniformScoring")
        .def(py::init<>());

    // ── EngineConfig / EngineStats ──
    py::class_<kchoice::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("tolerance", &kchoice::EngineConfig::tolerance);

    py::class_<kchoice::EngineStats>(m, "EngineStats")
        .def_readonly("nodes_created", &kchoice::EngineStats::nodes_created)
        .def_readonly("node_cache_hits", &kchoice::EngineStats::node_cache_hits)
        .def_readonly("distributions_computed", &kchoice::EngineStats::distributions_computed)
        .def_readonly("distribution_cache_hits", &kchoice::EngineStats::distribution_cache_hits);

    // ── DistributionEngine ──
    py::class_<kchoice::DistributionEngine>(m, "DistributionEngine")
        .def(py::init<std::shared_ptr<kchoice::KnapsackInstance>,
                      std::shared_ptr<kchoice::ScoringFunction>,
                      kchoice::EngineConfig>(),
             py::arg("instance"),
             py::arg("scoring") = kchoice::makeDefaultScoring(),
             py::arg("config") = kchoice::EngineConfig{},
             py::keep_alive<1, 3>())
        .def("get_node_distribution", [](kchoice::DistributionEngine& self,
                                         const kchoice::NodeRef& ref,
                                         const kchoice::ScoringParams& params) {
            return distributionToDict(self.getNodeDistribution(ref, params));
        }, py::arg("ref"), py::arg("params"))
        .def("get_distribution", [](kchoice::DistributionEngine& self,
                                    const kchoice::ScoringParams& params) {
            return distributionToDict(self.getDistribution(params));
        }, py::arg("params"))
        .def("stats", &kchoice::DistributionEngine::stats)
        .def("clear_cache", &kchoice::DistributionEngine::clearCache);

    // ── ExhaustiveSearchModel ──
    py::class_<kchoice::ExhaustiveSearchModel>(m, "ExhaustiveSearchModel")
        .def(py::init<std::shared_ptr<kchoice::KnapsackInstance>, kchoice::EngineConfig>(),
             py::arg("instance"), py::arg("config") = kchoice::EngineConfig{})
        .def("get_node_distribution", [](kchoice::ExhaustiveSearchModel& self,
                                         const kchoice::NodeRef& ref,
                                         const kchoice::ScoringParams& params) {
            return distributionToDict(self.getNodeDistribution(ref, params));
        }, py::arg("ref"), py::arg("params"))
        .def("get_distribution", [](kchoice::ExhaustiveSearchModel& self,
                                    const kchoice::ScoringParams& params) {
            return distributionToDict(self.getDistribution(params));
        }, py::arg("params"))
        .def("stats", &kchoice::ExhaustiveSearchModel::stats)
        .def("clear_cache", &kchoice::ExhaustiveSearchModel::clearCache);

    // ── Decision variant ──
    m.def("solve_decision_variant", [](kchoice::DistributionEngine& engine,
                                       const kchoice::NodeRef& ref,
                                       const kchoice::ScoringParams& params,
                                       double target) {
        auto result = kchoice::solveDecisionVariant(engine, ref, params, target);
        py::dict out;
        out["reachable"] = result.reachable;
        out["witness_probability"] = result.witness_probability;
        out["optimal_value"] = result.optimal_value;
        out["witnesses"] = distributionToDict(result.witnesses);
        return out;
    }, py::arg("engine"), py::arg("ref"), py::arg("params"), py::arg("target"));

    // ── Summary ──
    m.def("summarize_distribution", [](kchoice::DistributionEngine& engine,
                                       const kchoice::ScoringParams& params,
                                       double threshold) {
        auto dist = engine.getDistribution(params);
        auto summary = kchoice::summarizeDistribution(engine.instance(), dist, threshold);
        py::list rows;
        for (const auto& row : summary.rows) {
            py::dict r;
            r["selection"] = selectionToTuple(row.selection);
            r["value"] = row.value;
            r["weight"] = row.weight;
            r["probability"] = row.probability;
            r["optimal"] = row.optimal;
            rows.append(r);
        }
        py::dict out;
        out["rows"] = rows;
        out["total_mass"] = summary.total_mass;
        out["terminal_count"] = summary.terminal_count;
        return out;
    }, py::arg("engine"), py::arg("params"), py::arg("threshold") = 1e-4);
}
