#include "distribution/exhaustive_search_model.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace kchoice {

namespace {

constexpr double kTieTolerance = 1e-12;

void requireRange(double x, double lo, double hi, bool hi_open, const char* name) {
    bool ok = std::isfinite(x) && x >= lo && (hi_open ? x < hi : x <= hi);
    if (!ok) {
        throw InvalidParameterError(std::string(name) + " must lie in [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) +
                                    (hi_open ? ")" : "]") + ", got " + std::to_string(x));
    }
}

} // namespace

ExhaustiveSearchModel::ExhaustiveSearchModel(std::shared_ptr<KnapsackInstance> instance,
                                             EngineConfig config)
    : instance_(std::move(instance)),
      config_(config),
      generation_(0) {
    if (!instance_) {
        throw InvalidParameterError("ExhaustiveSearchModel: instance is null");
    }
    if (!(config_.tolerance >= 0.0) || !std::isfinite(config_.tolerance)) {
        throw InvalidParameterError("ExhaustiveSearchModel: tolerance must be finite and >= 0");
    }
    generation_ = instance_->generation();
}

void ExhaustiveSearchModel::validate(const ScoringParams& params) {
    if (!std::isfinite(params.alpha) || params.alpha <= 0.0 || params.alpha > 1.0) {
        throw InvalidParameterError("alpha must lie in (0, 1], got " +
                                    std::to_string(params.alpha));
    }
    requireRange(params.beta, 0.0, 1.0, true, "beta");
    requireRange(params.gamma, 0.0, 1.0, true, "gamma");
    requireRange(params.delta, 0.0, 1.0, false, "delta");
}

// ─── Queries ───────────────────────────────────────────────────

Distribution ExhaustiveSearchModel::getNodeDistribution(const NodeRef& ref,
                                                        const ScoringParams& params) {
    validate(params);
    syncGeneration();

    auto suffix = suffixDistribution(ref.node, params);
    Distribution out;
    for (const auto& [selection, mass] : *suffix) {
        out.emplace(ref.included | selection, mass);
    }
    return out;
}

Distribution ExhaustiveSearchModel::getDistribution(const ScoringParams& params) {
    return getNodeDistribution(instance_->root(), params);
}

std::vector<Selection> ExhaustiveSearchModel::nonDominatedCompletions(NodeId id) {
    const auto& all = instance_->completions(id);
    const DecisionNode& node = instance_->node(id);
    const auto& items = instance_->items();

    std::vector<Selection> out;
    for (const Selection& suffix : all) {
        bool clean = true;
        for (ItemId added : node.remaining) {
            if (!suffix.test(added)) continue;
            for (ItemId left : node.remaining) {
                if (!suffix.test(left) && dominates(items[left], items[added])) {
                    clean = false;
                    break;
                }
            }
            if (!clean) break;
        }
        if (clean) out.push_back(suffix);
    }
    return out;
}

EngineStats ExhaustiveSearchModel::stats() const {
    EngineStats s;
    s.nodes_created = instance_->nodeCount();
    s.node_cache_hits = instance_->nodeCacheHits();
    s.distributions_computed = cache_.computed();
    s.distribution_cache_hits = cache_.hits();
    return s;
}

void ExhaustiveSearchModel::clearCache() {
    cache_.clear();
}

// ─── Recursion ─────────────────────────────────────────────────

DistributionCache::Entry ExhaustiveSearchModel::suffixDistribution(NodeId id,
                                                                   const ScoringParams& params) {
    return cache_.getOrCompute(id, params, [this, id, &params]() {
        return computeSuffix(id, params);
    });
}

DistributionCache::Entry ExhaustiveSearchModel::computeSuffix(NodeId id,
                                                              const ScoringParams& params) {
    auto out = std::make_shared<Distribution>();
    const size_t n = instance_->itemCount();
    const auto& items = instance_->items();

    if (instance_->isTerminal(id)) {
        out->emplace(Selection(n), 1.0);
        return out;
    }

    // Search for the optimum among every completion.
    const auto& all = instance_->completions(id);
    std::vector<Selection> non_dominated = nonDominatedCompletions(id);
    std::vector<Selection> optimal = optimalAmong(all);
    std::vector<Selection> optimal_nd;
    for (const Selection& s : optimal) {
        if (std::binary_search(non_dominated.begin(), non_dominated.end(), s)) {
            optimal_nd.push_back(s);
        }
    }

    const double k = (1.0 - params.alpha) / params.alpha;
    const double delta = params.delta;
    double jump = (1.0 - delta) *
                  std::exp((1.0 - static_cast<double>(all.size())) * k);
    double jump_nd = delta *
                     std::exp((1.0 - static_cast<double>(non_dominated.size())) * k);

    for (const Selection& s : optimal) {
        (*out)[s] += jump / static_cast<double>(optimal.size());
    }
    for (const Selection& s : optimal_nd) {
        (*out)[s] += jump_nd / static_cast<double>(optimal_nd.size());
    }

    // Otherwise add an item and search the smaller problem.
    double rest = 1.0 - totalMass(*out);
    if (rest > 0.0) {
        const DecisionNode& node = instance_->node(id);
        std::vector<ItemId> choosable = filterNonDominated(items, node.remaining);
        const auto& edges = instance_->children(id);

        double b = params.beta / (1.0 - params.beta);
        double c = params.gamma / (1.0 - params.gamma);
        std::vector<double> weights;
        std::vector<bool> is_nd;
        double sum_all = 0.0;
        double sum_nd = 0.0;
        for (const ChildEdge& edge : edges) {
            const Item& item = items[edge.item];
            double w = std::pow(item.density(), b) * std::pow(item.weight(), c);
            bool nd = std::find(choosable.begin(), choosable.end(), edge.item) != choosable.end();
            weights.push_back(w);
            is_nd.push_back(nd);
            sum_all += w;
            if (nd) sum_nd += w;
        }
        if (!std::isfinite(sum_all) || !(sum_all > 0.0) ||
            !std::isfinite(sum_nd) || !(sum_nd > 0.0)) {
            std::ostringstream ss;
            ss << "item weights at node " << id << " sum to " << sum_all
               << " (non-dominated " << sum_nd << ")";
            throw NumericDriftError(ss.str());
        }

        for (size_t i = 0; i < edges.size(); i++) {
            double share = (1.0 - delta) * weights[i] / sum_all;
            if (is_nd[i]) share += delta * weights[i] / sum_nd;
            if (share == 0.0) continue;

            auto child = suffixDistribution(edges[i].child, params);
            for (const auto& [selection, mass] : *child) {
                (*out)[selection.with(edges[i].item)] += rest * share * mass;
            }
        }
    }

    double total = totalMass(*out);
    if (!std::isfinite(total) || std::abs(total - 1.0) > config_.tolerance) {
        std::ostringstream ss;
        ss.precision(17);
        ss << "distribution at node " << id << " has total mass " << total
           << " (tolerance " << config_.tolerance << ")";
        throw NumericDriftError(ss.str());
    }
    return out;
}

std::vector<Selection> ExhaustiveSearchModel::optimalAmong(
        const std::vector<Selection>& suffixes) const {
    double best = 0.0;
    for (const Selection& s : suffixes) {
        best = std::max(best, instance_->valueOf(s));
    }
    std::vector<Selection> out;
    for (const Selection& s : suffixes) {
        double v = instance_->valueOf(s);
        if (std::fabs(v - best) <= kTieTolerance * std::max(1.0, best)) out.push_back(s);
    }
    return out;
}

void ExhaustiveSearchModel::syncGeneration() {
    const uint64_t current = instance_->generation();
    if (generation_.exchange(current) != current) {
        cache_.clear();
    }
}

} // namespace kchoice
