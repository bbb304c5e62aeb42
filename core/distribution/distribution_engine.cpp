#include "distribution/distribution_engine.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace kchoice {

DistributionEngine::DistributionEngine(std::shared_ptr<KnapsackInstance> instance,
                                       std::shared_ptr<ScoringFunction> scoring,
                                       EngineConfig config)
    : instance_(std::move(instance)),
      scoring_(std::move(scoring)),
      config_(config),
      generation_(0) {
    if (!instance_) {
        throw InvalidParameterError("DistributionEngine: instance is null");
    }
    if (!scoring_) {
        throw InvalidParameterError("DistributionEngine: scoring function is null");
    }
    if (!(config_.tolerance >= 0.0) || !std::isfinite(config_.tolerance)) {
        throw InvalidParameterError("DistributionEngine: tolerance must be finite and >= 0");
    }
    generation_ = instance_->generation();
}

// ─── Queries ───────────────────────────────────────────────────

Distribution DistributionEngine::getNodeDistribution(const NodeRef& ref,
                                                     const ScoringParams& params) {
    scoring_->validate(params);
    syncGeneration();

    auto suffix = suffixDistribution(ref.node, params);

    // Suffix items are never in ref.included, so the union is injective
    // and masses carry over one-to-one.
    Distribution out;
    for (const auto& [selection, mass] : *suffix) {
        out.emplace(ref.included | selection, mass);
    }
    return out;
}

Distribution DistributionEngine::getDistribution(const ScoringParams& params) {
    return getNodeDistribution(instance_->root(), params);
}

std::vector<Transition> DistributionEngine::transitions(NodeId id, const ScoringParams& params) {
    std::vector<Transition> out;
    const DecisionNode& node = instance_->node(id);
    if (node.terminal()) return out;

    const auto& edges = instance_->children(id);
    const double node_gain = instance_->optimalGain(id);

    if (instance_->offersStop(id)) {
        Transition stop;
        stop.stop = true;
        stop.candidate_gain = 0.0;
        out.push_back(stop);
    }
    for (const ChildEdge& edge : edges) {
        Transition t;
        t.item = edge.item;
        t.child = edge.child;
        t.candidate_gain = instance_->items()[edge.item].value() + instance_->optimalGain(edge.child);
        out.push_back(t);
    }

    CandidateContext ctx;
    ctx.items = &instance_->items();
    ctx.node = &node;
    ctx.node_gain = node_gain;

    double sum = 0.0;
    for (Transition& t : out) {
        ctx.item = t.stop ? nullptr : &instance_->items()[t.item];
        ctx.candidate_gain = t.candidate_gain;
        double w = scoring_->score(ctx, params);
        if (!std::isfinite(w) || w < 0.0) {
            std::ostringstream ss;
            ss << scoring_->name() << " returned weight " << w << " at node " << id
               << (t.stop ? " for stop" : " for item " + std::to_string(t.item));
            throw ScoringError(ss.str());
        }
        t.probability = w;
        sum += w;
    }

    if (!std::isfinite(sum) || !(sum > 0.0)) {
        std::ostringstream ss;
        ss << "weights at node " << id << " sum to " << sum;
        throw NumericDriftError(ss.str());
    }
    for (Transition& t : out) {
        t.probability /= sum;
    }
    return out;
}

EngineStats DistributionEngine::stats() const {
    EngineStats s;
    s.nodes_created = instance_->nodeCount();
    s.node_cache_hits = instance_->nodeCacheHits();
    s.distributions_computed = cache_.computed();
    s.distribution_cache_hits = cache_.hits();
    return s;
}

void DistributionEngine::clearCache() {
    cache_.clear();
}

// ─── Recursion ─────────────────────────────────────────────────

DistributionCache::Entry DistributionEngine::suffixDistribution(NodeId id,
                                                                const ScoringParams& params) {
    return cache_.getOrCompute(id, params, [this, id, &params]() {
        return computeSuffix(id, params);
    });
}

DistributionCache::Entry DistributionEngine::computeSuffix(NodeId id, const ScoringParams& params) {
    auto out = std::make_shared<Distribution>();
    const size_t n = instance_->itemCount();

    if (instance_->isTerminal(id)) {
        out->emplace(Selection(n), 1.0);
        return out;
    }

    // Different inclusion orders reach the same terminal set through
    // different children, so contributions are summed.
    for (const Transition& t : transitions(id, params)) {
        if (t.stop) {
            (*out)[Selection(n)] += t.probability;
            continue;
        }
        auto child = suffixDistribution(t.child, params);
        for (const auto& [selection, mass] : *child) {
            (*out)[selection.with(t.item)] += t.probability * mass;
        }
    }

    checkMass(totalMass(*out), id);
    return out;
}

void DistributionEngine::checkMass(double total, NodeId id) const {
    if (!std::isfinite(total) || std::abs(total - 1.0) > config_.tolerance) {
        std::ostringstream ss;
        ss.precision(17);
        ss << "distribution at node " << id << " has total mass " << total
           << " (tolerance " << config_.tolerance << ")";
        throw NumericDriftError(ss.str());
    }
}

void DistributionEngine::syncGeneration() {
    const uint64_t current = instance_->generation();
    if (generation_.exchange(current) != current) {
        cache_.clear();
    }
}

} // namespace kchoice
