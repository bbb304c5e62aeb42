#pragma once

#include "distribution/distribution.hpp"
#include "distribution/distribution_cache.hpp"
#include "scoring/scoring.hpp"
#include "tree/knapsack_instance.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace kchoice {

/// One outgoing branch of a node with its normalised probability.
struct Transition {
    bool stop = false;
    ItemId item = 0;        // meaningless when stop
    NodeId child = 0;       // meaningless when stop
    double candidate_gain = 0.0;
    double probability = 0.0;
};

// ─── Distribution Engine ───────────────────────────────────────
// Computes the probability distribution over terminal selections a
// decision-maker reaches from a node. Recursion goes through the
// shared cache, so a subproblem reached by several paths is solved
// once per parameter set.
//
// Candidates at a node are visited in a fixed order (stop first when
// offered, then the available items in id order) and every merge
// accumulates in that order, so repeated queries are bitwise equal.

class DistributionEngine {
public:
    explicit DistributionEngine(std::shared_ptr<KnapsackInstance> instance,
                                std::shared_ptr<ScoringFunction> scoring = makeDefaultScoring(),
                                EngineConfig config = {});

    /// Distribution over full selections (path prefix included) for the
    /// subtree rooted at `ref`. Throws InvalidParameterError,
    /// ScoringError or NumericDriftError.
    Distribution getNodeDistribution(const NodeRef& ref, const ScoringParams& params);

    /// Same, from the master node.
    Distribution getDistribution(const ScoringParams& params);

    /// Outgoing branches of a node with their probabilities.
    std::vector<Transition> transitions(NodeId id, const ScoringParams& params);

    KnapsackInstance& instance() { return *instance_; }
    const std::shared_ptr<KnapsackInstance>& sharedInstance() const { return instance_; }
    const ScoringFunction& scoring() const { return *scoring_; }
    const EngineConfig& config() const { return config_; }

    EngineStats stats() const;

    /// Whole-cache invalidation of the distribution cache.
    void clearCache();

private:
    DistributionCache::Entry suffixDistribution(NodeId id, const ScoringParams& params);
    DistributionCache::Entry computeSuffix(NodeId id, const ScoringParams& params);
    void checkMass(double total, NodeId id) const;
    void syncGeneration();

    std::shared_ptr<KnapsackInstance> instance_;
    std::shared_ptr<ScoringFunction> scoring_;
    EngineConfig config_;
    DistributionCache cache_;
    std::atomic<uint64_t> generation_;
};

} // namespace kchoice
