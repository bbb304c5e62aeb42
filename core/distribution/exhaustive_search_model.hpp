#pragma once

#include "distribution/distribution.hpp"
#include "distribution/distribution_cache.hpp"
#include "scoring/scoring.hpp"
#include "tree/knapsack_instance.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace kchoice {

// ─── Exhaustive Search Model ───────────────────────────────────
// Node-level behaviour: at every non-terminal node the decision-maker
// first tries to find the optimum by remembering every completion,
// and only if that fails adds an item and searches again.
//
// At a node with T reachable completions, T_nd of them non-dominated,
// and k = (1 - alpha) / alpha:
//
//   jump      = (1 - delta) * exp((1 - T) * k)     over the optimal completions
//   jump_nd   = delta * exp((1 - T_nd) * k)        over the non-dominated optimal ones
//   rest      = 1 - jump - jump_nd
//
// `rest` is split over the children. A child taking item i receives
//
//   rest * ((1 - delta) * w_i / W_all + delta * [i non-dominated] * w_i / W_nd)
//
// with w_i = density^(beta/(1-beta)) * weight^(gamma/(1-gamma)).
// Each share of mass is spread equally inside its target set.
//
// A completion is non-dominated at a node when none of the items it
// adds is dominated by a remaining item it leaves out. The model never
// follows the stop branch. The two mixtures only differ when the
// instance keeps dominated items as choices, so build the instance with
// `InstanceConfig::prune_dominated = false` (and usually
// `StopPolicy::kNever`) for the full behaviour.
//
// Parameters: alpha in (0, 1], beta and gamma in [0, 1), delta in [0, 1].

class ExhaustiveSearchModel {
public:
    explicit ExhaustiveSearchModel(std::shared_ptr<KnapsackInstance> instance,
                                   EngineConfig config = {});

    /// Throws InvalidParameterError if `params` is outside the domain above.
    static void validate(const ScoringParams& params);

    /// Distribution over full selections (path prefix included) for the
    /// subtree rooted at `ref`.
    Distribution getNodeDistribution(const NodeRef& ref, const ScoringParams& params);
    Distribution getDistribution(const ScoringParams& params);

    /// Completions of `id` that add no item dominated by one left out.
    std::vector<Selection> nonDominatedCompletions(NodeId id);

    KnapsackInstance& instance() { return *instance_; }
    EngineStats stats() const;
    void clearCache();

private:
    DistributionCache::Entry suffixDistribution(NodeId id, const ScoringParams& params);
    DistributionCache::Entry computeSuffix(NodeId id, const ScoringParams& params);
    std::vector<Selection> optimalAmong(const std::vector<Selection>& suffixes) const;
    void syncGeneration();

    std::shared_ptr<KnapsackInstance> instance_;
    EngineConfig config_;
    DistributionCache cache_;
    std::atomic<uint64_t> generation_;
};

} // namespace kchoice
