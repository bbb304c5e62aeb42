#pragma once

#include "tree/decision_node.hpp"
#include "tree/node_cache.hpp"
#include "tree/selection.hpp"
#include "identity/state_key.hpp"
#include "item/item.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace kchoice {

/// Where the decision-maker may stop before the knapsack is full.
enum class StopPolicy {
    kRootOnly,   // only at the master node ("take nothing")
    kEveryNode,  // at every non-terminal node
    kNever       // keep deciding while any item fits
};

struct InstanceConfig {
    StopPolicy stop_policy = StopPolicy::kRootOnly;
    double capacity_resolution = 1e-12;  // tick width relative to capacity
    bool prune_dominated = true;         // false: every fitting item is a choice
};

// ─── Knapsack Instance ─────────────────────────────────────────
// Owns the master items, the capacity and the node arena. The master
// node is NodeId 0; every other node is reachable from it.
// Node expansion is lazy and happens at most once per node.

class KnapsackInstance {
public:
    /// Items must carry ids 0..n-1 in order (see makeItems).
    static std::shared_ptr<KnapsackInstance> create(std::vector<Item> items,
                                                    double capacity,
                                                    InstanceConfig config = {});

    static std::shared_ptr<KnapsackInstance> create(const std::vector<double>& values,
                                                    const std::vector<double>& weights,
                                                    double capacity,
                                                    InstanceConfig config = {});

    KnapsackInstance(const KnapsackInstance&) = delete;
    KnapsackInstance& operator=(const KnapsackInstance&) = delete;

    // ── Instance data ──
    const std::vector<Item>& items() const { return items_; }
    size_t itemCount() const { return items_.size(); }
    double capacity() const { return capacity_; }
    const InstanceConfig& config() const { return config_; }

    // ── Navigation ──
    NodeRef root() const;
    NodeRef child(const NodeRef& ref, ItemId item);
    const DecisionNode& node(NodeId id) const { return cache_.get(id); }
    const std::vector<ChildEdge>& children(NodeId id);
    bool isTerminal(NodeId id) const { return cache_.get(id).terminal(); }

    /// True if the explicit stop branch is offered at this node.
    bool offersStop(NodeId id) const;

    // ── Optimum (backward induction, independent of behaviour) ──
    double optimalGain(NodeId id);
    double optimalValue(const NodeRef& ref);
    std::vector<Selection> optimalSelections(const NodeRef& ref);

    /// Suffixes of the terminal nodes reachable from `id` by taking items
    /// only (the stop branch is never followed), sorted. Memoised.
    const std::vector<Selection>& completions(NodeId id);

    /// Every terminal selection reachable from `ref`, sorted.
    std::vector<Selection> terminalSelections(const NodeRef& ref);

    double valueOf(const Selection& selection) const;
    double weightOf(const Selection& selection) const;

    // ── Identity and cache state ──
    uint64_t fingerprint(NodeId id) const { return cache_.get(id).fingerprint; }
    size_t nodeCount() const { return cache_.size(); }
    size_t nodeCacheHits() const { return cache_.hits(); }

    /// Bumped by resetCaches(); lets dependent caches detect invalidation.
    uint64_t generation() const { return generation_.load(); }

    /// Drop every node except a freshly built master node. NodeRefs taken
    /// before the reset are invalid afterwards. Not safe to call while
    /// queries are running.
    void resetCaches();

private:
    KnapsackInstance(std::vector<Item> items, double capacity, InstanceConfig config);

    void buildRoot();
    void expand(DecisionNode& node);
    bool fits(const Item& item, double capacity) const;
    const std::vector<Selection>& optimalSuffixes(NodeId id);

    std::vector<Item> items_;
    double capacity_;
    InstanceConfig config_;
    Canonicalizer canonicalizer_;
    NodeCache cache_;
    std::atomic<uint64_t> generation_{0};
};

} // namespace kchoice
