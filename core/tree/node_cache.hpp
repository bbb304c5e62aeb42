#pragma once

#include "tree/decision_node.hpp"
#include "identity/state_key.hpp"
#include "item/item.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace kchoice {

/// Arena of DecisionNodes indexed by StateKey.
/// Node references stay valid until clear(); children refer to each
/// other by NodeId only. Lookups and insertions are serialised, so
/// a key is materialised at most once even under concurrent queries.
class NodeCache {
public:
    NodeCache() = default;
    NodeCache(const NodeCache&) = delete;
    NodeCache& operator=(const NodeCache&) = delete;

    /// Return the node for `key`, creating it if it is new. A new node's
    /// choosable items are the non-dominated subset of `key.remaining`,
    /// or all of it when `prune` is false.
    /// Throws CacheInconsistencyError if an existing node disagrees with
    /// `capacity` by more than `tick`, or if a new key's fingerprint is
    /// already owned by a different key.
    NodeId intern(const StateKey& key,
                  double capacity,
                  const std::vector<Item>& items,
                  double tick,
                  bool prune = true);

    DecisionNode& get(NodeId id);
    const DecisionNode& get(NodeId id) const;

    size_t size() const;
    size_t hits() const { return hits_.load(); }

    /// Whole-cache invalidation; all NodeIds become invalid.
    void clear();

private:
    mutable std::mutex mutex_;
    std::deque<DecisionNode> nodes_;
    std::unordered_map<StateKey, NodeId, StateKey::Hash> index_;
    std::unordered_map<uint64_t, NodeId> fingerprints_;
    std::atomic<size_t> hits_{0};
};

} // namespace kchoice
