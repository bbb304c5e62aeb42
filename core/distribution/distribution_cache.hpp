#pragma once

#include "distribution/distribution.hpp"
#include "scoring/scoring.hpp"
#include "tree/decision_node.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace kchoice {

/// Memo of suffix distributions keyed by (node, parameters).
/// A NodeId is 1:1 with a StateKey inside one instance, so every path
/// that reaches the same subproblem shares the entry.
///
/// Compute-once: the first caller of a key computes it; concurrent
/// callers of the same key wait for that result instead of computing
/// it again. A failed computation is stored and rethrown to every
/// caller of the key.
class DistributionCache {
public:
    using Entry = std::shared_ptr<const Distribution>;
    using Compute = std::function<Entry()>;

    Entry getOrCompute(NodeId node, const ScoringParams& params, const Compute& compute);

    bool contains(NodeId node, const ScoringParams& params) const;
    size_t size() const;
    size_t hits() const { return hits_.load(); }
    size_t computed() const { return computed_.load(); }

    /// Whole-cache invalidation.
    void clear();

private:
    struct Key {
        NodeId node = 0;
        ScoringParams params;

        bool operator==(const Key& other) const {
            return node == other.node && params == other.params;
        }
    };

    struct KeyHash {
        size_t operator()(const Key& key) const noexcept {
            size_t h = ScoringParams::Hash{}(key.params);
            return h ^ (static_cast<size_t>(key.node) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<Key, std::shared_future<Entry>, KeyHash> entries_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> computed_{0};
};

} // namespace kchoice
