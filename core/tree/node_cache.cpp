#include "tree/node_cache.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace kchoice {

NodeId NodeCache::intern(const StateKey& key,
                         double capacity,
                         const std::vector<Item>& items,
                         double tick,
                         bool prune) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        const DecisionNode& existing = nodes_[it->second];
        if (std::fabs(existing.remaining_capacity - capacity) > tick) {
            throw CacheInconsistencyError(
                "StateKey maps to node " + std::to_string(existing.id) +
                " with a different remaining capacity");
        }
        hits_++;
        return it->second;
    }

    uint64_t fp = key.fingerprint(items);
    auto fit = fingerprints_.find(fp);
    if (fit != fingerprints_.end()) {
        throw CacheInconsistencyError(
            "Fingerprint collision between node " + std::to_string(fit->second) +
            " and a different subproblem");
    }

    NodeId id = static_cast<NodeId>(nodes_.size());
    nodes_.emplace_back();
    DecisionNode& node = nodes_.back();
    node.id = id;
    node.key = key;
    node.fingerprint = fp;
    node.remaining_capacity = capacity;
    node.remaining = key.remaining;
    node.available = prune ? filterNonDominated(items, key.remaining) : key.remaining;

    index_.emplace(key, id);
    fingerprints_.emplace(fp, id);
    return id;
}

DecisionNode& NodeCache::get(NodeId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id >= nodes_.size()) {
        throw std::out_of_range("Unknown node id: " + std::to_string(id));
    }
    return nodes_[id];
}

const DecisionNode& NodeCache::get(NodeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id >= nodes_.size()) {
        throw std::out_of_range("Unknown node id: " + std::to_string(id));
    }
    return nodes_[id];
}

size_t NodeCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

void NodeCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.clear();
    index_.clear();
    fingerprints_.clear();
    hits_ = 0;
}

} // namespace kchoice
