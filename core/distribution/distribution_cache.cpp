#include "distribution/distribution_cache.hpp"

namespace kchoice {

DistributionCache::Entry DistributionCache::getOrCompute(NodeId node,
                                                         const ScoringParams& params,
                                                         const Compute& compute) {
    Key key{node, params};
    std::promise<Entry> promise;
    std::shared_future<Entry> future;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            future = it->second;
            hits_++;
        } else {
            future = promise.get_future().share();
            entries_.emplace(key, future);
            owner = true;
        }
    }

    if (owner) {
        // The lock is not held here: computing a node recurses into
        // its children, which are different keys of this same cache.
        try {
            promise.set_value(compute());
            computed_++;
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }

    return future.get();
}

bool DistributionCache::contains(NodeId node, const ScoringParams& params) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(Key{node, params}) > 0;
}

size_t DistributionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void DistributionCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    hits_ = 0;
    computed_ = 0;
}

} // namespace kchoice
