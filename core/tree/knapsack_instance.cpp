#include "tree/knapsack_instance.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace kchoice {

namespace {

// Relative tolerance used to recognise tied optimal gains.
constexpr double kTieTolerance = 1e-12;

bool tiedWith(double a, double b) {
    return std::fabs(a - b) <= kTieTolerance * std::max(1.0, std::fabs(b));
}

} // namespace

std::shared_ptr<KnapsackInstance> KnapsackInstance::create(std::vector<Item> items,
                                                           double capacity,
                                                           InstanceConfig config) {
    if (!std::isfinite(capacity) || capacity < 0.0) {
        throw InfeasibleQueryError("Capacity must be non-negative and finite, got " +
                                   std::to_string(capacity));
    }
    for (size_t i = 0; i < items.size(); i++) {
        if (items[i].id() != i) {
            throw InvalidInstanceError("Item at position " + std::to_string(i) +
                                       " has id " + std::to_string(items[i].id()));
        }
    }
    std::shared_ptr<KnapsackInstance> instance(
        new KnapsackInstance(std::move(items), capacity, config));
    instance->buildRoot();
    return instance;
}

std::shared_ptr<KnapsackInstance> KnapsackInstance::create(const std::vector<double>& values,
                                                           const std::vector<double>& weights,
                                                           double capacity,
                                                           InstanceConfig config) {
    return create(makeItems(values, weights), capacity, config);
}

KnapsackInstance::KnapsackInstance(std::vector<Item> items, double capacity,
                                   InstanceConfig config)
    : items_(std::move(items)),
      capacity_(capacity),
      config_(config),
      canonicalizer_(capacity, config.capacity_resolution) {}

// Allows one tick of slack: an item up to one tick heavier than the
// remaining capacity still fits, matching the StateKey quantisation.
bool KnapsackInstance::fits(const Item& item, double capacity) const {
    return item.weight() <= capacity + canonicalizer_.tickWidth();
}

void KnapsackInstance::buildRoot() {
    std::vector<ItemId> feasible;
    for (const Item& item : items_) {
        if (fits(item, capacity_)) feasible.push_back(item.id());
    }
    StateKey key = canonicalizer_.makeKey(capacity_, feasible);
    cache_.intern(key, capacity_, items_, canonicalizer_.tickWidth(),
                  config_.prune_dominated);
}

void KnapsackInstance::resetCaches() {
    cache_.clear();
    buildRoot();
    generation_++;
}

NodeRef KnapsackInstance::root() const {
    NodeRef ref;
    ref.node = 0;
    ref.included = Selection(items_.size());
    return ref;
}

void KnapsackInstance::expand(DecisionNode& node) {
    std::vector<ChildEdge> edges;
    edges.reserve(node.available.size());

    for (ItemId chosen : node.available) {
        const Item& item = items_[chosen];
        double capacity = std::max(0.0, node.remaining_capacity - item.weight());

        // Dominated items are carried along: once their dominator is
        // in the knapsack they may become choosable.
        std::vector<ItemId> remaining;
        for (ItemId other : node.remaining) {
            if (other != chosen && fits(items_[other], capacity)) {
                remaining.push_back(other);
            }
        }

        StateKey key = canonicalizer_.makeKey(capacity, std::move(remaining));
        NodeId child = cache_.intern(key, capacity, items_, canonicalizer_.tickWidth(),
                                     config_.prune_dominated);
        edges.push_back({chosen, child});
    }

    node.children = std::move(edges);
}

const std::vector<ChildEdge>& KnapsackInstance::children(NodeId id) {
    DecisionNode& node = cache_.get(id);
    std::call_once(node.expand_once, [&]() { expand(node); });
    return node.children;
}

NodeRef KnapsackInstance::child(const NodeRef& ref, ItemId item) {
    for (const ChildEdge& edge : children(ref.node)) {
        if (edge.item != item) continue;
        NodeRef next;
        next.node = edge.child;
        next.included = ref.included.with(item);
        next.included_value = ref.included_value + items_[item].value();
        next.included_weight = ref.included_weight + items_[item].weight();
        return next;
    }
    throw std::out_of_range("Item " + std::to_string(item) +
                            " is not an available choice at node " +
                            std::to_string(ref.node));
}

bool KnapsackInstance::offersStop(NodeId id) const {
    if (cache_.get(id).terminal()) return false;
    switch (config_.stop_policy) {
        case StopPolicy::kRootOnly:  return id == 0;
        case StopPolicy::kEveryNode: return true;
        case StopPolicy::kNever:     return false;
    }
    return false;
}

double KnapsackInstance::optimalGain(NodeId id) {
    DecisionNode& node = cache_.get(id);
    std::call_once(node.optimal_once, [&]() {
        // Excluding everything that remains is always a candidate.
        double best = 0.0;
        if (!node.terminal()) {
            for (const ChildEdge& edge : children(id)) {
                best = std::max(best, items_[edge.item].value() + optimalGain(edge.child));
            }
        }
        node.optimal_gain = best;
    });
    return node.optimal_gain;
}

double KnapsackInstance::optimalValue(const NodeRef& ref) {
    return ref.included_value + optimalGain(ref.node);
}

const std::vector<Selection>& KnapsackInstance::optimalSuffixes(NodeId id) {
    DecisionNode& node = cache_.get(id);
    std::call_once(node.optimal_suffixes_once, [&]() {
        std::set<Selection> suffixes;
        if (node.terminal()) {
            suffixes.insert(Selection(items_.size()));
        } else {
            double best = optimalGain(id);
            if (offersStop(id) && tiedWith(0.0, best)) {
                suffixes.insert(Selection(items_.size()));
            }
            for (const ChildEdge& edge : children(id)) {
                double gain = items_[edge.item].value() + optimalGain(edge.child);
                if (!tiedWith(gain, best)) continue;
                for (const Selection& s : optimalSuffixes(edge.child)) {
                    suffixes.insert(s.with(edge.item));
                }
            }
        }
        node.optimal_suffixes.assign(suffixes.begin(), suffixes.end());
    });
    return node.optimal_suffixes;
}

std::vector<Selection> KnapsackInstance::optimalSelections(const NodeRef& ref) {
    std::vector<Selection> result;
    for (const Selection& suffix : optimalSuffixes(ref.node)) {
        result.push_back(ref.included | suffix);
    }
    std::sort(result.begin(), result.end());
    return result;
}

const std::vector<Selection>& KnapsackInstance::completions(NodeId id) {
    DecisionNode& node = cache_.get(id);
    std::call_once(node.completions_once, [&]() {
        std::set<Selection> suffixes;
        if (node.terminal()) {
            suffixes.insert(Selection(items_.size()));
        } else {
            for (const ChildEdge& edge : children(id)) {
                for (const Selection& s : completions(edge.child)) {
                    suffixes.insert(s.with(edge.item));
                }
            }
        }
        node.completions.assign(suffixes.begin(), suffixes.end());
    });
    return node.completions;
}

std::vector<Selection> KnapsackInstance::terminalSelections(const NodeRef& ref) {
    std::unordered_map<NodeId, std::set<Selection>> memo;

    std::function<const std::set<Selection>&(NodeId)> suffixes =
        [&](NodeId id) -> const std::set<Selection>& {
        auto it = memo.find(id);
        if (it != memo.end()) return it->second;

        std::set<Selection> out;
        if (isTerminal(id) || offersStop(id)) {
            out.insert(Selection(items_.size()));
        }
        if (!isTerminal(id)) {
            for (const ChildEdge& edge : children(id)) {
                for (const Selection& s : suffixes(edge.child)) {
                    out.insert(s.with(edge.item));
                }
            }
        }
        return memo.emplace(id, std::move(out)).first->second;
    };

    std::vector<Selection> result;
    for (const Selection& suffix : suffixes(ref.node)) {
        result.push_back(ref.included | suffix);
    }
    std::sort(result.begin(), result.end());
    return result;
}

double KnapsackInstance::valueOf(const Selection& selection) const {
    double total = 0.0;
    for (size_t i = 0; i < items_.size(); i++) {
        if (selection.test(i)) total += items_[i].value();
    }
    return total;
}

double KnapsackInstance::weightOf(const Selection& selection) const {
    double total = 0.0;
    for (size_t i = 0; i < items_.size(); i++) {
        if (selection.test(i)) total += items_[i].weight();
    }
    return total;
}

} // namespace kchoice
