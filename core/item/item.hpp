#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kchoice {

using ItemId = uint32_t;

/// An immutable knapsack item.
/// `id` is the position in the master instance; it is used for output
/// ordering, identity and the dominance tie-break, never for value
/// comparisons.
class Item {
public:
    Item(double value, double weight, ItemId id);

    double value() const { return value_; }
    double weight() const { return weight_; }
    double density() const { return density_; }
    ItemId id() const { return id_; }

    /// Stable 64-bit identity derived from SHA-256 of "value,weight,id".
    uint64_t fingerprint() const { return fingerprint_; }

    std::string toString() const;

private:
    double value_;
    double weight_;
    double density_;
    ItemId id_;
    uint64_t fingerprint_;
};

/// Build items with ids 0..n-1 in input order.
std::vector<Item> makeItems(const std::vector<double>& values,
                            const std::vector<double>& weights);

// ─── Dominance ─────────────────────────────────────────────────

/// Value/weight equality. Not an identity: two items with equal
/// attributes are still distinct items.
bool sameAttributes(const Item& a, const Item& b);

/// True iff `a` dominates `b`: value(a) >= value(b) and
/// weight(a) <= weight(b) with at least one strict. Exact ties are
/// broken by creation order, so the earlier item dominates.
bool dominates(const Item& a, const Item& b);

/// Reduce `candidates` (ids into `items`) to its non-dominated antichain.
/// Input order is preserved.
std::vector<ItemId> filterNonDominated(const std::vector<Item>& items,
                                       const std::vector<ItemId>& candidates);

} // namespace kchoice
