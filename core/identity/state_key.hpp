#pragma once

#include "item/item.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kchoice {

// ─── State Key ─────────────────────────────────────────────────
// Canonical identity of a subproblem: remaining capacity plus the
// set of items not yet included that still fit. Independent of the
// order in which items were included, so every path reaching the
// same subproblem resolves to the same key.
//
// Capacity is quantised to integer ticks so that C - a - b and
// C - b - a compare equal even when floating-point subtraction
// rounds differently.

struct StateKey {
    int64_t capacity_ticks = 0;
    std::vector<ItemId> remaining;  // sorted ascending

    bool operator==(const StateKey& other) const {
        return capacity_ticks == other.capacity_ticks && remaining == other.remaining;
    }
    bool operator!=(const StateKey& other) const { return !(*this == other); }

    /// Process-local hash for unordered containers.
    size_t hash() const;

    /// Canonical text form; the input of the exported fingerprint.
    std::string canonicalText(const std::vector<Item>& items) const;

    /// SHA-256 of canonicalText, truncated to 64 bits.
    uint64_t fingerprint(const std::vector<Item>& items) const;

    struct Hash {
        size_t operator()(const StateKey& key) const noexcept { return key.hash(); }
    };
};

/// Maps capacities onto ticks of a fixed width.
class Canonicalizer {
public:
    /// One tick is `resolution * max(1, master_capacity)`.
    Canonicalizer(double master_capacity, double resolution);

    int64_t ticks(double capacity) const;
    double tickWidth() const { return tick_; }

    /// Build the key; `remaining` need not be sorted.
    StateKey makeKey(double capacity, std::vector<ItemId> remaining) const;

private:
    double tick_;
};

} // namespace kchoice
