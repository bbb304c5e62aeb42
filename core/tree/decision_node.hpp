#pragma once

#include "identity/state_key.hpp"
#include "item/item.hpp"
#include "tree/selection.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace kchoice {

using NodeId = uint32_t;

/// Edge of the decision tree: including `item` leads to `child`.
struct ChildEdge {
    ItemId item = 0;
    NodeId child = 0;
};

// ─── Decision Node ─────────────────────────────────────────────
// A subproblem in the search tree, stored once in the NodeCache arena
// and shared by every path that reaches the same StateKey. Path state
// (the items included so far) is not part of the node; see NodeRef.
//
// Invariants:
// - `remaining` holds every item not yet included that still fits.
// - `available` is the non-dominated subset of `remaining`: the items
//   a decision-maker actually chooses between. A dominated item stays
//   in `remaining` and becomes choosable once its dominator is taken.
//   With pruning disabled, `available` equals `remaining`.
// - `children` is written once, inside `expand_once`, and never
//   mutated afterwards.

struct DecisionNode {
    NodeId id = 0;
    StateKey key;
    uint64_t fingerprint = 0;
    double remaining_capacity = 0.0;
    std::vector<ItemId> remaining;      // master item order
    std::vector<ItemId> available;      // master item order

    std::vector<ChildEdge> children;    // lazily expanded
    std::once_flag expand_once;

    double optimal_gain = 0.0;          // best value addable from here
    std::once_flag optimal_once;

    std::vector<Selection> optimal_suffixes;
    std::once_flag optimal_suffixes_once;

    std::vector<Selection> completions;   // terminal suffixes, no stop
    std::once_flag completions_once;

    bool terminal() const { return available.empty(); }
};

/// A node seen from one particular path: the shared subproblem plus
/// the items included on the way down from the master node.
struct NodeRef {
    NodeId node = 0;
    Selection included;
    double included_value = 0.0;
    double included_weight = 0.0;
};

} // namespace kchoice
