#pragma once

#include "tree/selection.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace kchoice {

/// Terminal selection -> probability mass. Ordered, so iteration and
/// accumulation follow a fixed order and results are reproducible.
using Distribution = std::map<Selection, double>;

/// Sum of all masses, accumulated in key order.
double totalMass(const Distribution& distribution);

/// Mass placed on the given selections (missing ones count as 0).
double massOn(const Distribution& distribution, const std::vector<Selection>& selections);

/// Engine tuning.
struct EngineConfig {
    double tolerance = 1e-9;  // allowed |total mass - 1| after each merge
};

/// Cache counters for diagnostics.
struct EngineStats {
    size_t nodes_created = 0;
    size_t node_cache_hits = 0;
    size_t distributions_computed = 0;
    size_t distribution_cache_hits = 0;
};

} // namespace kchoice
