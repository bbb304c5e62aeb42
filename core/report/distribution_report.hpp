#pragma once

#include "distribution/distribution.hpp"
#include "tree/knapsack_instance.hpp"

#include <cstddef>
#include <vector>

namespace kchoice {

struct SummaryRow {
    Selection selection;
    double value = 0.0;
    double weight = 0.0;
    double probability = 0.0;
    bool optimal = false;  // one of the master node's optimal selections
};

struct DistributionSummary {
    std::vector<SummaryRow> rows;  // probability descending, ties by selection
    double total_mass = 0.0;       // over all terminals, not only kept rows
    size_t terminal_count = 0;     // terminals in the distribution
};

/// Tabulate a distribution. Rows with probability <= `threshold` are
/// dropped; threshold must lie in [0, 1] (InvalidParameterError).
DistributionSummary summarizeDistribution(KnapsackInstance& instance,
                                          const Distribution& distribution,
                                          double threshold = 1e-4);

} // namespace kchoice
