#include "report/distribution_report.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>

namespace kchoice {

DistributionSummary summarizeDistribution(KnapsackInstance& instance,
                                          const Distribution& distribution,
                                          double threshold) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw InvalidParameterError("Summary threshold must lie in [0, 1], got " +
                                    std::to_string(threshold));
    }

    auto optimal = instance.optimalSelections(instance.root());
    std::set<Selection> optimal_set(optimal.begin(), optimal.end());

    DistributionSummary summary;
    summary.terminal_count = distribution.size();
    summary.total_mass = totalMass(distribution);

    for (const auto& [selection, mass] : distribution) {
        if (!(mass > threshold)) continue;
        SummaryRow row;
        row.selection = selection;
        row.value = instance.valueOf(selection);
        row.weight = instance.weightOf(selection);
        row.probability = mass;
        row.optimal = optimal_set.count(selection) > 0;
        summary.rows.push_back(std::move(row));
    }

    // Map order is the selection order, so a stable sort keeps it for ties.
    std::stable_sort(summary.rows.begin(), summary.rows.end(),
                     [](const SummaryRow& a, const SummaryRow& b) {
                         return a.probability > b.probability;
                     });
    return summary;
}

} // namespace kchoice
