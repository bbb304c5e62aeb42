#include "distribution/decision_variant.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace kchoice {

namespace {

constexpr double kValueSlack = 1e-12;

} // namespace

bool meetsTarget(double value, double target) {
    return value >= target - kValueSlack * std::max(1.0, std::fabs(target));
}

DecisionResult solveDecisionVariant(DistributionEngine& engine,
                                    const NodeRef& ref,
                                    const ScoringParams& params,
                                    double target) {
    if (!std::isfinite(target) || target < 0.0) {
        throw InvalidParameterError("Decision target must be finite and >= 0, got " +
                                    std::to_string(target));
    }

    KnapsackInstance& instance = engine.instance();
    Distribution dist = engine.getNodeDistribution(ref, params);

    DecisionResult result;
    result.target = target;
    result.optimal_value = instance.optimalValue(ref);
    result.reachable = meetsTarget(result.optimal_value, target);

    for (const auto& [selection, mass] : dist) {
        if (meetsTarget(instance.valueOf(selection), target)) {
            result.witnesses.emplace(selection, mass);
            result.witness_probability += mass;
        }
    }
    return result;
}

} // namespace kchoice
