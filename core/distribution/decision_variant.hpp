#pragma once

#include "distribution/distribution.hpp"
#include "distribution/distribution_engine.hpp"

namespace kchoice {

/// Answer to "can a selection worth at least `target` be reached, and
/// how likely is the decision-maker to reach one?"
struct DecisionResult {
    bool reachable = false;            // optimum from the node meets the target
    double witness_probability = 0.0;  // mass on terminals meeting the target
    double optimal_value = 0.0;        // best total value reachable
    double target = 0.0;
    Distribution witnesses;            // the qualifying terminals and their mass
};

/// Decision variant of the query rooted at `ref`. `target` must be
/// finite and >= 0 (InvalidParameterError otherwise).
DecisionResult solveDecisionVariant(DistributionEngine& engine,
                                    const NodeRef& ref,
                                    const ScoringParams& params,
                                    double target);

/// Total value of `selection` meets `target`, allowing rounding noise
/// from summing real-valued item values.
bool meetsTarget(double value, double target);

} // namespace kchoice
