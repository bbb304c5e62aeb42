#pragma once

#include "scoring/scoring.hpp"

namespace kchoice {

/// Default behavioural model.
///
///   pref(item) = b * ln(density) + c * ln(weight),
///                b = beta / (1 - beta), c = gamma / (1 - gamma)
///   pref(stop) = min pref over the node's available items
///   U          = (candidate_gain - node_gain) / node_gain   in [-1, 0]
///   weight     = exp(delta * (1 + alpha) * U + s(delta) * (pref - max pref)),
///                s(delta) = delta / (1 + delta)
///
/// delta = 0 makes every weight 1. As delta grows, the value term
/// dominates while the preference term saturates, so weight collapses
/// onto candidates that lie on an optimal path. alpha widens the
/// look-ahead: larger alpha penalises value-losing candidates harder.
class BoundedRationalScoring : public ScoringFunction {
public:
    std::string name() const override { return "bounded_rational"; }

    /// alpha >= 0, beta and gamma in [0, 1), delta >= 0 (may be +inf).
    void validate(const ScoringParams& params) const override;

    double score(const CandidateContext& ctx,
                 const ScoringParams& params) const override;

    /// Preference term of one item, before delta saturation.
    static double preference(const Item& item, const ScoringParams& params);
};

} // namespace kchoice
