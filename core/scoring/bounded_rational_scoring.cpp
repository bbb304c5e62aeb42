#include "scoring/bounded_rational_scoring.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace kchoice {

namespace {

// Relative gain differences below this are treated as ties.
constexpr double kTieTolerance = 1e-12;

void requireUnitInterval(double x, const char* name) {
    if (!std::isfinite(x) || x < 0.0 || x >= 1.0) {
        throw InvalidParameterError(std::string(name) +
                                    " must lie in [0, 1), got " + std::to_string(x));
    }
}

} // namespace

void BoundedRationalScoring::validate(const ScoringParams& params) const {
    if (!std::isfinite(params.alpha) || params.alpha < 0.0) {
        throw InvalidParameterError("alpha must be non-negative and finite, got " +
                                    std::to_string(params.alpha));
    }
    requireUnitInterval(params.beta, "beta");
    requireUnitInterval(params.gamma, "gamma");
    if (std::isnan(params.delta) || params.delta < 0.0) {
        throw InvalidParameterError("delta must be non-negative, got " +
                                    std::to_string(params.delta));
    }
}

double BoundedRationalScoring::preference(const Item& item, const ScoringParams& params) {
    double b = params.beta / (1.0 - params.beta);
    double c = params.gamma / (1.0 - params.gamma);
    return b * std::log(item.density()) + c * std::log(item.weight());
}

double BoundedRationalScoring::score(const CandidateContext& ctx,
                                     const ScoringParams& params) const {
    double saturation = std::isinf(params.delta)
        ? 1.0
        : params.delta / (1.0 + params.delta);

    // Preferences are shifted by the node's best one; normalisation
    // cancels the shift and exp() stays within range.
    double lowest = std::numeric_limits<double>::infinity();
    double highest = -std::numeric_limits<double>::infinity();
    for (ItemId id : ctx.node->available) {
        double p = preference((*ctx.items)[id], params);
        lowest = std::min(lowest, p);
        highest = std::max(highest, p);
    }
    if (ctx.node->available.empty()) {
        lowest = 0.0;
        highest = 0.0;
    }

    // Stopping is never more appealing than the least appealing item.
    double pref = ctx.isStop() ? lowest : preference(*ctx.item, params);
    pref -= highest;

    double utility = 0.0;
    if (ctx.node_gain > 0.0) {
        utility = std::min(0.0, (ctx.candidate_gain - ctx.node_gain) / ctx.node_gain);
        if (-utility <= kTieTolerance) utility = 0.0;
    }

    double value_term = (utility == 0.0)
        ? 0.0
        : params.delta * (1.0 + params.alpha) * utility;

    return std::exp(value_term + saturation * pref);
}

} // namespace kchoice
