#include "distribution/distribution.hpp"

namespace kchoice {

double totalMass(const Distribution& distribution) {
    double total = 0.0;
    for (const auto& [selection, mass] : distribution) {
        total += mass;
    }
    return total;
}

double massOn(const Distribution& distribution, const std::vector<Selection>& selections) {
    double total = 0.0;
    for (const Selection& s : selections) {
        auto it = distribution.find(s);
        if (it != distribution.end()) total += it->second;
    }
    return total;
}

} // namespace kchoice
