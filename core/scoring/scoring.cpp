#include "scoring/scoring.hpp"
#include "scoring/bounded_rational_scoring.hpp"

#include <cstdint>
#include <cstring>

namespace kchoice {

namespace {

uint64_t bits(double x) {
    uint64_t out = 0;
    std::memcpy(&out, &x, sizeof(out));
    return out;
}

} // namespace

bool ScoringParams::operator==(const ScoringParams& other) const {
    return bits(alpha) == bits(other.alpha) && bits(beta) == bits(other.beta) &&
           bits(gamma) == bits(other.gamma) && bits(delta) == bits(other.delta);
}

size_t ScoringParams::Hash::operator()(const ScoringParams& p) const noexcept {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (double x : {p.alpha, p.beta, p.gamma, p.delta}) {
        h ^= bits(x) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return static_cast<size_t>(h);
}

std::shared_ptr<ScoringFunction> makeDefaultScoring() {
    return std::make_shared<BoundedRationalScoring>();
}

} // namespace kchoice
