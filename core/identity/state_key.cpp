#include "identity/state_key.hpp"
#include "identity/digest.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace kchoice {

namespace {

// splitmix64 finaliser
inline uint64_t mix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

inline void hashCombine(uint64_t& h, uint64_t v) {
    h ^= mix64(v) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
}

} // namespace

size_t StateKey::hash() const {
    uint64_t h = 0x9e3779b97f4a7c15ULL;
    hashCombine(h, static_cast<uint64_t>(capacity_ticks));
    for (ItemId id : remaining) {
        hashCombine(h, id);
    }
    return static_cast<size_t>(h);
}

std::string StateKey::canonicalText(const std::vector<Item>& items) const {
    std::ostringstream oss;
    oss.precision(17);
    oss << "cap:" << capacity_ticks << "|";
    for (size_t i = 0; i < remaining.size(); i++) {
        const Item& item = items.at(remaining[i]);
        if (i > 0) oss << ",";
        oss << item.id() << ":" << item.value() << ":" << item.weight();
    }
    return oss.str();
}

uint64_t StateKey::fingerprint(const std::vector<Item>& items) const {
    return Digest::fingerprint(canonicalText(items));
}

Canonicalizer::Canonicalizer(double master_capacity, double resolution)
    : tick_(resolution * std::max(1.0, master_capacity)) {
    if (!(resolution > 0.0) || !std::isfinite(tick_)) {
        throw InvalidParameterError("capacity resolution must be positive and finite");
    }
}

int64_t Canonicalizer::ticks(double capacity) const {
    return static_cast<int64_t>(std::llround(capacity / tick_));
}

StateKey Canonicalizer::makeKey(double capacity, std::vector<ItemId> remaining) const {
    StateKey key;
    key.capacity_ticks = ticks(capacity);
    std::sort(remaining.begin(), remaining.end());
    key.remaining = std::move(remaining);
    return key;
}

} // namespace kchoice
