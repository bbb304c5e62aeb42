#include "item/item.hpp"
#include "identity/digest.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <sstream>

namespace kchoice {

namespace {

std::string formatNumber(double x) {
    std::ostringstream oss;
    oss.precision(17);
    oss << x;
    return oss.str();
}

} // namespace

Item::Item(double value, double weight, ItemId id)
    : value_(value), weight_(weight), density_(0.0), id_(id), fingerprint_(0) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidInstanceError("Item value must be positive and finite, got " +
                                   formatNumber(value));
    }
    if (!std::isfinite(weight) || weight <= 0.0) {
        throw InvalidInstanceError("Item weight must be positive and finite, got " +
                                   formatNumber(weight));
    }
    density_ = value_ / weight_;
    fingerprint_ = Digest::fingerprint(formatNumber(value_) + "," +
                                       formatNumber(weight_) + "," +
                                       std::to_string(id_));
}

std::string Item::toString() const {
    return "(v: " + formatNumber(value_) + ", w: " + formatNumber(weight_) + ")";
}

std::vector<Item> makeItems(const std::vector<double>& values,
                            const std::vector<double>& weights) {
    if (values.size() != weights.size()) {
        throw InvalidInstanceError(
            "values and weights must have equal length, got " +
            std::to_string(values.size()) + " and " + std::to_string(weights.size()));
    }
    std::vector<Item> items;
    items.reserve(values.size());
    for (size_t i = 0; i < values.size(); i++) {
        items.emplace_back(values[i], weights[i], static_cast<ItemId>(i));
    }
    return items;
}

bool sameAttributes(const Item& a, const Item& b) {
    return a.value() == b.value() && a.weight() == b.weight();
}

bool dominates(const Item& a, const Item& b) {
    if (a.id() == b.id()) return false;
    if (sameAttributes(a, b)) return a.id() < b.id();
    return a.value() >= b.value() && a.weight() <= b.weight();
}

std::vector<ItemId> filterNonDominated(const std::vector<Item>& items,
                                       const std::vector<ItemId>& candidates) {
    std::vector<ItemId> result;
    result.reserve(candidates.size());
    for (ItemId c : candidates) {
        bool dominated = false;
        for (ItemId other : candidates) {
            if (dominates(items[other], items[c])) {
                dominated = true;
                break;
            }
        }
        if (!dominated) result.push_back(c);
    }
    return result;
}

} // namespace kchoice
