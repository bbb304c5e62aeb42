#include "tree/selection.hpp"

#include <stdexcept>

namespace kchoice {

namespace {

inline int popcount64(uint64_t x) { return __builtin_popcountll(x); }
inline int lowestBit(uint64_t x) { return __builtin_ctzll(x); }

} // namespace

Selection::Selection(size_t size)
    : size_(size), words_((size + 63) / 64, 0ULL) {}

bool Selection::test(size_t i) const {
    if (i >= size_) throw std::out_of_range("Selection index out of range");
    return (words_[i / 64] >> (i % 64)) & 1ULL;
}

void Selection::set(size_t i) {
    if (i >= size_) throw std::out_of_range("Selection index out of range");
    words_[i / 64] |= (1ULL << (i % 64));
}

Selection Selection::with(size_t i) const {
    Selection copy = *this;
    copy.set(i);
    return copy;
}

size_t Selection::count() const {
    size_t total = 0;
    for (uint64_t w : words_) total += popcount64(w);
    return total;
}

Selection Selection::operator|(const Selection& other) const {
    if (size_ != other.size_) {
        throw std::invalid_argument("Selection union requires equal sizes");
    }
    Selection out = *this;
    for (size_t i = 0; i < words_.size(); i++) {
        out.words_[i] |= other.words_[i];
    }
    return out;
}

bool Selection::operator<(const Selection& other) const {
    if (size_ != other.size_) return size_ < other.size_;
    for (size_t i = 0; i < words_.size(); i++) {
        uint64_t diff = words_[i] ^ other.words_[i];
        if (diff == 0) continue;
        // First differing item decides; the side without it sorts first.
        uint64_t bit = 1ULL << lowestBit(diff);
        return (other.words_[i] & bit) != 0;
    }
    return false;
}

std::vector<int> Selection::toBits() const {
    std::vector<int> bits(size_, 0);
    for (size_t i = 0; i < size_; i++) {
        bits[i] = test(i) ? 1 : 0;
    }
    return bits;
}

std::string Selection::toString() const {
    std::string out = "[";
    for (size_t i = 0; i < size_; i++) {
        if (i > 0) out += ",";
        out += test(i) ? "1" : "0";
    }
    out += "]";
    return out;
}

} // namespace kchoice
