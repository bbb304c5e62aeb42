#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kchoice {

/// Fixed-length 0/1 vector over the master instance's items.
/// Bit i is set when item i is in the knapsack.
class Selection {
public:
    Selection() = default;
    explicit Selection(size_t size);

    size_t size() const { return size_; }
    bool test(size_t i) const;
    void set(size_t i);
    Selection with(size_t i) const;
    size_t count() const;
    bool empty() const { return count() == 0; }

    /// Bitwise union; both operands must have the same size.
    Selection operator|(const Selection& other) const;

    bool operator==(const Selection& other) const {
        return size_ == other.size_ && words_ == other.words_;
    }
    bool operator!=(const Selection& other) const { return !(*this == other); }

    /// Strict weak order: lexicographic over bits, item 0 most significant.
    bool operator<(const Selection& other) const;

    std::vector<int> toBits() const;

    /// "[1,0,1]"
    std::string toString() const;

private:
    size_t size_ = 0;
    std::vector<uint64_t> words_;
};

} // namespace kchoice
