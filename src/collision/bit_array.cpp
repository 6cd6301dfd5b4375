// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/collision/bit_array.hpp"

#include <algorithm>
#include <bit>
#include <stdexcept>
#include <string>

namespace gridpilot::collision {

void BitArray::checkIndex(std::size_t pos) const {
    if (pos >= num_bits_) {
        throw std::out_of_range("BitArray index " + std::to_string(pos) +
                                " out of range (size " + std::to_string(num_bits_) + ")");
    }
}

void BitArray::set(std::size_t pos) {
    checkIndex(pos);
    words_[pos / kWordBits] |= mask(pos);
}

void BitArray::reset(std::size_t pos) {
    checkIndex(pos);
    words_[pos / kWordBits] &= ~mask(pos);
}

void BitArray::toggle(std::size_t pos) {
    checkIndex(pos);
    words_[pos / kWordBits] ^= mask(pos);
}

void BitArray::assign(std::size_t pos, bool value) {
    if (value) set(pos);
    else reset(pos);
}

bool BitArray::test(std::size_t pos) const {
    checkIndex(pos);
    return (words_[pos / kWordBits] & mask(pos)) != 0;
}

void BitArray::clearAll() noexcept {
    std::fill(words_.begin(), words_.end(), Word{0});
}

std::size_t BitArray::count() const noexcept {
    std::size_t n = 0;
    for (Word w : words_) n += static_cast<std::size_t>(std::popcount(w));
    return n;
}

}  // namespace gridpilot::collision
