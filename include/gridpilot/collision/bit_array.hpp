// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Fixed-capacity bit array packed into 32-bit words.

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gridpilot::collision {

/// Fixed-size bit set whose capacity is chosen at run time.
/// Any access at or beyond size() throws std::out_of_range.
class BitArray {
public:
    using Word = std::uint32_t;
    static constexpr std::size_t kWordBits = 32;

    explicit BitArray(std::size_t num_bits)
        : words_((num_bits + kWordBits - 1) / kWordBits, Word{0})
        , num_bits_(num_bits) {}

    void set(std::size_t pos);
    void reset(std::size_t pos);
    void toggle(std::size_t pos);
    void assign(std::size_t pos, bool value);
    [[nodiscard]] bool test(std::size_t pos) const;

    /// Clear every bit
    void clearAll() noexcept;

    /// Number of set bits
    [[nodiscard]] std::size_t count() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return num_bits_; }
    [[nodiscard]] bool empty() const noexcept { return num_bits_ == 0; }

private:
    std::vector<Word> words_;
    std::size_t num_bits_;

    void checkIndex(std::size_t pos) const;

    [[nodiscard]] static Word mask(std::size_t pos) noexcept {
        return Word{1} << (pos % kWordBits);
    }
};

}  // namespace gridpilot::collision
