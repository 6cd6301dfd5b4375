// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <stdexcept>
#include "gridpilot/collision/bit_array.hpp"

using namespace gridpilot::collision;

TEST(BitArray, StartsCleared) {
    BitArray bits(70);
    EXPECT_EQ(bits.size(), 70u);
    EXPECT_FALSE(bits.empty());
    EXPECT_EQ(bits.count(), 0u);
    for (std::size_t i = 0; i < bits.size(); ++i) {
        EXPECT_FALSE(bits.test(i));
    }
}

TEST(BitArray, SetResetAcrossWords) {
    BitArray bits(70);
    bits.set(0);
    bits.set(31);
    bits.set(32);
    bits.set(69);
    EXPECT_TRUE(bits.test(0));
    EXPECT_TRUE(bits.test(31));
    EXPECT_TRUE(bits.test(32));
    EXPECT_TRUE(bits.test(69));
    EXPECT_FALSE(bits.test(33));
    EXPECT_EQ(bits.count(), 4u);

    bits.reset(31);
    EXPECT_FALSE(bits.test(31));
    EXPECT_TRUE(bits.test(32));
    EXPECT_EQ(bits.count(), 3u);
}

TEST(BitArray, ToggleIsInvolutive) {
    BitArray bits(40);
    bits.toggle(17);
    EXPECT_TRUE(bits.test(17));
    bits.toggle(17);
    EXPECT_FALSE(bits.test(17));
    EXPECT_EQ(bits.count(), 0u);
}

TEST(BitArray, Assign) {
    BitArray bits(8);
    bits.assign(3, true);
    EXPECT_TRUE(bits.test(3));
    bits.assign(3, true);
    EXPECT_TRUE(bits.test(3));
    bits.assign(3, false);
    EXPECT_FALSE(bits.test(3));
}

TEST(BitArray, ClearAll) {
    BitArray bits(100);
    for (std::size_t i = 0; i < 100; i += 3) bits.set(i);
    EXPECT_EQ(bits.count(), 34u);
    bits.clearAll();
    EXPECT_EQ(bits.count(), 0u);
}

TEST(BitArray, OutOfRangeThrows) {
    BitArray bits(40);
    EXPECT_NO_THROW(bits.set(39));
    EXPECT_THROW(bits.set(40), std::out_of_range);
    EXPECT_THROW(bits.reset(40), std::out_of_range);
    EXPECT_THROW(bits.toggle(64), std::out_of_range);
    EXPECT_THROW(bits.assign(1000, true), std::out_of_range);
    EXPECT_THROW((void)bits.test(40), std::out_of_range);
}

TEST(BitArray, ZeroCapacity) {
    BitArray bits(0);
    EXPECT_TRUE(bits.empty());
    EXPECT_EQ(bits.count(), 0u);
    EXPECT_THROW((void)bits.test(0), std::out_of_range);
}
