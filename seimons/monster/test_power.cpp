// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <seimons/core/checked_math.hpp>
#include <seimons/core/int.hpp>
#include <seimons/monster/generator.hpp>
#include <seimons/monster/monster.hpp>
#include <seimons/monster/power.hpp>
#include <seimons/monster/rarity.hpp>
#include <seimons/monster/trait_codec.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <algorithm>
#include <random>
#include <vector>

using namespace seimons;
using namespace seimons::monster;
using namespace intx::literals;

namespace
{
    Monster epic_monster()
    {
        return Monster{
            .name = "Shadowrex",
            .primary_type = ElementType::Dark,
            .secondary_type = ElementType::Electric,
            .hp = 100,
            .attack = 80,
            .defense = 60,
            .speed = 90,
            .rarity = Rarity::Epic,
            .seed = 0x123456789ABCDEF0_u256};
    }
}

TEST(Power, example)
{
    // (100 + 80 + 60 + 90) * (3 + 1)
    EXPECT_EQ(power(epic_monster()), 1320);

    auto const packed = encode(epic_monster());
    ASSERT_FALSE(packed.has_error());
    EXPECT_EQ(power_from_packed(packed.value()), 1320);
}

TEST(Power, rarity_multiplier)
{
    Monster m = epic_monster();
    m.rarity = Rarity::Common;
    EXPECT_EQ(power(m), 330);
    m.rarity = Rarity::Legendary;
    EXPECT_EQ(power(m), 1650);
}

TEST(Power, largest_value)
{
    Monster m{};
    m.hp = m.attack = m.defense = m.speed = 0xff;
    m.rarity = Rarity::Legendary;
    EXPECT_EQ(power(m), 1020 * 5);

    // raw rarity byte of an unvalidated word still multiplies
    uint256_t const word = 0x00ffffffffff0000_u256;
    EXPECT_EQ(power_from_packed(word), 1020 * 256);
}

TEST(Power, packed_matches_monster)
{
    std::mt19937_64 rng{0x90e7};
    for (int i = 0; i < 1000; ++i) {
        uint256_t seed{0};
        for (int j = 0; j < 4; ++j) {
            seed = (seed << 64) | uint256_t{rng()};
        }
        Monster const m = generate(seed);
        auto const packed = encode(m);
        ASSERT_FALSE(packed.has_error());
        EXPECT_EQ(power(m), power_from_packed(packed.value()));
    }
}

TEST(Power, batch_preserves_order)
{
    std::vector<uint256_t> packed;
    std::vector<uint256_t> expected;
    for (unsigned i = 0; i < 16; ++i) {
        Monster const m = generate(uint256_t{i} * 0x0101010101010101_u256);
        auto const res = encode(m);
        ASSERT_FALSE(res.has_error());
        packed.push_back(res.value());
        expected.push_back(power(m));
    }
    EXPECT_EQ(power_from_packed(packed), expected);

    EXPECT_TRUE(power_from_packed(std::vector<uint256_t>{}).empty());
}

TEST(Sum, empty_and_single)
{
    std::vector<uint256_t> const empty;
    auto const zero = sum(empty);
    ASSERT_FALSE(zero.has_error());
    EXPECT_EQ(zero.value(), 0);
    EXPECT_EQ(wrapping_sum(empty), 0);

    std::vector<uint256_t> const one{0xdeadbeef_u256};
    auto const single = sum(one);
    ASSERT_FALSE(single.has_error());
    EXPECT_EQ(single.value(), 0xdeadbeef_u256);
}

TEST(Sum, order_independent)
{
    std::vector<uint256_t> values{
        1320_u256, 0_u256, UINT256_MAX / 4, 7_u256, 0x123456789_u256};
    auto const forward = sum(values);
    ASSERT_FALSE(forward.has_error());

    std::ranges::reverse(values);
    auto const backward = sum(values);
    ASSERT_FALSE(backward.has_error());
    EXPECT_EQ(forward.value(), backward.value());

    std::ranges::rotate(values, values.begin() + 2);
    auto const rotated = sum(values);
    ASSERT_FALSE(rotated.has_error());
    EXPECT_EQ(forward.value(), rotated.value());
    EXPECT_EQ(wrapping_sum(values), forward.value());
}

TEST(Sum, overflow)
{
    std::vector<uint256_t> const values{UINT256_MAX, 2_u256};
    auto const res = sum(values);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);

    // the low level variant wraps modulo 2^256
    EXPECT_EQ(wrapping_sum(values), 1);
}

TEST(Sum, total_power)
{
    auto const packed = encode(epic_monster());
    ASSERT_FALSE(packed.has_error());
    std::vector<uint256_t> const words{
        packed.value(), packed.value(), packed.value()};
    auto const total = total_power(words);
    ASSERT_FALSE(total.has_error());
    EXPECT_EQ(total.value(), 3 * 1320);
}
