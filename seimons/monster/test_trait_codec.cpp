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

#include <seimons/core/bytes.hpp>
#include <seimons/core/int.hpp>
#include <seimons/monster/element_type.hpp>
#include <seimons/monster/generator.hpp>
#include <seimons/monster/monster.hpp>
#include <seimons/monster/monster_error.hpp>
#include <seimons/monster/rarity.hpp>
#include <seimons/monster/trait_codec.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <random>

using namespace seimons;
using namespace seimons::monster;
using namespace intx::literals;
using namespace evmc::literals;

namespace
{
    Monster example_monster()
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

    PackedTraits expected_traits(Monster const &m)
    {
        return PackedTraits{
            .primary_type = static_cast<uint8_t>(m.primary_type),
            .secondary_type = static_cast<uint8_t>(m.secondary_type),
            .hp = m.hp,
            .attack = m.attack,
            .defense = m.defense,
            .speed = m.speed,
            .rarity = static_cast<uint8_t>(m.rarity),
            .seed_low32 = static_cast<uint32_t>(m.seed & SEED_LOW32_MASK)};
    }
}

TEST(TraitCodec, encode_layout)
{
    auto const res = encode(example_monster());
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 0x89abcdef035a3c50640305_u256);
}

TEST(TraitCodec, decode_example)
{
    auto const res = encode(example_monster());
    ASSERT_FALSE(res.has_error());
    PackedTraits const traits = decode(res.value());
    EXPECT_EQ(traits.primary_type, 5);
    EXPECT_EQ(traits.secondary_type, 3);
    EXPECT_EQ(traits.hp, 100);
    EXPECT_EQ(traits.attack, 80);
    EXPECT_EQ(traits.defense, 60);
    EXPECT_EQ(traits.speed, 90);
    EXPECT_EQ(traits.rarity, 3);
    EXPECT_EQ(traits.seed_low32, 0x89ABCDEF);
}

TEST(TraitCodec, round_trip_generated)
{
    std::mt19937_64 rng{0xc0dec};
    for (int i = 0; i < 1000; ++i) {
        uint256_t seed{0};
        for (int j = 0; j < 4; ++j) {
            seed = (seed << 64) | uint256_t{rng()};
        }
        Monster const m = generate(seed);
        auto const res = encode(m);
        ASSERT_FALSE(res.has_error());
        EXPECT_EQ(res.value() & ~USED_BITS_MASK, 0);
        EXPECT_EQ(decode(res.value()), expected_traits(m));
    }
}

TEST(TraitCodec, round_trip_extremes)
{
    Monster m = example_monster();
    m.primary_type = ElementType::Normal;
    m.secondary_type = ElementType::Normal;
    m.hp = 0xff;
    m.attack = 0xff;
    m.defense = 0xff;
    m.speed = 0xff;
    m.rarity = Rarity::Legendary;
    m.seed = UINT256_MAX;
    auto const res = encode(m);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 0xffffffff04ffffffff0707_u256);
    EXPECT_EQ(decode(res.value()), expected_traits(m));

    m = Monster{};
    auto const zero = encode(m);
    ASSERT_FALSE(zero.has_error());
    EXPECT_EQ(zero.value(), 0);
    EXPECT_EQ(decode(zero.value()), PackedTraits{});
}

TEST(TraitCodec, name_and_high_seed_bits_dropped)
{
    Monster a = example_monster();
    Monster b = example_monster();
    b.name = "Wildfang";
    b.seed = a.seed | (0xdeadbeef_u256 << 200) | (0xff_u256 << 32);

    auto const ea = encode(a);
    auto const eb = encode(b);
    ASSERT_FALSE(ea.has_error());
    ASSERT_FALSE(eb.has_error());
    EXPECT_EQ(ea.value(), eb.value());
}

TEST(TraitCodec, fields_do_not_overlap)
{
    Monster m{};
    m.hp = 0xff;
    auto const res = encode(m);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 0xff_u256 << PackedLayout::hp);

    PackedTraits const traits = decode(res.value());
    EXPECT_EQ(traits.hp, 0xff);
    EXPECT_EQ(traits.attack, 0);
    EXPECT_EQ(traits.secondary_type, 0);
}

TEST(TraitCodec, encode_rejects_invalid_element_type)
{
    Monster m = example_monster();
    m.primary_type = static_cast<ElementType>(8);
    auto const res = encode(m);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MonsterError::InvalidElementType);

    m = example_monster();
    m.secondary_type = static_cast<ElementType>(0xff);
    auto const res2 = encode(m);
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.assume_error(), MonsterError::InvalidElementType);
}

TEST(TraitCodec, encode_rejects_invalid_rarity)
{
    Monster m = example_monster();
    m.rarity = static_cast<Rarity>(5);
    auto const res = encode(m);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MonsterError::InvalidRarity);
}

TEST(TraitCodec, decode_untrusted_word)
{
    // decode is total: out of domain bytes come back as they are
    uint256_t const word = UINT256_MAX;
    PackedTraits const traits = decode(word);
    EXPECT_EQ(traits.primary_type, 0xff);
    EXPECT_EQ(traits.secondary_type, 0xff);
    EXPECT_EQ(traits.rarity, 0xff);
    EXPECT_EQ(traits.seed_low32, 0xffffffff);

    auto const checked = decode_checked(word);
    ASSERT_TRUE(checked.has_error());
    EXPECT_EQ(checked.assume_error(), MonsterError::DirtyHighBits);

    auto const masked = decode_checked(word & USED_BITS_MASK);
    ASSERT_TRUE(masked.has_error());
    EXPECT_EQ(masked.assume_error(), MonsterError::InvalidElementType);
}

TEST(TraitCodec, decode_ignores_unused_bits)
{
    uint256_t const word = 0x89abcdef035a3c50640305_u256;
    EXPECT_EQ(decode(word | (1_u256 << 255)), decode(word));
    EXPECT_EQ(decode(word | (1_u256 << PackedLayout::used_bits)), decode(word));
}

TEST(TraitCodec, validate)
{
    PackedTraits traits = expected_traits(example_monster());
    EXPECT_FALSE(validate(traits).has_error());

    traits.rarity = 5;
    auto const bad_rarity = validate(traits);
    ASSERT_TRUE(bad_rarity.has_error());
    EXPECT_EQ(bad_rarity.assume_error(), MonsterError::InvalidRarity);

    traits.rarity = 4;
    traits.secondary_type = 8;
    auto const bad_type = validate(traits);
    ASSERT_TRUE(bad_type.has_error());
    EXPECT_EQ(bad_type.assume_error(), MonsterError::InvalidElementType);
}

TEST(TraitCodec, decode_checked_success)
{
    Monster const m = example_monster();
    auto const packed = encode(m);
    ASSERT_FALSE(packed.has_error());
    auto const res = decode_checked(packed.value());
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), expected_traits(m));
}

TEST(TraitCodec, persisted_form)
{
    constexpr auto expected =
        0x00000000000000000000000000000000000000000089abcdef035a3c50640305_bytes32;
    uint256_t const word = 0x89abcdef035a3c50640305_u256;
    EXPECT_EQ(to_bytes32(word), expected);
    EXPECT_EQ(from_bytes32(expected), word);
    // last byte of the slot holds the primary type
    EXPECT_EQ(to_bytes32(word).bytes[31], 0x05);
}
