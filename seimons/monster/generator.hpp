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

#pragma once

#include <seimons/core/int.hpp>
#include <seimons/monster/config.hpp>
#include <seimons/monster/element_type.hpp>
#include <seimons/monster/monster.hpp>
#include <seimons/monster/rarity.hpp>

#include <array>
#include <string>
#include <string_view>

SEIMONS_MONSTER_NAMESPACE_BEGIN

// Each derivation step reads its own byte of the seed. Rarity and the primary
// type both read from bit 0 by construction (modulo 100 and modulo 8).
struct SeedShifts
{
    static constexpr unsigned rarity = 0;
    static constexpr unsigned primary_type = 0;
    static constexpr unsigned secondary_type = 8;
    static constexpr unsigned hp = 16;
    static constexpr unsigned attack = 24;
    static constexpr unsigned defense = 32;
    static constexpr unsigned speed = 40;
    static constexpr unsigned name_prefix = 48;
    static constexpr unsigned name_suffix = 56;
};

struct StatBase
{
    static constexpr unsigned hp = 30;
    static constexpr unsigned attack = 10;
    static constexpr unsigned defense = 10;
    static constexpr unsigned speed = 10;
};

inline constexpr unsigned STAT_OFFSET_RANGE = 100;

inline constexpr std::array<std::string_view, 8> NAME_PREFIXES{
    "Flame", "Aqua", "Leaf", "Volt", "Mind", "Shadow", "Drake", "Wild"};

inline constexpr std::array<std::string_view, 8> NAME_SUFFIXES{
    "mon", "chu", "zard", "rex", "wing", "claw", "tail", "fang"};

// sanity check: the largest stat fits in a byte for the highest tier
static_assert(
    StatBase::hp + (STAT_OFFSET_RANGE - 1) + stat_bonus(Rarity::Legendary) <=
    0xff);

struct ElementTypes
{
    ElementType primary;
    ElementType secondary;
};

Rarity derive_rarity(uint256_t const &seed) noexcept;

ElementTypes derive_types(uint256_t const &seed) noexcept;

/**
 * derives the four stats for the given rarity. rarity is a parameter so
 * callers can evaluate the stat bound for every tier against one seed.
 */
Stats derive_stats(uint256_t const &seed, Rarity) noexcept;

std::string derive_name(uint256_t const &seed);

/// Derives a complete monster from the seed. Pure: the same seed always
/// yields the same monster. The seed is not assumed to be unpredictable.
Monster generate(uint256_t const &seed);

Monster generate(uint256_t const &seed, TokenContext const &);

SEIMONS_MONSTER_NAMESPACE_END
