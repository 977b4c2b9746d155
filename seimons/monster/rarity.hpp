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

#include <seimons/monster/config.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

SEIMONS_MONSTER_NAMESPACE_BEGIN

enum class Rarity : uint8_t
{
    Common = 0,
    Uncommon,
    Rare,
    Epic,
    Legendary,
};

inline constexpr size_t RARITY_COUNT = 5;

static_assert(static_cast<size_t>(Rarity::Legendary) + 1 == RARITY_COUNT);

// Rolls are taken modulo ROLL_RANGE. A rarity is selected by the first
// threshold the roll falls below:
//
//   [0, 50)  Common      50%
//   [50, 75) Uncommon    25%
//   [75, 90) Rare        15%
//   [90, 98) Epic         8%
//   [98,100) Legendary    2%
inline constexpr unsigned ROLL_RANGE = 100;

struct RollThresholds
{
    static constexpr unsigned common = 50;
    static constexpr unsigned uncommon = 75;
    static constexpr unsigned rare = 90;
    static constexpr unsigned epic = 98;
};

inline constexpr unsigned STAT_BONUS_PER_TIER = 20;

constexpr bool is_valid_rarity(uint8_t const raw) noexcept
{
    return raw < RARITY_COUNT;
}

/**
 * maps a roll in [0, ROLL_RANGE) to its rarity tier
 */
constexpr Rarity rarity_from_roll(unsigned const roll) noexcept
{
    if (roll < RollThresholds::common) {
        return Rarity::Common;
    }
    else if (roll < RollThresholds::uncommon) {
        return Rarity::Uncommon;
    }
    else if (roll < RollThresholds::rare) {
        return Rarity::Rare;
    }
    else if (roll < RollThresholds::epic) {
        return Rarity::Epic;
    }
    return Rarity::Legendary;
}

constexpr unsigned stat_bonus(Rarity const rarity) noexcept
{
    return static_cast<unsigned>(rarity) * STAT_BONUS_PER_TIER;
}

std::string_view rarity_name(Rarity) noexcept;

SEIMONS_MONSTER_NAMESPACE_END
