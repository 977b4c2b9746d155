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

#include <seimons/core/bytes.hpp>
#include <seimons/core/int.hpp>
#include <seimons/monster/config.hpp>
#include <seimons/monster/element_type.hpp>
#include <seimons/monster/rarity.hpp>

#include <cstdint>
#include <string>

SEIMONS_MONSTER_NAMESPACE_BEGIN

struct Stats
{
    uint8_t hp{0};
    uint8_t attack{0};
    uint8_t defense{0};
    uint8_t speed{0};

    friend bool operator==(Stats const &, Stats const &) = default;
};

// A fully derived monster. Only the numeric fields survive packing; the name
// and the upper 224 bits of the seed are dropped by the codec.
struct Monster
{
    std::string name{};
    ElementType primary_type{ElementType::Fire};
    ElementType secondary_type{ElementType::Fire};
    uint8_t hp{0};
    uint8_t attack{0};
    uint8_t defense{0};
    uint8_t speed{0};
    Rarity rarity{Rarity::Common};
    uint256_t seed{0};

    Stats stats() const noexcept
    {
        return {.hp = hp, .attack = attack, .defense = defense, .speed = speed};
    }

    friend bool operator==(Monster const &, Monster const &) = default;
};

// Supplied by the ledger that mints the monster. Carried for tracing only; it
// never influences derivation.
struct TokenContext
{
    uint64_t token_id{0};
    Address owner{};
};

SEIMONS_MONSTER_NAMESPACE_END
