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

#include <seimons/core/assert.h>
#include <seimons/core/fmt/bytes_fmt.hpp>
#include <seimons/core/fmt/int_fmt.hpp>
#include <seimons/core/int.hpp>
#include <seimons/monster/config.hpp>
#include <seimons/monster/fmt/monster_fmt.hpp>
#include <seimons/monster/generator.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <string>

SEIMONS_MONSTER_NAMESPACE_BEGIN

namespace
{
    unsigned
    seed_slice(uint256_t const &seed, unsigned const shift, uint64_t const mod)
    {
        return static_cast<unsigned>((seed >> shift) % uint256_t{mod});
    }

    uint8_t derive_stat(
        uint256_t const &seed, unsigned const shift, unsigned const base,
        unsigned const bonus)
    {
        unsigned const stat =
            base + seed_slice(seed, shift, STAT_OFFSET_RANGE) + bonus;
        SEIMONS_ASSERT(stat <= 0xff, "stat does not fit in a byte");
        return static_cast<uint8_t>(stat);
    }
}

Rarity derive_rarity(uint256_t const &seed) noexcept
{
    return rarity_from_roll(seed_slice(seed, SeedShifts::rarity, ROLL_RANGE));
}

ElementTypes derive_types(uint256_t const &seed) noexcept
{
    return ElementTypes{
        .primary = static_cast<ElementType>(seed_slice(
            seed, SeedShifts::primary_type, ELEMENT_TYPE_COUNT)),
        .secondary = static_cast<ElementType>(seed_slice(
            seed, SeedShifts::secondary_type, ELEMENT_TYPE_COUNT))};
}

Stats derive_stats(uint256_t const &seed, Rarity const rarity) noexcept
{
    unsigned const bonus = stat_bonus(rarity);
    return Stats{
        .hp = derive_stat(seed, SeedShifts::hp, StatBase::hp, bonus),
        .attack =
            derive_stat(seed, SeedShifts::attack, StatBase::attack, bonus),
        .defense =
            derive_stat(seed, SeedShifts::defense, StatBase::defense, bonus),
        .speed = derive_stat(seed, SeedShifts::speed, StatBase::speed, bonus)};
}

std::string derive_name(uint256_t const &seed)
{
    auto const prefix = NAME_PREFIXES[seed_slice(
        seed, SeedShifts::name_prefix, NAME_PREFIXES.size())];
    auto const suffix = NAME_SUFFIXES[seed_slice(
        seed, SeedShifts::name_suffix, NAME_SUFFIXES.size())];
    std::string name;
    name.reserve(prefix.size() + suffix.size());
    name.append(prefix);
    name.append(suffix);
    return name;
}

Monster generate(uint256_t const &seed)
{
    Rarity const rarity = derive_rarity(seed);
    auto const [primary, secondary] = derive_types(seed);
    Stats const stats = derive_stats(seed, rarity);
    return Monster{
        .name = derive_name(seed),
        .primary_type = primary,
        .secondary_type = secondary,
        .hp = stats.hp,
        .attack = stats.attack,
        .defense = stats.defense,
        .speed = stats.speed,
        .rarity = rarity,
        .seed = seed};
}

Monster generate(uint256_t const &seed, TokenContext const &ctx)
{
    Monster monster = generate(seed);
    LOG_DEBUG(
        "generated token {} for owner {}: {}", ctx.token_id, ctx.owner, monster);
    return monster;
}

SEIMONS_MONSTER_NAMESPACE_END
