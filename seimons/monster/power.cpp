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
#include <seimons/core/result.hpp>
#include <seimons/monster/config.hpp>
#include <seimons/monster/monster.hpp>
#include <seimons/monster/power.hpp>
#include <seimons/monster/trait_codec.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <iterator>
#include <span>
#include <vector>

SEIMONS_MONSTER_NAMESPACE_BEGIN

namespace
{
    uint256_t power_of(
        unsigned const hp, unsigned const attack, unsigned const defense,
        unsigned const speed, unsigned const rarity) noexcept
    {
        // at most 4 * 255 * 256, no overflow possible
        return uint256_t{hp + attack + defense + speed} *
               uint256_t{rarity + 1};
    }
}

uint256_t power(Monster const &m) noexcept
{
    return power_of(
        m.hp, m.attack, m.defense, m.speed, static_cast<unsigned>(m.rarity));
}

uint256_t power_from_packed(uint256_t const &packed) noexcept
{
    PackedTraits const t = decode(packed);
    return power_of(t.hp, t.attack, t.defense, t.speed, t.rarity);
}

std::vector<uint256_t> power_from_packed(std::span<uint256_t const> const packed)
{
    std::vector<uint256_t> powers;
    powers.reserve(packed.size());
    std::ranges::transform(
        packed, std::back_inserter(powers), [](uint256_t const &p) {
            return power_from_packed(p);
        });
    return powers;
}

Result<uint256_t> sum(std::span<uint256_t const> const values)
{
    uint256_t total{0};
    for (auto const &v : values) {
        BOOST_OUTCOME_TRY(auto const next, checked_add(total, v));
        total = next;
    }
    return total;
}

uint256_t wrapping_sum(std::span<uint256_t const> const values) noexcept
{
    uint256_t total{0};
    for (auto const &v : values) {
        total += v;
    }
    return total;
}

Result<uint256_t> total_power(std::span<uint256_t const> const packed)
{
    return sum(power_from_packed(packed));
}

SEIMONS_MONSTER_NAMESPACE_END
