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
#include <seimons/core/bytes.hpp>
#include <seimons/core/int.hpp>
#include <seimons/core/likely.h>
#include <seimons/core/result.hpp>
#include <seimons/monster/config.hpp>
#include <seimons/monster/element_type.hpp>
#include <seimons/monster/monster_error.hpp>
#include <seimons/monster/rarity.hpp>
#include <seimons/monster/trait_codec.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <cstdint>

SEIMONS_MONSTER_NAMESPACE_BEGIN

namespace
{
    constexpr uint8_t byte_at(uint256_t const &packed, unsigned const shift)
    {
        return static_cast<uint8_t>((packed >> shift) & BYTE_MASK);
    }

    constexpr uint256_t
    field(uint8_t const value, unsigned const shift) noexcept
    {
        return uint256_t{value} << shift;
    }
}

Result<uint256_t> encode(Monster const &m)
{
    auto const primary = static_cast<uint8_t>(m.primary_type);
    auto const secondary = static_cast<uint8_t>(m.secondary_type);
    auto const rarity = static_cast<uint8_t>(m.rarity);
    if (SEIMONS_UNLIKELY(
            !is_valid_element_type(primary) ||
            !is_valid_element_type(secondary))) {
        return MonsterError::InvalidElementType;
    }
    if (SEIMONS_UNLIKELY(!is_valid_rarity(rarity))) {
        return MonsterError::InvalidRarity;
    }

    uint256_t packed = field(primary, PackedLayout::primary_type) |
                       field(secondary, PackedLayout::secondary_type) |
                       field(m.hp, PackedLayout::hp) |
                       field(m.attack, PackedLayout::attack) |
                       field(m.defense, PackedLayout::defense) |
                       field(m.speed, PackedLayout::speed) |
                       field(rarity, PackedLayout::rarity);
    packed |= (m.seed & SEED_LOW32_MASK) << PackedLayout::seed_low32;

    SEIMONS_DEBUG_ASSERT((packed & ~USED_BITS_MASK) == 0);
    return packed;
}

PackedTraits decode(uint256_t const &packed) noexcept
{
    return PackedTraits{
        .primary_type = byte_at(packed, PackedLayout::primary_type),
        .secondary_type = byte_at(packed, PackedLayout::secondary_type),
        .hp = byte_at(packed, PackedLayout::hp),
        .attack = byte_at(packed, PackedLayout::attack),
        .defense = byte_at(packed, PackedLayout::defense),
        .speed = byte_at(packed, PackedLayout::speed),
        .rarity = byte_at(packed, PackedLayout::rarity),
        .seed_low32 = static_cast<uint32_t>(
            (packed >> PackedLayout::seed_low32) & SEED_LOW32_MASK)};
}

Result<void> validate(PackedTraits const &traits)
{
    if (SEIMONS_UNLIKELY(
            !is_valid_element_type(traits.primary_type) ||
            !is_valid_element_type(traits.secondary_type))) {
        return MonsterError::InvalidElementType;
    }
    if (SEIMONS_UNLIKELY(!is_valid_rarity(traits.rarity))) {
        return MonsterError::InvalidRarity;
    }
    return outcome::success();
}

Result<PackedTraits> decode_checked(uint256_t const &packed)
{
    if (SEIMONS_UNLIKELY((packed & ~USED_BITS_MASK) != 0)) {
        return MonsterError::DirtyHighBits;
    }
    PackedTraits const traits = decode(packed);
    BOOST_OUTCOME_TRY(validate(traits));
    return traits;
}

bytes32_t to_bytes32(uint256_t const &packed) noexcept
{
    return intx::be::store<bytes32_t>(packed);
}

uint256_t from_bytes32(bytes32_t const &bytes) noexcept
{
    return intx::be::load<uint256_t>(bytes);
}

SEIMONS_MONSTER_NAMESPACE_END
