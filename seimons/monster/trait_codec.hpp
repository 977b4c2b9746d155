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
#include <seimons/core/result.hpp>
#include <seimons/monster/config.hpp>
#include <seimons/monster/monster.hpp>
#include <seimons/monster/monster_error.hpp>

#include <cstdint>

SEIMONS_MONSTER_NAMESPACE_BEGIN

// Packed monster word, least significant bit first:
//
//   bits  0..7    primary type
//   bits  8..15   secondary type
//   bits 16..23   hp
//   bits 24..31   attack
//   bits 32..39   defense
//   bits 40..47   speed
//   bits 48..55   rarity
//   bits 56..87   low 32 bits of the seed
//   bits 88..255  unused, zero on encode
//
// The persisted form is the same word as 32 big endian bytes, which is how it
// sits in an EVM storage slot.
struct PackedLayout
{
    static constexpr unsigned primary_type = 0;
    static constexpr unsigned secondary_type = primary_type + 8;
    static constexpr unsigned hp = secondary_type + 8;
    static constexpr unsigned attack = hp + 8;
    static constexpr unsigned defense = attack + 8;
    static constexpr unsigned speed = defense + 8;
    static constexpr unsigned rarity = speed + 8;
    static constexpr unsigned seed_low32 = rarity + 8;
    static constexpr unsigned used_bits = seed_low32 + 32;
};

static_assert(PackedLayout::seed_low32 == 56);
static_assert(PackedLayout::used_bits == 88);

inline constexpr uint256_t BYTE_MASK{0xff};
inline constexpr uint256_t SEED_LOW32_MASK{0xffffffff};
inline constexpr uint256_t USED_BITS_MASK =
    (uint256_t{1} << PackedLayout::used_bits) - 1;

// Raw fields extracted from a packed word. Enumerated fields are left as bytes
// because a word read from untrusted storage may hold any value.
struct PackedTraits
{
    uint8_t primary_type{0};
    uint8_t secondary_type{0};
    uint8_t hp{0};
    uint8_t attack{0};
    uint8_t defense{0};
    uint8_t speed{0};
    uint8_t rarity{0};
    uint32_t seed_low32{0};

    friend bool operator==(PackedTraits const &, PackedTraits const &) = default;
};

/// Packs the numeric fields of a monster. The name and the upper 224 bits of
/// the seed are dropped. Fails if an enumerated field is outside its domain.
Result<uint256_t> encode(Monster const &);

/// Total over every 256 bit input. Unused bits are ignored and enumerated
/// fields are not validated; see `decode_checked`.
PackedTraits decode(uint256_t const &packed) noexcept;

Result<void> validate(PackedTraits const &);

/// `decode` for words crossing a trust boundary: rejects set unused bits and
/// out of domain element types or rarity.
Result<PackedTraits> decode_checked(uint256_t const &packed);

bytes32_t to_bytes32(uint256_t const &packed) noexcept;

uint256_t from_bytes32(bytes32_t const &) noexcept;

SEIMONS_MONSTER_NAMESPACE_END
