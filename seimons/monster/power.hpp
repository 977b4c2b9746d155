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
#include <seimons/core/result.hpp>
#include <seimons/monster/config.hpp>
#include <seimons/monster/monster.hpp>

#include <span>
#include <vector>

SEIMONS_MONSTER_NAMESPACE_BEGIN

// power = (hp + attack + defense + speed) * (rarity + 1)
uint256_t power(Monster const &) noexcept;

/// Same value as `power` on the monster the word was encoded from. Reads the
/// raw rarity byte, so it is defined for unvalidated words as well.
uint256_t power_from_packed(uint256_t const &packed) noexcept;

std::vector<uint256_t> power_from_packed(std::span<uint256_t const> packed);

/// Checked accumulation; fails with `MathError::Overflow`.
Result<uint256_t> sum(std::span<uint256_t const> values);

/// Accumulation modulo 2^256.
uint256_t wrapping_sum(std::span<uint256_t const> values) noexcept;

/// Checked sum of the power of every packed word.
Result<uint256_t> total_power(std::span<uint256_t const> packed);

SEIMONS_MONSTER_NAMESPACE_END
