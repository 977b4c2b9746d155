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

enum class ElementType : uint8_t
{
    Fire = 0,
    Water,
    Grass,
    Electric,
    Psychic,
    Dark,
    Dragon,
    Normal,
};

inline constexpr size_t ELEMENT_TYPE_COUNT = 8;

static_assert(static_cast<size_t>(ElementType::Normal) + 1 == ELEMENT_TYPE_COUNT);

constexpr bool is_valid_element_type(uint8_t const raw) noexcept
{
    return raw < ELEMENT_TYPE_COUNT;
}

// Returns "Unknown" for bytes outside the enumeration, e.g. an element type
// decoded from untrusted storage.
std::string_view element_type_name(ElementType) noexcept;

SEIMONS_MONSTER_NAMESPACE_END
