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

#include <seimons/monster/config.hpp>
#include <seimons/monster/element_type.hpp>

#include <array>
#include <string_view>

SEIMONS_MONSTER_NAMESPACE_BEGIN

namespace
{
    constexpr std::array<std::string_view, ELEMENT_TYPE_COUNT> ELEMENT_NAMES{
        "Fire",
        "Water",
        "Grass",
        "Electric",
        "Psychic",
        "Dark",
        "Dragon",
        "Normal"};
}

std::string_view element_type_name(ElementType const type) noexcept
{
    auto const raw = static_cast<uint8_t>(type);
    if (!is_valid_element_type(raw)) {
        return "Unknown";
    }
    return ELEMENT_NAMES[raw];
}

SEIMONS_MONSTER_NAMESPACE_END
