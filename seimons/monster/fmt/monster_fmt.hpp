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

#include <seimons/core/basic_formatter.hpp>
#include <seimons/core/fmt/int_fmt.hpp>
#include <seimons/monster/element_type.hpp>
#include <seimons/monster/monster.hpp>
#include <seimons/monster/rarity.hpp>
#include <seimons/monster/trait_codec.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<seimons::monster::ElementType> : std::true_type
{
};

template <>
struct fmt::formatter<seimons::monster::ElementType>
    : public seimons::BasicFormatter
{
    template <typename FormatContext>
    auto format(seimons::monster::ElementType const &t, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "{}({})",
            seimons::monster::element_type_name(t),
            static_cast<unsigned>(t));
        return ctx.out();
    }
};

template <>
struct quill::copy_loggable<seimons::monster::Rarity> : std::true_type
{
};

template <>
struct fmt::formatter<seimons::monster::Rarity> : public seimons::BasicFormatter
{
    template <typename FormatContext>
    auto format(seimons::monster::Rarity const &r, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "{}({})",
            seimons::monster::rarity_name(r),
            static_cast<unsigned>(r));
        return ctx.out();
    }
};

template <>
struct quill::copy_loggable<seimons::monster::Monster> : std::true_type
{
};

template <>
struct fmt::formatter<seimons::monster::Monster>
    : public seimons::BasicFormatter
{
    template <typename FormatContext>
    auto format(seimons::monster::Monster const &m, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Monster{{"
            "name={} "
            "types={}/{} "
            "hp={} "
            "attack={} "
            "defense={} "
            "speed={} "
            "rarity={} "
            "seed={}"
            "}}",
            m.name,
            m.primary_type,
            m.secondary_type,
            m.hp,
            m.attack,
            m.defense,
            m.speed,
            m.rarity,
            m.seed);
        return ctx.out();
    }
};

template <>
struct quill::copy_loggable<seimons::monster::PackedTraits> : std::true_type
{
};

template <>
struct fmt::formatter<seimons::monster::PackedTraits>
    : public seimons::BasicFormatter
{
    template <typename FormatContext>
    auto
    format(seimons::monster::PackedTraits const &t, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "PackedTraits{{"
            "types={}/{} "
            "hp={} "
            "attack={} "
            "defense={} "
            "speed={} "
            "rarity={} "
            "seed_low32=0x{:08x}"
            "}}",
            t.primary_type,
            t.secondary_type,
            t.hp,
            t.attack,
            t.defense,
            t.speed,
            t.rarity,
            t.seed_low32);
        return ctx.out();
    }
};
