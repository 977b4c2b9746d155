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

#include "commands.hpp"

#include <seimons/core/assert.h>
#include <seimons/core/basic_formatter.hpp>
#include <seimons/core/bytes.hpp>
#include <seimons/core/config.hpp>
#include <seimons/core/fmt/bytes_fmt.hpp>
#include <seimons/core/fmt/int_fmt.hpp>
#include <seimons/core/int.hpp>
#include <seimons/core/likely.h>
#include <seimons/monster/element_type.hpp>
#include <seimons/monster/fmt/monster_fmt.hpp>
#include <seimons/monster/generator.hpp>
#include <seimons/monster/monster.hpp>
#include <seimons/monster/power.hpp>
#include <seimons/monster/rarity.hpp>
#include <seimons/monster/trait_codec.hpp>

#include <evmc/hex.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

SEIMONS_NAMESPACE_BEGIN

using namespace seimons::monster;

namespace
{
    bool has_digits(std::string const &s)
    {
        if (s.starts_with("0x") || s.starts_with("0X")) {
            return s.size() > 2;
        }
        return !s.empty();
    }

    void print_traits(std::FILE *const out, PackedTraits const &t)
    {
        fmt::print(
            out,
            "primary_type   {} ({})\n"
            "secondary_type {} ({})\n"
            "hp             {}\n"
            "attack         {}\n"
            "defense        {}\n"
            "speed          {}\n"
            "rarity         {} ({})\n"
            "seed_low32     0x{:08x}\n",
            t.primary_type,
            element_type_name(static_cast<ElementType>(t.primary_type)),
            t.secondary_type,
            element_type_name(static_cast<ElementType>(t.secondary_type)),
            t.hp,
            t.attack,
            t.defense,
            t.speed,
            t.rarity,
            rarity_name(static_cast<Rarity>(t.rarity)),
            t.seed_low32);
    }
}

std::optional<uint256_t> parse_u256(std::string const &s)
{
    // intx reads "" and "0x" as zero
    if (SEIMONS_UNLIKELY(!has_digits(s))) {
        LOG_ERROR("'{}' is not a number", s);
        return std::nullopt;
    }
    try {
        return intx::from_string<uint256_t>(s);
    }
    catch (std::invalid_argument const &) {
        LOG_ERROR("'{}' is not a number", s);
    }
    catch (std::out_of_range const &) {
        LOG_ERROR("'{}' does not fit in 256 bits", s);
    }
    return std::nullopt;
}

int run_generate(
    std::FILE *const out, std::string const &seed_str, uint64_t const token_id,
    std::string const &owner_str)
{
    auto const seed = parse_u256(seed_str);
    if (!seed.has_value()) {
        return EXIT_FAILURE;
    }
    TokenContext ctx{.token_id = token_id};
    if (!owner_str.empty()) {
        auto const owner = evmc::from_hex<Address>(owner_str);
        if (!owner.has_value()) {
            LOG_ERROR("'{}' is not an address", owner_str);
            return EXIT_FAILURE;
        }
        ctx.owner = owner.value();
    }

    Monster const monster = generate(seed.value(), ctx);
    auto const packed = encode(monster);
    // generated monsters are always in domain
    SEIMONS_ASSERT(!packed.has_error());

    fmt::print(out, "{}\n", monster);
    fmt::print(out, "packed {}\n", to_bytes32(packed.value()));
    fmt::print(out, "power  {}\n", power(monster));
    return EXIT_SUCCESS;
}

int run_decode(
    std::FILE *const out, std::string const &packed_str, bool const strict)
{
    auto const packed = parse_u256(packed_str);
    if (!packed.has_value()) {
        return EXIT_FAILURE;
    }
    if (strict) {
        auto const res = decode_checked(packed.value());
        if (SEIMONS_UNLIKELY(res.has_error())) {
            LOG_ERROR(
                "{} rejected: {}",
                to_bytes32(packed.value()),
                res.assume_error().message().c_str());
            return EXIT_FAILURE;
        }
        print_traits(out, res.assume_value());
    }
    else {
        print_traits(out, decode(packed.value()));
    }
    fmt::print(out, "power          {}\n", power_from_packed(packed.value()));
    return EXIT_SUCCESS;
}

int run_power(std::FILE *const out, std::vector<std::string> const &packed_strs)
{
    std::vector<uint256_t> packed;
    packed.reserve(packed_strs.size());
    for (auto const &s : packed_strs) {
        auto const p = parse_u256(s);
        if (!p.has_value()) {
            return EXIT_FAILURE;
        }
        packed.push_back(p.value());
    }

    auto const powers = power_from_packed(packed);
    auto const total = sum(powers);
    if (SEIMONS_UNLIKELY(total.has_error())) {
        LOG_ERROR(
            "total power failed with: {}",
            total.assume_error().message().c_str());
        return EXIT_FAILURE;
    }

    for (size_t i = 0; i < powers.size(); ++i) {
        fmt::print(out, "{} {}\n", to_bytes32(packed[i]), powers[i]);
    }
    fmt::print(out, "total {}\n", total.assume_value());
    return EXIT_SUCCESS;
}

SEIMONS_NAMESPACE_END
