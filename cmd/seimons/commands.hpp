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

#include <seimons/core/config.hpp>
#include <seimons/core/int.hpp>

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

SEIMONS_NAMESPACE_BEGIN

/// Accepts decimal or 0x prefixed hex, up to 256 bits. Logs and returns
/// nullopt on anything else, including an empty string or a bare 0x
std::optional<uint256_t> parse_u256(std::string const &);

// Each command prints to out and returns the process exit code

int run_generate(
    std::FILE *out, std::string const &seed, uint64_t token_id,
    std::string const &owner);

int run_decode(std::FILE *out, std::string const &packed, bool strict);

int run_power(std::FILE *out, std::vector<std::string> const &packed);

SEIMONS_NAMESPACE_END
