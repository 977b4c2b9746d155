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

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace seimons;
using namespace intx::literals;

TEST(CheckedMath, add)
{
    auto const res = checked_add(40_u256, 2_u256);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 42);

    auto const max = checked_add(UINT256_MAX - 1, 1);
    ASSERT_FALSE(max.has_error());
    EXPECT_EQ(max.value(), UINT256_MAX);
}

TEST(CheckedMath, add_overflow)
{
    auto const res = checked_add(UINT256_MAX, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
}

TEST(CheckedMath, add_overflow_by_any_amount)
{
    uint256_t const half = uint256_t{1} << 255;
    auto const res = checked_add(half, half);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);

    auto const edge = checked_add(half, half - 1);
    ASSERT_FALSE(edge.has_error());
    EXPECT_EQ(edge.value(), UINT256_MAX);
}
