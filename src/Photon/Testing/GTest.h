//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#define NOLINT_TEST(ts, name) TEST(ts, name) // NOLINT
#define NOLINT_TEST_F(ts, name) TEST_F(ts, name) // NOLINT
#define NOLINT_EXPECT_THROW(st, ex) EXPECT_THROW(st, ex) // NOLINT
#define NOLINT_EXPECT_NO_THROW(st) EXPECT_NO_THROW(st) // NOLINT

namespace photon::testing {

//! Tolerance used by the approximate math comparisons.
inline constexpr float kMathTolerance = 1e-5F;

//! Component-wise approximate equality of two vectors.
template <glm::length_t L>
auto ExpectNear(const glm::vec<L, float>& actual,
  const glm::vec<L, float>& expected, const float tolerance = kMathTolerance)
  -> void
{
  for (glm::length_t i = 0; i < L; ++i) {
    EXPECT_NEAR(actual[i], expected[i], tolerance) << "component " << i;
  }
}

//! Element-wise approximate equality of two matrices.
inline auto ExpectNear(const glm::mat4& actual, const glm::mat4& expected,
  const float tolerance = kMathTolerance) -> void
{
  for (glm::length_t c = 0; c < 4; ++c) {
    SCOPED_TRACE("column " + std::to_string(c));
    ExpectNear(actual[c], expected[c], tolerance);
  }
}

//! Approximate equality of the rotations (not the quaternions) `actual` and
//! `expected`; q and -q rotate the same way.
inline auto ExpectSameRotation(const glm::quat& actual,
  const glm::quat& expected, const float tolerance = kMathTolerance) -> void
{
  const auto sign = glm::dot(actual, expected) < 0.0F ? -1.0F : 1.0F;
  EXPECT_NEAR(actual.w, sign * expected.w, tolerance);
  EXPECT_NEAR(actual.x, sign * expected.x, tolerance);
  EXPECT_NEAR(actual.y, sign * expected.y, tolerance);
  EXPECT_NEAR(actual.z, sign * expected.z, tolerance);
}

} // namespace photon::testing
