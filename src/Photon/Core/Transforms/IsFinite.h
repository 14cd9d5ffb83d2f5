//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace photon::transforms {

//! True if no component of `v` is NaN or infinite.
template <glm::length_t L, typename T, glm::qualifier Q>
[[nodiscard]] auto IsFinite(const glm::vec<L, T, Q>& v) noexcept
  -> bool
{
  return !glm::any(glm::isnan(v)) && !glm::any(glm::isinf(v));
}

template <typename T, glm::qualifier Q>
[[nodiscard]] auto IsFinite(const glm::qua<T, Q>& q) noexcept -> bool
{
  return !glm::any(glm::isnan(q)) && !glm::any(glm::isinf(q));
}

template <glm::length_t C, glm::length_t R, typename T, glm::qualifier Q>
[[nodiscard]] auto IsFinite(const glm::mat<C, R, T, Q>& m) noexcept
  -> bool
{
  for (glm::length_t column = 0; column < C; ++column) {
    if (!IsFinite(m[column])) {
      return false;
    }
  }
  return true;
}

} // namespace photon::transforms
