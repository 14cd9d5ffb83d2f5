//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <glm/vec2.hpp>

#include <Photon/Config/PickLayoutConfig.h>
#include <Photon/Material/api_export.h>

namespace photon::material {

//! What a pick query resolved to, for a points material.
struct PickInfo {
  uint32_t wobject_id { 0 };
  uint32_t vertex_index { 0 };
  //! Offset of the picked pixel from the point center, in sub-pixel units.
  glm::vec2 point_coord { 0.0F, 0.0F };
};

//! Splits `value` into consecutive bit fields, least-significant first.
/*!
 Bits above the sum of the widths are ignored. A width of 64 takes the whole
 remaining value.
*/
template <std::size_t N>
[[nodiscard]] constexpr auto UnpackBitfield(
  uint64_t value, const std::array<uint32_t, N>& widths) noexcept
  -> std::array<uint64_t, N>
{
  std::array<uint64_t, N> fields {};
  for (std::size_t i = 0; i < N; ++i) {
    const auto width = widths[i];
    if (width >= 64) {
      fields[i] = value;
      value = 0;
      continue;
    }
    const auto mask = (uint64_t { 1 } << width) - 1;
    fields[i] = value & mask;
    value >>= width;
  }
  return fields;
}

//! Decodes a raw pick value according to `layout`.
PHTN_MAT_NDAPI auto DecodePick(uint64_t pick_value,
  const PickLayoutConfig& layout = {}) noexcept -> PickInfo;

} // namespace photon::material
