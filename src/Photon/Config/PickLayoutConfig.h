//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace photon {

//! Bit layout of the 64-bit pick value written by the points shader.
/*!
 Fields are packed least-significant first, in declaration order. The point
 coordinate fields hold the offset, in sub-pixel units, of the picked pixel
 relative to the point center, biased by `coord_bias` so that it is unsigned.
*/
struct PickLayoutConfig {
  uint32_t wobject_id_bits { 20 };
  uint32_t index_bits { 26 };
  uint32_t coord_x_bits { 9 };
  uint32_t coord_y_bits { 9 };

  float coord_bias { 256.0F };
};

} // namespace photon
