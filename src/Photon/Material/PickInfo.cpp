//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Photon/Material/PickInfo.h>

auto photon::material::DecodePick(const uint64_t pick_value,
  const PickLayoutConfig& layout) noexcept -> PickInfo
{
  const auto [wobject_id, index, coord_x, coord_y] = UnpackBitfield(pick_value,
    std::array {
      layout.wobject_id_bits,
      layout.index_bits,
      layout.coord_x_bits,
      layout.coord_y_bits,
    });

  return {
    .wobject_id = static_cast<uint32_t>(wobject_id),
    .vertex_index = static_cast<uint32_t>(index),
    .point_coord = {
      static_cast<float>(coord_x) - layout.coord_bias,
      static_cast<float>(coord_y) - layout.coord_bias,
    },
  };
}
