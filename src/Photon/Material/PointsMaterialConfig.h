//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

#include <Photon/Material/Color.h>
#include <Photon/Material/MaterialEnums.h>
#include <Photon/Material/Texture.h>

namespace photon::material {

//! Initial property values of a points material.
/*!
 Enumerated properties are given by name, exactly as a user would write them,
 and go through the same validation as the material setters. An empty string
 selects the property's default, except for `map_interpolation` which must be
 named explicitly.
*/
struct PointsMaterialConfig {
  PointsVariant variant { PointsVariant::kDefault };

  Color color { 1.0F, 1.0F, 1.0F, 1.0F };
  float size { 4.0F };

  std::string size_space { "screen" };
  std::string size_mode { "uniform" };
  std::string color_mode { "auto" };

  TextureRef map {};
  std::string map_interpolation { "linear" };

  //! Only meaningful for the sprite variant.
  TextureRef sprite {};

  bool aa { true }; //!< Anti-aliased edges.
};

} // namespace photon::material
