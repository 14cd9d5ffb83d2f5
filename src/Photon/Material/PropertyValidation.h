//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <expected>
#include <string_view>
#include <system_error>

#include <Photon/Material/Color.h>
#include <Photon/Material/MaterialEnums.h>
#include <Photon/Material/PropertyStore.h>
#include <Photon/Material/api_export.h>

//! Validation of user-provided material property values.
/*!
 Each function checks a raw value against the declared domain of a property
 and returns the canonical value, or an error code from `PropertyError`. They
 have no side effects; the material setters decide what to do with a failure.

 For `color_mode`, `size_mode` and `size_space`, an empty value stands for
 "not specified" and maps to the property default. `map_interpolation` has no
 such shortcut.
*/
namespace photon::material {

PHTN_MAT_NDAPI auto ValidateColorMode(std::string_view text)
  -> std::expected<ColorMode, std::error_code>;

PHTN_MAT_NDAPI auto ValidateSizeMode(std::string_view text)
  -> std::expected<SizeMode, std::error_code>;

PHTN_MAT_NDAPI auto ValidateSizeSpace(std::string_view text)
  -> std::expected<CoordSpace, std::error_code>;

PHTN_MAT_NDAPI auto ValidateMapInterpolation(std::string_view text)
  -> std::expected<MapInterpolation, std::error_code>;

//! Accepts "no texture" (`std::monostate` or a null ref) or a texture.
PHTN_MAT_NDAPI auto ValidateTexture(const PropertyValue& value)
  -> std::expected<TextureRef, std::error_code>;

PHTN_MAT_NDAPI auto ValidateColor(std::string_view text)
  -> std::expected<Color, std::error_code>;

} // namespace photon::material
