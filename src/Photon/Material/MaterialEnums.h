//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Photon/Material/api_export.h>

namespace photon::material {

//! The way color is applied to the rendered primitives.
enum class ColorMode : uint8_t {
  // clang-format off
  kAuto,      //!< Let the material pick, based on its other properties
  kUniform,   //!< Use the material's uniform color
  kVertex,    //!< Use the per-vertex color attribute
  kVertexMap, //!< Sample the color map with per-vertex texture coordinates
  kFace,      //!< Use the per-face color attribute
  kFaceMap,   //!< Sample the color map with per-face texture coordinates
  kDebug,     //!< Shader-defined debug coloring
  // clang-format on
};

//! The way size is applied to the rendered primitives.
enum class SizeMode : uint8_t {
  kUniform, //!< Use the material's uniform size
  kVertex, //!< Use the per-vertex size attribute
};

//! Coordinate space in which a size is expressed.
enum class CoordSpace : uint8_t {
  kScreen, //!< Logical screen pixels
  kWorld, //!< World units
  kModel, //!< Model (object-local) units
};

//! Interpolation used when sampling a texture map.
enum class MapInterpolation : uint8_t {
  kNearest,
  kLinear,
};

//! Rendering variant of a points material.
enum class PointsVariant : uint8_t {
  kDefault, //!< Disks of the given size and color
  kGaussianBlob, //!< Gaussian blobs, standard deviation of 1/6th of the size
  kSprite, //!< A sprite texture, modulated by the point color
};

//! String representation of enum values in `ColorMode`.
PHTN_MAT_NDAPI auto to_string(ColorMode value) noexcept -> const char*;

//! String representation of enum values in `SizeMode`.
PHTN_MAT_NDAPI auto to_string(SizeMode value) noexcept -> const char*;

//! String representation of enum values in `CoordSpace`.
PHTN_MAT_NDAPI auto to_string(CoordSpace value) noexcept -> const char*;

//! String representation of enum values in `MapInterpolation`.
PHTN_MAT_NDAPI auto to_string(MapInterpolation value) noexcept -> const char*;

//! String representation of enum values in `PointsVariant`.
PHTN_MAT_NDAPI auto to_string(PointsVariant value) noexcept -> const char*;

//! Declared finite value set of an enumerated property domain.
template <typename E> struct EnumDomain;

template <> struct EnumDomain<ColorMode> {
  static constexpr std::array kValues {
    ColorMode::kAuto,
    ColorMode::kUniform,
    ColorMode::kVertex,
    ColorMode::kVertexMap,
    ColorMode::kFace,
    ColorMode::kFaceMap,
    ColorMode::kDebug,
  };
};

template <> struct EnumDomain<SizeMode> {
  static constexpr std::array kValues { SizeMode::kUniform, SizeMode::kVertex };
};

template <> struct EnumDomain<CoordSpace> {
  static constexpr std::array kValues {
    CoordSpace::kScreen,
    CoordSpace::kWorld,
    CoordSpace::kModel,
  };
};

template <> struct EnumDomain<MapInterpolation> {
  static constexpr std::array kValues {
    MapInterpolation::kNearest,
    MapInterpolation::kLinear,
  };
};

template <> struct EnumDomain<PointsVariant> {
  static constexpr std::array kValues {
    PointsVariant::kDefault,
    PointsVariant::kGaussianBlob,
    PointsVariant::kSprite,
  };
};

//! Finds the member of `E` whose string representation is `text`.
/*!
 Matching is exact (case-sensitive); there is no coercion of near misses.
*/
template <typename E>
[[nodiscard]] auto ParseEnum(const std::string_view text) noexcept
  -> std::optional<E>
{
  for (const auto value : EnumDomain<E>::kValues) {
    if (text == to_string(value)) {
      return value;
    }
  }
  return std::nullopt;
}

//! Names of all the members of `E`, in declaration order.
template <typename E>
[[nodiscard]] auto AllowedValues() -> std::vector<std::string>
{
  std::vector<std::string> names;
  names.reserve(EnumDomain<E>::kValues.size());
  for (const auto value : EnumDomain<E>::kValues) {
    names.emplace_back(to_string(value));
  }
  return names;
}

} // namespace photon::material
