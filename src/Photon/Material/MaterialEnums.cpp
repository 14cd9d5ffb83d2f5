//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Photon/Material/MaterialEnums.h>

auto photon::material::to_string(const ColorMode value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case ColorMode::kAuto:      return "auto";
    case ColorMode::kUniform:   return "uniform";
    case ColorMode::kVertex:    return "vertex";
    case ColorMode::kVertexMap: return "vertex_map";
    case ColorMode::kFace:      return "face";
    case ColorMode::kFaceMap:   return "face_map";
    case ColorMode::kDebug:     return "debug";
    // clang-format on
  }

  return "__NotSupported__";
}

auto photon::material::to_string(const SizeMode value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case SizeMode::kUniform: return "uniform";
    case SizeMode::kVertex:  return "vertex";
    // clang-format on
  }

  return "__NotSupported__";
}

auto photon::material::to_string(const CoordSpace value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case CoordSpace::kScreen: return "screen";
    case CoordSpace::kWorld:  return "world";
    case CoordSpace::kModel:  return "model";
    // clang-format on
  }

  return "__NotSupported__";
}

auto photon::material::to_string(const MapInterpolation value) noexcept
  -> const char*
{
  switch (value) {
    // clang-format off
    case MapInterpolation::kNearest: return "nearest";
    case MapInterpolation::kLinear:  return "linear";
    // clang-format on
  }

  return "__NotSupported__";
}

auto photon::material::to_string(const PointsVariant value) noexcept
  -> const char*
{
  switch (value) {
    // clang-format off
    case PointsVariant::kDefault:      return "default";
    case PointsVariant::kGaussianBlob: return "gaussian_blob";
    case PointsVariant::kSprite:       return "sprite";
    // clang-format on
  }

  return "__NotSupported__";
}
