//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Photon/Material/Errors.h>
#include <Photon/Material/PropertyValidation.h>

using photon::material::ColorMode;
using photon::material::CoordSpace;
using photon::material::MapInterpolation;
using photon::material::PropertyError;
using photon::material::SizeMode;
using photon::material::TextureRef;

namespace {

template <typename E>
auto ValidateEnum(const std::string_view text)
  -> std::expected<E, std::error_code>
{
  if (const auto value = photon::material::ParseEnum<E>(text)) {
    return *value;
  }
  return std::unexpected(make_error_code(PropertyError::kInvalidEnumValue));
}

template <typename E>
auto ValidateEnumOrDefault(const std::string_view text, const E default_value)
  -> std::expected<E, std::error_code>
{
  if (text.empty()) {
    return default_value;
  }
  return ValidateEnum<E>(text);
}

} // namespace

auto photon::material::ValidateColorMode(const std::string_view text)
  -> std::expected<ColorMode, std::error_code>
{
  return ValidateEnumOrDefault(text, ColorMode::kAuto);
}

auto photon::material::ValidateSizeMode(const std::string_view text)
  -> std::expected<SizeMode, std::error_code>
{
  return ValidateEnumOrDefault(text, SizeMode::kUniform);
}

auto photon::material::ValidateSizeSpace(const std::string_view text)
  -> std::expected<CoordSpace, std::error_code>
{
  return ValidateEnumOrDefault(text, CoordSpace::kScreen);
}

auto photon::material::ValidateMapInterpolation(const std::string_view text)
  -> std::expected<MapInterpolation, std::error_code>
{
  return ValidateEnum<MapInterpolation>(text);
}

auto photon::material::ValidateTexture(const PropertyValue& value)
  -> std::expected<TextureRef, std::error_code>
{
  if (std::holds_alternative<std::monostate>(value)) {
    return TextureRef {};
  }
  if (const auto* texture = std::get_if<TextureRef>(&value)) {
    return *texture;
  }
  return std::unexpected(make_error_code(PropertyError::kTypeMismatch));
}

auto photon::material::ValidateColor(const std::string_view text)
  -> std::expected<Color, std::error_code>
{
  return Color::Parse(text);
}
