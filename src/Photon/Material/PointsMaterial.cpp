//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <glm/vec4.hpp>

#include <Photon/Base/Logging.h>
#include <Photon/Material/Errors.h>
#include <Photon/Material/PointsMaterial.h>
#include <Photon/Material/PropertyValidation.h>

using photon::material::Color;
using photon::material::ColorMode;
using photon::material::CoordSpace;
using photon::material::MapInterpolation;
using photon::material::PointsMaterial;
using photon::material::PointsVariant;
using photon::material::PropertyError;
using photon::material::PropertyStore;
using photon::material::PropertyValidationError;
using photon::material::PropertyValue;
using photon::material::SizeMode;
using photon::material::TextureRef;
using photon::material::UniformLayout;
using photon::material::UniformType;

namespace keys = photon::material::property_keys;

namespace {

auto DescribeValue(const PropertyValue& value) -> std::string
{
  return std::visit(
    []<typename T>(const T& v) -> std::string {
      if constexpr (std::is_same_v<T, std::monostate>) {
        return "none";
      } else if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
      } else if constexpr (std::is_same_v<T, float>) {
        return fmt::format("{}", v);
      } else if constexpr (std::is_same_v<T, std::string>) {
        return v;
      } else {
        return v ? fmt::format("texture #{}", v->GetId()) : "none";
      }
    },
    value);
}

[[noreturn]] auto Reject(const std::error_code code,
  const std::string_view property, std::string value,
  std::vector<std::string> allowed = {}) -> void
{
  PropertyValidationError error(code, std::string(property), std::move(value),
    std::move(allowed));
  LOG_F(ERROR, "{}", error.what());
  throw error;
}

// A typed value can still be out of range when it came from a cast.
template <typename E>
auto CheckEnumMember(const std::string_view key, const E value) -> E
{
  if (!std::ranges::contains(photon::material::EnumDomain<E>::kValues, value)) {
    Reject(make_error_code(PropertyError::kInvalidEnumValue), key,
      std::to_string(std::to_underlying(value)),
      photon::material::AllowedValues<E>());
  }
  return value;
}

template <typename E>
auto StoreEnum(PropertyStore& store, const std::string_view key, const E value)
  -> void
{
  store.Set(key, std::string(to_string(CheckEnumMember(key, value))));
}

// The store is only written through validated setters: a missing or unknown
// enum name is a programming error.
template <typename E>
auto LoadEnum(const PropertyStore& store, const std::string_view key) -> E
{
  const auto text = store.GetAs<std::string>(key);
  CHECK_F(text.has_value(), "property '{}' is not set", key);
  const auto value = photon::material::ParseEnum<E>(*text);
  CHECK_F(value.has_value(), "property '{}' holds invalid value '{}'", key,
    *text);
  return *value;
}

template <typename E, typename Validator>
auto ValidateOrThrow(const std::string_view key, const std::string_view text,
  Validator&& validate) -> E
{
  const auto result = validate(text);
  if (!result) {
    Reject(result.error(), key, std::string(text),
      photon::material::AllowedValues<E>());
  }
  return *result;
}

template <typename T>
auto ExpectType(const std::string_view key, const PropertyValue& value) -> T
{
  if (const auto* typed = std::get_if<T>(&value)) {
    return *typed;
  }
  Reject(make_error_code(PropertyError::kTypeMismatch), key,
    DescribeValue(value));
}

auto ExpectTexture(const std::string_view key, const PropertyValue& value)
  -> TextureRef
{
  auto texture = photon::material::ValidateTexture(value);
  if (!texture) {
    Reject(texture.error(), key, DescribeValue(value));
  }
  return *texture;
}

} // namespace

auto PointsMaterial::MakeUniformLayout() -> UniformLayout
{
  return UniformLayout::Builder {}
    .Add(std::string(keys::kColor), UniformType::kVec4F32)
    .Add(std::string(keys::kSize), UniformType::kFloat32)
    .Build();
}

PointsMaterial::PointsMaterial(const PointsMaterialConfig& config)
  : variant_(CheckEnumMember("variant", config.variant))
  , uniforms_(MakeUniformLayout())
{
  DLOG_F(2, "creating {} points material", to_string(variant_));

  SetSize(config.size);
  SetSizeSpace(config.size_space);
  SetSizeMode(config.size_mode);
  SetColor(config.color);
  SetColorMode(config.color_mode);
  SetMap(config.map);
  SetMapInterpolation(config.map_interpolation);
  SetAntiAliased(config.aa);
  if (variant_ == PointsVariant::kSprite || config.sprite) {
    SetSprite(config.sprite);
  }
}

//=== Buffer-backed properties ===------------------------------------------//

auto PointsMaterial::GetColor() const -> Color
{
  return Color { uniforms_.Read<glm::vec4>(keys::kColor) };
}

auto PointsMaterial::SetColor(const Color& color) -> void
{
  // The color goes in first: the flag notification reads it back.
  uniforms_.Write(keys::kColor, color.ToVec4());
  properties_.Set(keys::kColorIsTransparent, color.IsTransparent());
}

auto PointsMaterial::SetColor(const std::string_view text) -> void
{
  const auto color = ValidateColor(text);
  if (!color) {
    Reject(color.error(), keys::kColor, std::string(text));
  }
  SetColor(*color);
}

auto PointsMaterial::IsColorTransparent() const -> bool
{
  return properties_.GetAs<bool>(keys::kColorIsTransparent).value_or(false);
}

auto PointsMaterial::GetSize() const -> float
{
  return uniforms_.Read<float>(keys::kSize);
}

auto PointsMaterial::SetSize(const float size) -> void
{
  uniforms_.Write(keys::kSize, size);
}

//=== Enumerated properties ===---------------------------------------------//

auto PointsMaterial::GetSizeSpace() const -> CoordSpace
{
  return LoadEnum<CoordSpace>(properties_, keys::kSizeSpace);
}

auto PointsMaterial::SetSizeSpace(const CoordSpace value) -> void
{
  StoreEnum(properties_, keys::kSizeSpace, value);
}

auto PointsMaterial::SetSizeSpace(const std::string_view text) -> void
{
  SetSizeSpace(ValidateOrThrow<CoordSpace>(
    keys::kSizeSpace, text, &photon::material::ValidateSizeSpace));
}

auto PointsMaterial::GetSizeMode() const -> SizeMode
{
  return LoadEnum<SizeMode>(properties_, keys::kSizeMode);
}

auto PointsMaterial::SetSizeMode(const SizeMode value) -> void
{
  StoreEnum(properties_, keys::kSizeMode, value);
}

auto PointsMaterial::SetSizeMode(const std::string_view text) -> void
{
  SetSizeMode(ValidateOrThrow<SizeMode>(
    keys::kSizeMode, text, &photon::material::ValidateSizeMode));
}

auto PointsMaterial::GetColorMode() const -> ColorMode
{
  return LoadEnum<ColorMode>(properties_, keys::kColorMode);
}

auto PointsMaterial::SetColorMode(const ColorMode value) -> void
{
  StoreEnum(properties_, keys::kColorMode, value);
}

auto PointsMaterial::SetColorMode(const std::string_view text) -> void
{
  SetColorMode(ValidateOrThrow<ColorMode>(
    keys::kColorMode, text, &photon::material::ValidateColorMode));
}

auto PointsMaterial::GetMapInterpolation() const -> MapInterpolation
{
  return LoadEnum<MapInterpolation>(properties_, keys::kMapInterpolation);
}

auto PointsMaterial::SetMapInterpolation(const MapInterpolation value) -> void
{
  StoreEnum(properties_, keys::kMapInterpolation, value);
}

auto PointsMaterial::SetMapInterpolation(const std::string_view text) -> void
{
  SetMapInterpolation(ValidateOrThrow<MapInterpolation>(keys::kMapInterpolation,
    text, &photon::material::ValidateMapInterpolation));
}

//=== Textures ===----------------------------------------------------------//

auto PointsMaterial::GetMap() const -> TextureRef
{
  return properties_.GetAs<TextureRef>(keys::kMap).value_or(nullptr);
}

auto PointsMaterial::SetMap(TextureRef map) -> void
{
  properties_.Set(keys::kMap, std::move(map));
}

auto PointsMaterial::GetSprite() const -> TextureRef
{
  return properties_.GetAs<TextureRef>(keys::kSprite).value_or(nullptr);
}

auto PointsMaterial::SetSprite(TextureRef sprite) -> void
{
  if (variant_ != PointsVariant::kSprite) {
    Reject(make_error_code(PropertyError::kUnknownProperty), keys::kSprite,
      DescribeValue(sprite));
  }
  properties_.Set(keys::kSprite, std::move(sprite));
}

//=== Flags ===-------------------------------------------------------------//

auto PointsMaterial::IsAntiAliased() const -> bool
{
  return properties_.GetAs<bool>(keys::kAntiAliasing).value_or(true);
}

auto PointsMaterial::SetAntiAliased(const bool aa) -> void
{
  properties_.Set(keys::kAntiAliasing, aa);
}

auto PointsMaterial::SetVertexColors(const bool enable) -> void
{
  Reject(make_error_code(PropertyError::kDeprecatedUsage), keys::kVertexColors,
    enable ? "true" : "false", { "color_mode = \"vertex\"" });
}

//=== Generic access ===----------------------------------------------------//

auto PointsMaterial::SetProperty(
  const std::string_view name, PropertyValue value) -> void
{
  if (name == keys::kColor) {
    SetColor(std::string_view { ExpectType<std::string>(name, value) });
  } else if (name == keys::kSize) {
    SetSize(ExpectType<float>(name, value));
  } else if (name == keys::kSizeSpace) {
    SetSizeSpace(std::string_view { ExpectType<std::string>(name, value) });
  } else if (name == keys::kSizeMode) {
    SetSizeMode(std::string_view { ExpectType<std::string>(name, value) });
  } else if (name == keys::kColorMode) {
    SetColorMode(std::string_view { ExpectType<std::string>(name, value) });
  } else if (name == keys::kMapInterpolation) {
    SetMapInterpolation(
      std::string_view { ExpectType<std::string>(name, value) });
  } else if (name == keys::kMap) {
    SetMap(ExpectTexture(name, value));
  } else if (name == keys::kSprite) {
    SetSprite(ExpectTexture(name, value));
  } else if (name == keys::kAntiAliasing) {
    SetAntiAliased(ExpectType<bool>(name, value));
  } else if (name == keys::kVertexColors) {
    SetVertexColors(ExpectType<bool>(name, value));
  } else {
    Reject(make_error_code(PropertyError::kUnknownProperty), name,
      DescribeValue(value));
  }
}
