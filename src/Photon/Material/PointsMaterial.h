//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include <Photon/Base/Macros.h>
#include <Photon/Material/Color.h>
#include <Photon/Material/MaterialEnums.h>
#include <Photon/Material/PickInfo.h>
#include <Photon/Material/PointsMaterialConfig.h>
#include <Photon/Material/PropertyStore.h>
#include <Photon/Material/Texture.h>
#include <Photon/Material/UniformBuffer.h>
#include <Photon/Material/api_export.h>

namespace photon::material {

//! Names of the points material properties, as used by `SetProperty()` and
//! reported to change subscribers.
namespace property_keys {
  inline constexpr std::string_view kColor = "color";
  inline constexpr std::string_view kColorIsTransparent = "color_is_transparent";
  inline constexpr std::string_view kSize = "size";
  inline constexpr std::string_view kSizeSpace = "size_space";
  inline constexpr std::string_view kSizeMode = "size_mode";
  inline constexpr std::string_view kColorMode = "color_mode";
  inline constexpr std::string_view kMap = "map";
  inline constexpr std::string_view kMapInterpolation = "map_interpolation";
  inline constexpr std::string_view kSprite = "sprite";
  inline constexpr std::string_view kAntiAliasing = "aa";
  inline constexpr std::string_view kVertexColors = "vertex_colors";
} // namespace property_keys

//! Material rendering a point cloud as disks, gaussian blobs or sprites.
/*!
 Render-relevant state is split in two places:
 - `color` and `size` live in the uniform buffer, at fixed offsets, and are
   read back from it. Each write marks the field range for upload.
 - every other property lives in the property store, which notifies
   subscribers synchronously of each change.

 All setters validate their input. A rejected value is logged and reported by
 throwing `PropertyValidationError`; the property keeps its previous value.

 The variant is fixed at construction. Only the sprite variant has a `sprite`
 property; it does not change the validation of the other properties, nor the
 buffer layout.
*/
class PointsMaterial {
public:
  //! Creates a material, running every value of `config` through the
  //! validating setters.
  /*!
   @throw PropertyValidationError if a configuration value is rejected.
  */
  PHTN_MAT_API explicit PointsMaterial(const PointsMaterialConfig& config = {});

  ~PointsMaterial() = default;

  PHOTON_MAKE_NON_COPYABLE(PointsMaterial)
  PHOTON_MAKE_NON_MOVABLE(PointsMaterial)

  //! Layout of the material uniform block: `color` then `size`.
  PHTN_MAT_NDAPI static auto MakeUniformLayout() -> UniformLayout;

  [[nodiscard]] auto GetVariant() const noexcept -> PointsVariant
  {
    return variant_;
  }

  //=== Buffer-backed properties ===----------------------------------------//

  PHTN_MAT_NDAPI auto GetColor() const -> Color;

  //! Sets the uniform color, and the derived transparency flag with it.
  PHTN_MAT_API auto SetColor(const Color& color) -> void;

  //! Parses `text` (see Color::Parse) and sets the uniform color.
  PHTN_MAT_API auto SetColor(std::string_view text) -> void;

  //! Whether the uniform color is (semi) transparent, i.e. not fully opaque.
  PHTN_MAT_NDAPI auto IsColorTransparent() const -> bool;

  //! Diameter of the points, in units of `GetSizeSpace()`.
  PHTN_MAT_NDAPI auto GetSize() const -> float;
  PHTN_MAT_API auto SetSize(float size) -> void;

  //=== Enumerated properties ===-------------------------------------------//

  PHTN_MAT_NDAPI auto GetSizeSpace() const -> CoordSpace;
  PHTN_MAT_API auto SetSizeSpace(CoordSpace value) -> void;
  PHTN_MAT_API auto SetSizeSpace(std::string_view text) -> void;

  PHTN_MAT_NDAPI auto GetSizeMode() const -> SizeMode;
  PHTN_MAT_API auto SetSizeMode(SizeMode value) -> void;
  PHTN_MAT_API auto SetSizeMode(std::string_view text) -> void;

  PHTN_MAT_NDAPI auto GetColorMode() const -> ColorMode;
  PHTN_MAT_API auto SetColorMode(ColorMode value) -> void;
  PHTN_MAT_API auto SetColorMode(std::string_view text) -> void;

  PHTN_MAT_NDAPI auto GetMapInterpolation() const -> MapInterpolation;
  PHTN_MAT_API auto SetMapInterpolation(MapInterpolation value) -> void;
  PHTN_MAT_API auto SetMapInterpolation(std::string_view text) -> void;

  //=== Textures ===--------------------------------------------------------//

  //! Color map, indexed by the geometry texture coordinates. Its
  //! dimensionality should match the number of texcoord components.
  PHTN_MAT_NDAPI auto GetMap() const -> TextureRef;
  PHTN_MAT_API auto SetMap(TextureRef map) -> void;

  //! Sprite image; `nullptr` for any variant other than `kSprite`.
  PHTN_MAT_NDAPI auto GetSprite() const -> TextureRef;

  //! Sets the sprite image. `nullptr` shows the plain point color.
  /*!
   @throw PropertyValidationError (kUnknownProperty) if the material is not
   of the sprite variant.
  */
  PHTN_MAT_API auto SetSprite(TextureRef sprite) -> void;

  //=== Flags ===-----------------------------------------------------------//

  PHTN_MAT_NDAPI auto IsAntiAliased() const -> bool;
  PHTN_MAT_API auto SetAntiAliased(bool aa) -> void;

  [[nodiscard]] auto UsesVertexColors() const -> bool
  {
    return GetColorMode() == ColorMode::kVertex;
  }

  //! Always throws; use `SetColorMode(ColorMode::kVertex)` instead.
  [[noreturn]] PHTN_MAT_API auto SetVertexColors(bool enable) -> void;

  //=== Generic access ===--------------------------------------------------//

  //! Sets a property by name, with the same validation as the typed setters.
  /*!
   Enumerated properties and the color take a string value, `size` a float,
   `aa` a bool, and textures a `TextureRef` or `std::monostate`.

   @throw PropertyValidationError with kTypeMismatch if `value` has the wrong
   type, kUnknownProperty if `name` is not a writable property of this material
   or any error of the typed setter.
  */
  PHTN_MAT_API auto SetProperty(std::string_view name, PropertyValue value)
    -> void;

  [[nodiscard]] auto GetProperties() const noexcept -> const PropertyStore&
  {
    return properties_;
  }

  [[nodiscard]] auto GetUniformBuffer() const noexcept -> const UniformBuffer&
  {
    return uniforms_;
  }

  //! Mutable access, for the renderer to clear the pending upload range.
  [[nodiscard]] auto GetUniformBuffer() noexcept -> UniformBuffer&
  {
    return uniforms_;
  }

  [[nodiscard]] auto Subscribe(PropertyStore::ChangeCallback callback)
    -> PropertyStore::Subscription
  {
    return properties_.Subscribe(std::move(callback));
  }

  //! Decodes the value written by the points shader in the pick buffer.
  [[nodiscard]] static auto GetPickInfo(const uint64_t pick_value) noexcept
    -> PickInfo
  {
    return DecodePick(pick_value);
  }

private:
  PointsVariant variant_;
  PropertyStore properties_;
  UniformBuffer uniforms_;
};

} // namespace photon::material
