//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <expected>
#include <string_view>
#include <system_error>

#include <glm/vec4.hpp>

#include <Photon/Material/api_export.h>

namespace photon::material {

//! Linear RGBA color with float components.
/*!
 Components are not clamped; values outside [0, 1] are passed through to the
 shader as is. A color is (semi) transparent when its alpha is below 1.
*/
struct Color {
  float r { 1.0F };
  float g { 1.0F };
  float b { 1.0F };
  float a { 1.0F };

  constexpr Color() noexcept = default;

  constexpr Color(const float red, const float green, const float blue,
    const float alpha = 1.0F) noexcept
    : r(red)
    , g(green)
    , b(blue)
    , a(alpha)
  {
  }

  constexpr explicit Color(const glm::vec4& rgba) noexcept
    : r(rgba.r)
    , g(rgba.g)
    , b(rgba.b)
    , a(rgba.a)
  {
  }

  //! Parses a color from text.
  /*!
   Accepted forms:
   - hex: `#rgb`, `#rgba`, `#rrggbb`, `#rrggbbaa` (case-insensitive digits);
   - names: `white`, `black`, `red`, `green`, `blue`, `transparent`.

   @return The color, or PropertyError::kTypeMismatch if `text` is not a color.
  */
  PHTN_MAT_NDAPI static auto Parse(std::string_view text)
    -> std::expected<Color, std::error_code>;

  [[nodiscard]] constexpr auto IsTransparent() const noexcept -> bool
  {
    return a < 1.0F;
  }

  [[nodiscard]] constexpr auto ToVec4() const noexcept -> glm::vec4
  {
    return { r, g, b, a };
  }

  constexpr auto operator==(const Color&) const noexcept -> bool = default;
};

} // namespace photon::material
