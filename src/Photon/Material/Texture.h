//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <Photon/Base/Macros.h>
#include <Photon/Material/api_export.h>

namespace photon::material {

//! Handle to an externally managed texture resource.
/*!
 Photon never uploads or samples textures; it only references them. A Texture
 has an identity (its id, unique per process) and a few descriptive attributes.
 Materials hold textures through `TextureRef`, so several materials can share
 one texture, and the texture lives until the last of them releases it.

 Re-assigning the very same texture to a material is a no-op: texture-valued
 properties compare by identity, not by content.
*/
class Texture {
public:
  PHTN_MAT_API explicit Texture(std::string name = {}, uint32_t width = 1,
    uint32_t height = 1, uint32_t depth = 1);

  ~Texture() = default;

  PHOTON_MAKE_NON_COPYABLE(Texture)
  PHOTON_MAKE_NON_MOVABLE(Texture)

  [[nodiscard]] auto GetId() const noexcept -> uint64_t { return id_; }

  [[nodiscard]] auto GetName() const noexcept -> std::string_view
  {
    return name_;
  }

  [[nodiscard]] auto GetWidth() const noexcept -> uint32_t { return width_; }
  [[nodiscard]] auto GetHeight() const noexcept -> uint32_t { return height_; }
  [[nodiscard]] auto GetDepth() const noexcept -> uint32_t { return depth_; }

  //! Number of dimensions with an extent greater than one (at least one).
  [[nodiscard]] auto GetDimensionality() const noexcept -> uint32_t
  {
    if (depth_ > 1) {
      return 3;
    }
    return height_ > 1 ? 2 : 1;
  }

private:
  uint64_t id_;
  std::string name_;
  uint32_t width_;
  uint32_t height_;
  uint32_t depth_;
};

//! Shared, read-only reference to a texture. `nullptr` means "no texture".
using TextureRef = std::shared_ptr<const Texture>;

} // namespace photon::material
