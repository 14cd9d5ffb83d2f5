//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <atomic>
#include <utility>

#include <Photon/Base/Logging.h>
#include <Photon/Material/Texture.h>

using photon::material::Texture;

namespace {
std::atomic<uint64_t> next_texture_id { 1 };
} // namespace

Texture::Texture(std::string name, const uint32_t width, const uint32_t height,
  const uint32_t depth)
  : id_(next_texture_id.fetch_add(1, std::memory_order_relaxed))
  , name_(std::move(name))
  , width_(width)
  , height_(height)
  , depth_(depth)
{
  DLOG_F(2, "texture #{} '{}' ({}x{}x{})", id_, name_, width_, height_, depth_);
}
