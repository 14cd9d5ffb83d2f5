//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <charconv>
#include <cstdint>
#include <utility>

#include <Photon/Material/Color.h>
#include <Photon/Material/Errors.h>

using photon::material::Color;

namespace {

constexpr std::array<std::pair<std::string_view, Color>, 6> kNamedColors { {
  { "white", Color { 1.0F, 1.0F, 1.0F, 1.0F } },
  { "black", Color { 0.0F, 0.0F, 0.0F, 1.0F } },
  { "red", Color { 1.0F, 0.0F, 0.0F, 1.0F } },
  { "green", Color { 0.0F, 1.0F, 0.0F, 1.0F } },
  { "blue", Color { 0.0F, 0.0F, 1.0F, 1.0F } },
  { "transparent", Color { 0.0F, 0.0F, 0.0F, 0.0F } },
} };

// Parses `digits` hex characters into [0, 1]. One digit is expanded the CSS
// way, e.g. `f` reads as `ff`.
auto ParseHexChannel(const std::string_view digits, float& channel) -> bool
{
  uint32_t value { 0 };
  const auto* first = digits.data();
  const auto* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, 16);
  if (ec != std::errc {} || ptr != last) {
    return false;
  }
  if (digits.size() == 1) {
    value = value * 16 + value;
  }
  channel = static_cast<float>(value) / 255.0F;
  return true;
}

} // namespace

auto Color::Parse(const std::string_view text)
  -> std::expected<Color, std::error_code>
{
  for (const auto& [name, color] : kNamedColors) {
    if (text == name) {
      return color;
    }
  }

  if (text.empty() || text.front() != '#') {
    return std::unexpected(make_error_code(PropertyError::kTypeMismatch));
  }

  const auto hex = text.substr(1);
  std::size_t digits_per_channel { 0 };
  std::size_t channels { 0 };
  switch (hex.size()) {
    // clang-format off
    case 3: digits_per_channel = 1; channels = 3; break;
    case 4: digits_per_channel = 1; channels = 4; break;
    case 6: digits_per_channel = 2; channels = 3; break;
    case 8: digits_per_channel = 2; channels = 4; break;
    // clang-format on
  default:
    return std::unexpected(make_error_code(PropertyError::kTypeMismatch));
  }

  std::array<float, 4> rgba { 1.0F, 1.0F, 1.0F, 1.0F };
  for (std::size_t i = 0; i < channels; ++i) {
    if (!ParseHexChannel(
          hex.substr(i * digits_per_channel, digits_per_channel), rgba[i])) {
      return std::unexpected(make_error_code(PropertyError::kTypeMismatch));
    }
  }
  return Color { rgba[0], rgba[1], rgba[2], rgba[3] };
}
