//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Photon/Material/Errors.h>

namespace {

auto DescribeRejection(const std::error_code& code, const std::string& property,
  const std::string& value, const std::vector<std::string>& allowed)
  -> std::string
{
  using photon::material::PropertyError;

  if (code == PropertyError::kDeprecatedUsage) {
    return fmt::format(
      "{} is deprecated, use {} instead", property, fmt::join(allowed, " or "));
  }
  if (allowed.empty()) {
    return fmt::format("{} rejected '{}': {}", property, value, code.message());
  }
  return fmt::format("{} must be one of [{}], not '{}'", property,
    fmt::join(allowed, ", "), value);
}

} // namespace

auto photon::material::GetPropertyErrorCategory() noexcept
  -> const PropertyErrorCategory&
{
  static const PropertyErrorCategory category;
  return category;
}

photon::material::PropertyValidationError::PropertyValidationError(
  std::error_code code, std::string property, std::string value,
  std::vector<std::string> allowed)
  : std::system_error(
      code, DescribeRejection(code, property, value, allowed))
  , property_(std::move(property))
  , value_(std::move(value))
  , allowed_(std::move(allowed))
{
}
