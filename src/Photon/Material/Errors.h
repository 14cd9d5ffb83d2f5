//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <system_error>
#include <vector>

#include <Photon/Material/api_export.h>

namespace photon::material {

//! Material property error codes, exposed as std::error_code.
enum class PropertyError : int {
  kInvalidEnumValue = 1,
  kTypeMismatch,
  kDeprecatedUsage,
  kUnknownProperty,
};

//! Category for material property errors.
class PropertyErrorCategory : public std::error_category {
public:
  auto name() const noexcept -> const char* override
  {
    return "Material Property Error";
  }

  auto message(int ev) const -> std::string override
  {
    switch (static_cast<PropertyError>(ev)) {
    case PropertyError::kInvalidEnumValue:
      return "Value is not a member of the property's declared value set";
    case PropertyError::kTypeMismatch:
      return "Value type does not match the property type";
    case PropertyError::kDeprecatedUsage:
      return "Property is deprecated and can no longer be used";
    case PropertyError::kUnknownProperty:
      return "Property is not defined for this material";
    default:
      return "Unknown material property error";
    }
  }
};

// Implemented in the .cpp so that there is a single category instance, and
// error_code values compare reliably for identity.
PHTN_MAT_NDAPI auto GetPropertyErrorCategory() noexcept
  -> const PropertyErrorCategory&;

inline auto make_error_code(PropertyError e) noexcept -> std::error_code
{
  return { static_cast<int>(e), GetPropertyErrorCategory() };
}

//! Exception thrown by material setters when a value is rejected.
/*!
 Carries the name of the property, the offending value rendered as text and,
 for enumerated properties, the names of the allowed values. For
 `kDeprecatedUsage`, the allowed values name the replacement API instead. The
 property that failed keeps the value it had before the call.
*/
class PropertyValidationError final : public std::system_error {
public:
  PHTN_MAT_API PropertyValidationError(std::error_code code,
    std::string property, std::string value,
    std::vector<std::string> allowed = {});

  [[nodiscard]] auto Property() const noexcept -> const std::string&
  {
    return property_;
  }

  [[nodiscard]] auto Value() const noexcept -> const std::string&
  {
    return value_;
  }

  [[nodiscard]] auto Allowed() const noexcept
    -> const std::vector<std::string>&
  {
    return allowed_;
  }

private:
  std::string property_;
  std::string value_;
  std::vector<std::string> allowed_;
};

} // namespace photon::material

template <>
struct std::is_error_code_enum<photon::material::PropertyError> : true_type {
};
