//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <glm/vec4.hpp>

#include <Photon/Material/api_export.h>

namespace photon::material {

//! Shader-visible type of a uniform field.
enum class UniformType : uint8_t {
  kFloat32,
  kVec4F32,
};

//! String representation of enum values in `UniformType`.
PHTN_MAT_NDAPI auto to_string(UniformType value) noexcept -> const char*;

//! A contiguous range of bytes, `[offset, offset + size)`.
struct ByteRange {
  std::size_t offset { 0 };
  std::size_t size { 0 };

  [[nodiscard]] constexpr auto End() const noexcept -> std::size_t
  {
    return offset + size;
  }

  constexpr auto operator==(const ByteRange&) const noexcept -> bool = default;
};

struct UniformField {
  std::string name;
  UniformType type { UniformType::kFloat32 };
  std::size_t offset { 0 };
  std::size_t size { 0 };
};

//! Immutable layout of a uniform block.
/*!
 Fields follow std140-like packing rules: scalars are 4-byte aligned, vec4
 fields are 16-byte aligned, and the total size is a multiple of 16 bytes.
*/
class UniformLayout {
public:
  class Builder {
  public:
    //! Appends a field. Names must be unique.
    PHTN_MAT_API auto Add(std::string name, UniformType type) -> Builder&;

    PHTN_MAT_NDAPI auto Build() const -> UniformLayout;

  private:
    std::vector<UniformField> fields_ {};
    std::size_t cursor_ { 0 };
  };

  UniformLayout() = default;

  PHTN_MAT_NDAPI auto Find(std::string_view name) const noexcept
    -> const UniformField*;

  [[nodiscard]] auto GetFields() const noexcept
    -> std::span<const UniformField>
  {
    return fields_;
  }

  [[nodiscard]] auto GetSize() const noexcept -> std::size_t { return size_; }

private:
  std::vector<UniformField> fields_ {};
  std::size_t size_ { 0 };
};

//! CPU-side shadow of a uniform block, with pending-upload tracking.
/*!
 Each write records the byte range it touched. The renderer is expected to
 upload `GetPendingRange()` then call `ClearPending()`. Ranges are merged into
 a single covering range, so a flush may upload untouched bytes between two
 written fields, but never misses a written one.

 A newly created buffer is zero-filled and entirely pending.
*/
class UniformBuffer {
public:
  PHTN_MAT_API explicit UniformBuffer(UniformLayout layout);

  //! Writes `value` into the field `name`, and marks its range pending.
  template <typename T>
    requires std::is_trivially_copyable_v<T>
  auto Write(const std::string_view name, const T& value) -> void
  {
    WriteBytes(name, std::as_bytes(std::span { &value, 1 }));
  }

  //! Reads the field `name` as a `T`.
  template <typename T>
    requires std::is_trivially_copyable_v<T>
  [[nodiscard]] auto Read(const std::string_view name) const -> T
  {
    T value {};
    ReadBytes(name, std::as_writable_bytes(std::span { &value, 1 }));
    return value;
  }

  [[nodiscard]] auto GetLayout() const noexcept -> const UniformLayout&
  {
    return layout_;
  }

  [[nodiscard]] auto GetData() const noexcept -> std::span<const std::byte>
  {
    return data_;
  }

  [[nodiscard]] auto GetPendingRange() const noexcept
    -> std::optional<ByteRange>
  {
    return pending_;
  }

  [[nodiscard]] auto HasPendingFlush() const noexcept -> bool
  {
    return pending_.has_value();
  }

  //! Marks the buffer as uploaded.
  PHTN_MAT_API auto ClearPending() noexcept -> void;

  //! Marks `range` (clamped to the buffer) as pending upload.
  PHTN_MAT_API auto MarkRange(ByteRange range) noexcept -> void;

private:
  PHTN_MAT_API auto WriteBytes(
    std::string_view name, std::span<const std::byte> bytes) -> void;
  PHTN_MAT_API auto ReadBytes(
    std::string_view name, std::span<std::byte> bytes) const -> void;

  UniformLayout layout_;
  std::vector<std::byte> data_;
  std::optional<ByteRange> pending_ {};
};

} // namespace photon::material
