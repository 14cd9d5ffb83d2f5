//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cstring>
#include <utility>

#include <Photon/Base/Logging.h>
#include <Photon/Material/UniformBuffer.h>

using photon::material::ByteRange;
using photon::material::UniformBuffer;
using photon::material::UniformLayout;
using photon::material::UniformType;

namespace {

constexpr std::size_t kBlockAlignment = 16;

struct TypeTraits {
  std::size_t size;
  std::size_t alignment;
};

constexpr auto GetTypeTraits(const UniformType type) noexcept -> TypeTraits
{
  switch (type) {
  case UniformType::kVec4F32:
    return { .size = 16, .alignment = 16 };
  case UniformType::kFloat32:
  default:
    return { .size = 4, .alignment = 4 };
  }
}

constexpr auto AlignUp(const std::size_t value, const std::size_t alignment)
  -> std::size_t
{
  return (value + alignment - 1) / alignment * alignment;
}

} // namespace

auto photon::material::to_string(const UniformType value) noexcept
  -> const char*
{
  // clang-format off
  switch (value) {
  case UniformType::kFloat32: return "f4";
  case UniformType::kVec4F32: return "4xf4";
  }
  // clang-format on

  return "__NotSupported__";
}

//=== UniformLayout ===-------------------------------------------------------//

auto UniformLayout::Builder::Add(std::string name, const UniformType type)
  -> Builder&
{
  CHECK_F(std::ranges::none_of(fields_,
            [&name](const UniformField& f) { return f.name == name; }),
    "duplicate uniform field '{}'", name);

  const auto [size, alignment] = GetTypeTraits(type);
  const auto offset = AlignUp(cursor_, alignment);
  DLOG_F(3, "uniform '{}': {} at offset {}", name, to_string(type), offset);
  fields_.push_back({
    .name = std::move(name),
    .type = type,
    .offset = offset,
    .size = size,
  });
  cursor_ = offset + size;
  return *this;
}

auto UniformLayout::Builder::Build() const -> UniformLayout
{
  UniformLayout layout;
  layout.fields_ = fields_;
  layout.size_ = std::max(AlignUp(cursor_, kBlockAlignment), kBlockAlignment);
  return layout;
}

auto UniformLayout::Find(const std::string_view name) const noexcept
  -> const UniformField*
{
  const auto it = std::ranges::find(fields_, name, &UniformField::name);
  return it == fields_.end() ? nullptr : &*it;
}

//=== UniformBuffer ===-------------------------------------------------------//

UniformBuffer::UniformBuffer(UniformLayout layout)
  : layout_(std::move(layout))
  , data_(layout_.GetSize(), std::byte { 0 })
  , pending_(ByteRange { .offset = 0, .size = data_.size() })
{
}

auto UniformBuffer::ClearPending() noexcept -> void
{
  if (pending_) {
    DLOG_F(3, "uniform range [{}, {}) flushed", pending_->offset,
      pending_->End());
  }
  pending_.reset();
}

auto UniformBuffer::MarkRange(ByteRange range) noexcept -> void
{
  // Clamp the size first so that offset + size cannot wrap.
  const auto begin = std::min(range.offset, data_.size());
  const auto end = begin + std::min(range.size, data_.size() - begin);
  if (end <= begin) {
    return;
  }
  if (!pending_) {
    pending_ = ByteRange { .offset = begin, .size = end - begin };
    return;
  }
  const auto merged_begin = std::min(pending_->offset, begin);
  const auto merged_end = std::max(pending_->End(), end);
  pending_ = ByteRange { .offset = merged_begin,
    .size = merged_end - merged_begin };
}

auto UniformBuffer::WriteBytes(
  const std::string_view name, const std::span<const std::byte> bytes) -> void
{
  const auto* field = layout_.Find(name);
  CHECK_NOTNULL_F(field, "no uniform field named '{}'", name);
  CHECK_EQ_F(field->size, bytes.size(), "size mismatch writing uniform '{}'",
    name);

  std::memcpy(data_.data() + field->offset, bytes.data(), bytes.size());
  MarkRange({ .offset = field->offset, .size = field->size });
}

auto UniformBuffer::ReadBytes(
  const std::string_view name, const std::span<std::byte> bytes) const -> void
{
  const auto* field = layout_.Find(name);
  CHECK_NOTNULL_F(field, "no uniform field named '{}'", name);
  CHECK_EQ_F(field->size, bytes.size(), "size mismatch reading uniform '{}'",
    name);

  std::memcpy(bytes.data(), data_.data() + field->offset, bytes.size());
}
