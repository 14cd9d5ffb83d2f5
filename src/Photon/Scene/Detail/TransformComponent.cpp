//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Photon/Core/Transforms/Compose.h>
#include <Photon/Core/Transforms/Decompose.h>
#include <Photon/Scene/Detail/TransformComponent.h>

using photon::scene::detail::TransformComponent;

/*!
 Marks the transform dirty once, even though three values change.

 @param position New local position vector.
 @param rotation New local rotation quaternion (must be normalized).
 @param scale New local scale vector.
*/
void TransformComponent::SetLocalTransform(
  const Vec3& position, const Quat& rotation, const Vec3& scale) noexcept
{
  local_position_ = position;
  local_rotation_ = rotation;
  local_scale_ = scale;
  MarkDirty();
}

void TransformComponent::SetLocalPosition(const Vec3& position) noexcept
{
  if (local_position_ != position) {
    local_position_ = position;
    MarkDirty();
  }
}

/*!
 @warning Non-normalized quaternions produce a skewed local matrix.
*/
void TransformComponent::SetLocalRotation(const Quat& rotation) noexcept
{
  if (local_rotation_ != rotation) {
    local_rotation_ = rotation;
    MarkDirty();
  }
}

/*!
 @warning Zero scale values produce a degenerate (non-invertible) matrix.
*/
void TransformComponent::SetLocalScale(const Vec3& scale) noexcept
{
  if (local_scale_ != scale) {
    local_scale_ = scale;
    MarkDirty();
  }
}

void TransformComponent::Translate(
  const Vec3& offset, const bool local) noexcept
{
  if (local) {
    local_position_ += local_rotation_ * offset;
  } else {
    local_position_ += offset;
  }
  MarkDirty();
}

void TransformComponent::Rotate(const Quat& rotation, const bool local) noexcept
{
  if (local) {
    local_rotation_ = local_rotation_ * rotation;
  } else {
    local_rotation_ = rotation * local_rotation_;
  }
  MarkDirty();
}

void TransformComponent::Scale(const Vec3& scale_factor) noexcept
{
  local_scale_ *= scale_factor;
  MarkDirty();
}

/*!
 The local matrix is always recomputed, whether or not the TRS values changed
 since the last call. The world matrix is marked dirty unconditionally, which
 is what lets a node that looked clean become dirty again "from below".
*/
void TransformComponent::UpdateLocalMatrix() noexcept
{
  local_matrix_
    = transforms::ComposeTrs(local_position_, local_rotation_, local_scale_);
  MarkDirty();
}

/*!
 Uses the cached local matrix as is; callers that changed TRS values must call
 UpdateLocalMatrix() first.

 @param parent_world_matrix The parent node's world transformation matrix.
*/
void TransformComponent::UpdateWorldTransform(const Mat4& parent_world_matrix)
{
  world_matrix_ = parent_world_matrix * local_matrix_;
  is_dirty_ = false;
}

void TransformComponent::UpdateWorldTransformAsRoot()
{
  world_matrix_ = local_matrix_;
  is_dirty_ = false;
}

auto TransformComponent::GetWorldPosition() const -> Vec3
{
  return Vec3 { world_matrix_[3] };
}

/*!
 @return World-space rotation, or identity if the world matrix cannot be
 decomposed.
*/
auto TransformComponent::GetWorldRotation() const -> Quat
{
  Vec3 translation {};
  Quat rotation {};
  Vec3 scale {};
  transforms::DecomposeTransformOrFallback(
    world_matrix_, translation, rotation, scale);
  return rotation;
}

/*!
 @return World-space scale, or unit scale for a non-finite world matrix.
*/
auto TransformComponent::GetWorldScale() const -> Vec3
{
  Vec3 translation {};
  Quat rotation {};
  Vec3 scale {};
  transforms::DecomposeTransformOrFallback(
    world_matrix_, translation, rotation, scale);
  return scale;
}
