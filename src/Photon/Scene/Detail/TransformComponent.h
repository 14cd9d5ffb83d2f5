//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <Photon/Base/Macros.h>
#include <Photon/Scene/api_export.h>

namespace photon::scene::detail {

//! Local TRS state of a scene node, with its cached local and world matrices.
/*!
 The component stores translation, rotation and scale as separate values and
 caches two matrices derived from them:

 - the __local matrix__, recomputed only by UpdateLocalMatrix();
 - the __world matrix__, recomputed only by UpdateWorldTransform() or
   UpdateWorldTransformAsRoot(), which the owning SceneNode calls during its
   world matrix pass.

 The dirty flag means "the world matrix does not reflect the current local
 matrix or parent state". Setters mark the component dirty when the value
 actually changes; UpdateLocalMatrix() marks it dirty unconditionally.

 The component does not know its place in the hierarchy. It never computes the
 world matrix on its own, and GetWorldMatrix() returns the cached value even
 when dirty; check IsDirty() before trusting it.
*/
class TransformComponent final {
public:
  using Vec3 = glm::vec3;
  using Quat = glm::quat;
  using Mat4 = glm::mat4;

  //! Identity TRS, identity matrices, dirty.
  PHTN_SCN_API TransformComponent() = default;

  PHTN_SCN_API ~TransformComponent() = default;

  PHOTON_DEFAULT_COPYABLE(TransformComponent)
  PHOTON_DEFAULT_MOVABLE(TransformComponent)

  //=== Local Transform Operations ===--------------------------------------//

  //! Sets all local transformation components at once.
  PHTN_SCN_API void SetLocalTransform(
    const Vec3& position, const Quat& rotation, const Vec3& scale) noexcept;

  PHTN_SCN_API void SetLocalPosition(const Vec3& position) noexcept;
  PHTN_SCN_API void SetLocalRotation(const Quat& rotation) noexcept;
  PHTN_SCN_API void SetLocalScale(const Vec3& scale) noexcept;

  [[nodiscard]] auto GetLocalPosition() const noexcept -> const Vec3&
  {
    return local_position_;
  }

  [[nodiscard]] auto GetLocalRotation() const noexcept -> const Quat&
  {
    return local_rotation_;
  }

  [[nodiscard]] auto GetLocalScale() const noexcept -> const Vec3&
  {
    return local_scale_;
  }

  //=== Transform Operations ===--------------------------------------------//

  //! Moves by `offset`, rotated by the current orientation when `local`.
  PHTN_SCN_API void Translate(const Vec3& offset, bool local = true) noexcept;

  //! Applies `rotation` after (local) or before (world) the current one.
  PHTN_SCN_API void Rotate(const Quat& rotation, bool local = true) noexcept;

  //! Multiplies the current scale component-wise.
  PHTN_SCN_API void Scale(const Vec3& scale_factor) noexcept;

  //=== Matrices ===--------------------------------------------------------//

  //! Recomputes the cached local matrix from the current TRS values and marks
  //! the world matrix dirty.
  PHTN_SCN_API void UpdateLocalMatrix() noexcept;

  //! Gets the cached local matrix, as of the last UpdateLocalMatrix().
  [[nodiscard]] auto GetLocalMatrix() const noexcept -> const Mat4&
  {
    return local_matrix_;
  }

  //! Gets the cached world matrix, as of the last world transform update.
  [[nodiscard]] auto GetWorldMatrix() const noexcept -> const Mat4&
  {
    return world_matrix_;
  }

  //! world = parent_world x local. Clears the dirty flag.
  PHTN_SCN_API void UpdateWorldTransform(const Mat4& parent_world_matrix);

  //! world = local. Clears the dirty flag.
  PHTN_SCN_API void UpdateWorldTransformAsRoot();

  PHTN_SCN_NDAPI auto GetWorldPosition() const -> Vec3;
  PHTN_SCN_NDAPI auto GetWorldRotation() const -> Quat;
  PHTN_SCN_NDAPI auto GetWorldScale() const -> Vec3;

  //=== Dirty State Management ===------------------------------------------//

  void MarkDirty() noexcept { is_dirty_ = true; }

  [[nodiscard]] auto IsDirty() const noexcept -> bool { return is_dirty_; }

private:
  alignas(16) Vec3 local_position_ { 0.0F, 0.0F, 0.0F };
  alignas(16) Quat local_rotation_ { 1.0F, 0.0F, 0.0F, 0.0F };
  alignas(16) Vec3 local_scale_ { 1.0F, 1.0F, 1.0F };

  alignas(16) Mat4 local_matrix_ { 1.0F };
  alignas(16) Mat4 world_matrix_ { 1.0F };

  bool is_dirty_ { true };
};

} // namespace photon::scene::detail
