//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/gtc/quaternion.hpp>

#include <Photon/Base/Logging.h>
#include <Photon/Core/Transforms/Compose.h>
#include <Photon/Core/Transforms/Decompose.h>
#include <Photon/Scene/SceneNode.h>

using photon::scene::SceneNode;
using photon::scene::WorldUpdateOptions;

auto SceneNode::UpdateLocalMatrix() noexcept -> void
{
  transform_.UpdateLocalMatrix();
}

/*!
 The update runs in two phases.

 1. __Upward__ (only with `update_parents`): the parent is updated first with
    `update_children = false, update_parents = true`, recursively, so that
    every ancestor is current before this node reads its parent's world
    matrix.
 2. __Self and downward__:
    - the local matrix is recomputed from the current TRS values (always, even
      if they did not change);
    - if the node is dirty or `force` is set, the world matrix becomes
      `parent_world x local` (or `local` for a root), the dirty flag is
      cleared, and every __direct__ child is marked dirty;
    - with `update_children`, every child runs the same update with default
      options, which cascades through the whole subtree.

 Deeper descendants are only marked dirty when their own update observes their
 now-dirty parent. Calling UpdateWorldMatrix() on a root with default options
 therefore leaves the whole subtree consistent.

 @param options Controls forcing and the extent of the pass.
*/
auto SceneNode::UpdateWorldMatrix(const WorldUpdateOptions& options) -> void
{
  if (options.update_parents && parent_) {
    parent_->UpdateWorldMatrix({
      .force = options.force,
      .update_children = false,
      .update_parents = true,
    });
  }

  transform_.UpdateLocalMatrix();

  if (transform_.IsDirty() || options.force) {
    if (parent_) {
      transform_.UpdateWorldTransform(parent_->transform_.GetWorldMatrix());
    } else {
      transform_.UpdateWorldTransformAsRoot();
    }
    for (const auto& child : children_) {
      child->transform_.MarkDirty();
    }
  }

  if (options.update_children) {
    for (const auto& child : children_) {
      child->UpdateWorldMatrix();
    }
  }
}

/*!
 The node's world position is taken from its world matrix after refreshing it
 and its ancestors (children are not touched). The world-space orientation
 facing `target` is then converted into a local rotation: when the node has a
 parent, the inverse of the parent's world rotation is pre-multiplied, so that
 composing the stored local rotation with the parent's reproduces the desired
 world orientation.

 The local rotation is updated (and the node marked dirty), but the matrices
 are not; the next UpdateWorldMatrix() pass picks the change up.

 @param target Point to face, in world coordinates.
*/
auto SceneNode::LookAt(const Vec3& target) -> void
{
  UpdateWorldMatrix({ .update_children = false, .update_parents = true });

  const Vec3 world_position { transform_.GetWorldMatrix()[3] };
  auto rotation = transforms::LookAtRotation(world_position, target, up_);

  if (parent_) {
    const auto parent_rotation
      = transforms::ExtractRotation(parent_->transform_.GetWorldMatrix());
    rotation = glm::inverse(parent_rotation) * rotation;
  }

  DLOG_F(2, "node '{}' looks at ({}, {}, {})", name_, target.x, target.y,
    target.z);
  transform_.SetLocalRotation(rotation);
}
