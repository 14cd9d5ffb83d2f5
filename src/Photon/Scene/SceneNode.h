//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include <Photon/Base/Macros.h>
#include <Photon/Base/ObserverPtr.h>
#include <Photon/Scene/Detail/TransformComponent.h>
#include <Photon/Scene/api_export.h>

namespace photon::scene {

//! Controls the extent of a SceneNode::UpdateWorldMatrix() pass.
struct WorldUpdateOptions {
  //! Recompute the world matrix even if the node is not dirty.
  bool force { false };
  //! Cascade the update to every child, recursively.
  bool update_children { true };
  //! Bring every ancestor up to date first, root to parent.
  bool update_parents { false };
};

//! A participant in the spatial hierarchy, with its own local transform and a
//! derived world transform.
/*!
 A SceneNode owns its children (shared ownership, so that callers can keep
 handles on nodes they created) and observes its parent through a non-owning
 back-reference. Ownership therefore only flows downward and never forms a
 cycle.

 ### Hierarchy invariants

 - A node has at most one parent. AddChild() always detaches the child from its
   previous parent before attaching it.
 - A node can never become its own ancestor. AddChild() refuses (and logs) any
   request that would create a cycle.
 - When a node is destroyed, its surviving children become roots; no
   back-reference outlives its target.

 ### World matrix

 Mutating a transform only marks it dirty. The cost of recomputing matrices is
 paid once, by an explicit UpdateWorldMatrix() pass, usually from the root once
 per frame. See UpdateWorldMatrix() for the propagation rules.

 @note Not thread-safe. All hierarchy mutations and matrix updates must be
 serialized by the caller.
*/
class SceneNode {
public:
  using TransformComponent = detail::TransformComponent;
  using Vec3 = TransformComponent::Vec3;
  using Quat = TransformComponent::Quat;
  using Mat4 = TransformComponent::Mat4;

  PHTN_SCN_API explicit SceneNode(std::string name = {});

  PHTN_SCN_API ~SceneNode();

  PHOTON_MAKE_NON_COPYABLE(SceneNode)
  PHOTON_MAKE_NON_MOVABLE(SceneNode)

  //=== Scene Hierarchy ===---------------------------------------------------//

  //! Makes `child` the last child of this node, detaching it from its
  //! previous parent if any.
  PHTN_SCN_API auto AddChild(std::shared_ptr<SceneNode> child) -> bool;

  //! Detaches `child` if it is an immediate child of this node; does nothing
  //! otherwise.
  PHTN_SCN_API auto RemoveChild(const SceneNode& child) noexcept -> bool;

  [[nodiscard]] auto GetParent() const noexcept -> observer_ptr<SceneNode>
  {
    return parent_;
  }

  [[nodiscard]] auto GetChildren() const noexcept
    -> std::span<const std::shared_ptr<SceneNode>>
  {
    return children_;
  }

  [[nodiscard]] auto HasParent() const noexcept -> bool
  {
    return parent_ != nullptr;
  }

  [[nodiscard]] auto HasChildren() const noexcept -> bool
  {
    return !children_.empty();
  }

  [[nodiscard]] auto IsRoot() const noexcept -> bool { return !HasParent(); }

  //! Checks if making `node` a child of this node would create a cycle, i.e.
  //! `node` is this node or one of its ancestors.
  PHTN_SCN_NDAPI auto WouldCreateCycle(const SceneNode& node) const noexcept
    -> bool;

  //=== Traversal ===---------------------------------------------------------//

  //! Visits this node and its whole subtree, depth-first, pre-order.
  /*!
   The visitor is invoked on a node before any of its children; children are
   visited in insertion order. The traversal can be repeated any number of
   times. Adding or removing nodes from within the visitor is undefined.
  */
  template <typename Visitor>
    requires std::invocable<Visitor&, SceneNode&>
  auto Traverse(Visitor&& visit) -> void
  {
    visit(*this);
    for (const auto& child : children_) {
      child->Traverse(visit);
    }
  }

  template <typename Visitor>
    requires std::invocable<Visitor&, const SceneNode&>
  auto Traverse(Visitor&& visit) const -> void
  {
    visit(*this);
    for (const auto& child : children_) {
      static_cast<const SceneNode&>(*child).Traverse(visit);
    }
  }

  //=== Transform ===---------------------------------------------------------//

  [[nodiscard]] auto GetTransform() noexcept -> TransformComponent&
  {
    return transform_;
  }

  [[nodiscard]] auto GetTransform() const noexcept -> const TransformComponent&
  {
    return transform_;
  }

  //! Recomputes the local matrix and marks the world matrix dirty.
  PHTN_SCN_API auto UpdateLocalMatrix() noexcept -> void;

  //! Recomputes the world matrix of this node, and optionally its ancestors and
  //! descendants.
  PHTN_SCN_API auto UpdateWorldMatrix(const WorldUpdateOptions& options = {})
    -> void;

  //! Rotates this node so that its -Z axis faces `target`, given in world
  //! space.
  PHTN_SCN_API auto LookAt(const Vec3& target) -> void;

  [[nodiscard]] auto IsWorldMatrixDirty() const noexcept -> bool
  {
    return transform_.IsDirty();
  }

  [[nodiscard]] auto GetLocalMatrix() const noexcept -> const Mat4&
  {
    return transform_.GetLocalMatrix();
  }

  [[nodiscard]] auto GetWorldMatrix() const noexcept -> const Mat4&
  {
    return transform_.GetWorldMatrix();
  }

  //=== Attributes ===--------------------------------------------------------//

  [[nodiscard]] auto GetName() const noexcept -> std::string_view
  {
    return name_;
  }
  auto SetName(std::string name) -> void { name_ = std::move(name); }

  [[nodiscard]] auto IsVisible() const noexcept -> bool { return visible_; }
  auto SetVisible(const bool visible) noexcept -> void { visible_ = visible; }

  [[nodiscard]] auto GetRenderOrder() const noexcept -> int32_t
  {
    return render_order_;
  }
  auto SetRenderOrder(const int32_t order) noexcept -> void
  {
    render_order_ = order;
  }

  //! The up direction used by LookAt().
  [[nodiscard]] auto GetUp() const noexcept -> const Vec3& { return up_; }
  auto SetUp(const Vec3& up) noexcept -> void { up_ = up; }

private:
  std::string name_;
  TransformComponent transform_ {};
  Vec3 up_ { 0.0F, 1.0F, 0.0F };
  bool visible_ { true };
  int32_t render_order_ { 0 };

  observer_ptr<SceneNode> parent_ {};
  std::vector<std::shared_ptr<SceneNode>> children_ {};
};

} // namespace photon::scene
