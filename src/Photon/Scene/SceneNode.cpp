//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <utility>

#include <Photon/Base/Logging.h>
#include <Photon/Scene/SceneNode.h>

using photon::scene::SceneNode;

SceneNode::SceneNode(std::string name)
  : name_(std::move(name))
{
}

/*!
 Children that are still referenced elsewhere survive their parent and become
 roots. Their back-reference is cleared here so that it never dangles.
*/
SceneNode::~SceneNode()
{
  for (const auto& child : children_) {
    child->parent_.reset();
  }
}

/*!
 Walks up the ancestor chain of this node looking for `node`. Adding one of our
 ancestors (or ourselves) as a child would close a loop in the hierarchy.
*/
auto SceneNode::WouldCreateCycle(const SceneNode& node) const noexcept -> bool
{
  for (const SceneNode* ancestor = this; ancestor != nullptr;
    ancestor = ancestor->parent_.get()) {
    if (ancestor == &node) {
      return true;
    }
  }
  return false;
}

/*!
 ### Failure Scenarios

 - `child` is null.
 - `child` is this node or one of its ancestors (the hierarchy would contain a
   cycle).

 In both cases the hierarchy is left unchanged, a warning is logged and the
 method returns `false`.

 ### Post-Conditions

 - `child` is no longer in the children list of its previous parent.
 - `child` is the last entry of this node's children list; adding a node that
   already is an immediate child moves it to the end.
 - `child` is marked dirty, so its world matrix is recomputed by the next
   update pass that reaches it.

 @param child The node to attach. Taken by value so that detaching it from its
 previous parent can never release the last reference to it.
 @return true if the node was attached.
*/
auto SceneNode::AddChild(std::shared_ptr<SceneNode> child) -> bool
{
  if (!child) {
    LOG_F(WARNING, "cannot add a null child to node '{}'", name_);
    return false;
  }
  if (WouldCreateCycle(*child)) {
    LOG_F(WARNING,
      "cannot add node '{}' as a child of '{}': it is the node itself or one "
      "of its ancestors",
      child->name_, name_);
    return false;
  }

  if (child->parent_) {
    child->parent_->RemoveChild(*child);
  }

  DLOG_F(3, "link node '{}' under '{}'", child->name_, name_);
  child->parent_ = make_observer(this);
  child->transform_.MarkDirty();
  children_.push_back(std::move(child));
  return true;
}

/*!
 Removing a node that is not an immediate child of this node is silently
 ignored; the call is idempotent and never fails.

 @note If this node held the last reference to `child`, the child (and the
 subtree it owns) is destroyed before the method returns.

 @return true if `child` was found and detached.
*/
auto SceneNode::RemoveChild(const SceneNode& child) noexcept -> bool
{
  const auto it = std::ranges::find_if(children_,
    [&child](const std::shared_ptr<SceneNode>& c) { return c.get() == &child; });
  if (it == children_.end()) {
    return false;
  }

  DLOG_F(3, "unlink node '{}' from '{}'", child.name_, name_);
  (*it)->parent_.reset();
  children_.erase(it);
  return true;
}
