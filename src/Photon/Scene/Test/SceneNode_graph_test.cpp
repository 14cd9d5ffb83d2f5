//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <memory>
#include <string>
#include <vector>

#include <Photon/Testing/GTest.h>
#include <Photon/Testing/ScopedLogCapture.h>

#include <Photon/Scene/SceneNode.h>

using photon::scene::SceneNode;
using photon::testing::ScopedLogCapture;

namespace {

class SceneNodeHierarchyTest : public testing::Test {
protected:
  static auto MakeNode(std::string name) -> std::shared_ptr<SceneNode>
  {
    return std::make_shared<SceneNode>(std::move(name));
  }

  // Helper: names of the nodes in traversal order.
  static auto TraversalOrder(const SceneNode& root) -> std::vector<std::string>
  {
    std::vector<std::string> names;
    root.Traverse(
      [&names](const SceneNode& node) { names.emplace_back(node.GetName()); });
    return names;
  }

  static auto IsChildOf(const SceneNode& parent, const SceneNode& node) -> bool
  {
    for (const auto& child : parent.GetChildren()) {
      if (child.get() == &node) {
        return true;
      }
    }
    return false;
  }
};

NOLINT_TEST_F(SceneNodeHierarchyTest, NewNode_HasDefaultAttributes)
{
  // Arrange & Act
  const SceneNode node("node");

  // Assert
  EXPECT_EQ(node.GetName(), "node");
  EXPECT_TRUE(node.IsRoot());
  EXPECT_FALSE(node.HasChildren());
  EXPECT_TRUE(node.IsVisible());
  EXPECT_EQ(node.GetRenderOrder(), 0);
  EXPECT_EQ(node.GetUp(), glm::vec3(0.0F, 1.0F, 0.0F));
  EXPECT_TRUE(node.IsWorldMatrixDirty());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, AddChild_SetsParentAndMarksDirty)
{
  // Arrange
  const auto parent = MakeNode("parent");
  const auto child = MakeNode("child");
  child->UpdateWorldMatrix();
  ASSERT_FALSE(child->IsWorldMatrixDirty());

  // Act
  const bool added = parent->AddChild(child);

  // Assert
  EXPECT_TRUE(added);
  EXPECT_EQ(child->GetParent().get(), parent.get());
  EXPECT_TRUE(IsChildOf(*parent, *child));
  EXPECT_TRUE(child->IsWorldMatrixDirty());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, AddChild_ReparentingDetachesFromOldParent)
{
  // Arrange
  const auto a = MakeNode("a");
  const auto b = MakeNode("b");
  const auto c = MakeNode("c");
  ASSERT_TRUE(b->AddChild(a));

  // Act
  ASSERT_TRUE(c->AddChild(a));

  // Assert
  EXPECT_EQ(a->GetParent().get(), c.get());
  EXPECT_FALSE(IsChildOf(*b, *a));
  EXPECT_FALSE(b->HasChildren());
  EXPECT_EQ(c->GetChildren().size(), 1U);
}

NOLINT_TEST_F(SceneNodeHierarchyTest, AddChild_ExistingChildMovesToEnd)
{
  // Arrange
  const auto root = MakeNode("root");
  const auto first = MakeNode("first");
  const auto second = MakeNode("second");
  ASSERT_TRUE(root->AddChild(first));
  ASSERT_TRUE(root->AddChild(second));

  // Act
  ASSERT_TRUE(root->AddChild(first));

  // Assert
  ASSERT_EQ(root->GetChildren().size(), 2U);
  EXPECT_EQ(root->GetChildren()[0], second);
  EXPECT_EQ(root->GetChildren()[1], first);
  EXPECT_EQ(first->GetParent().get(), root.get());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, AddChild_RejectsCycles)
{
  // Arrange
  const auto root = MakeNode("root");
  const auto child = MakeNode("child");
  const auto grandchild = MakeNode("grandchild");
  ASSERT_TRUE(root->AddChild(child));
  ASSERT_TRUE(child->AddChild(grandchild));
  const ScopedLogCapture capture("cycle", loguru::Verbosity_WARNING);

  // Act
  const bool added_ancestor = grandchild->AddChild(root);
  const bool added_self = child->AddChild(child);

  // Assert
  EXPECT_FALSE(added_ancestor);
  EXPECT_FALSE(added_self);
  EXPECT_TRUE(root->IsRoot());
  EXPECT_EQ(child->GetParent().get(), root.get());
  EXPECT_FALSE(grandchild->HasChildren());
  EXPECT_EQ(capture.Count("ancestors"), 2);
}

NOLINT_TEST_F(SceneNodeHierarchyTest, AddChild_RejectsNull)
{
  // Arrange
  const auto root = MakeNode("root");

  // Act & Assert
  EXPECT_FALSE(root->AddChild(nullptr));
  EXPECT_FALSE(root->HasChildren());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, RemoveChild_ClearsParent)
{
  // Arrange
  const auto parent = MakeNode("parent");
  const auto child = MakeNode("child");
  ASSERT_TRUE(parent->AddChild(child));

  // Act
  const bool removed = parent->RemoveChild(*child);

  // Assert
  EXPECT_TRUE(removed);
  EXPECT_TRUE(child->IsRoot());
  EXPECT_FALSE(parent->HasChildren());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, RemoveChild_NonChildIsIgnored)
{
  // Arrange
  const auto parent = MakeNode("parent");
  const auto other = MakeNode("other");
  const auto stranger = MakeNode("stranger");
  ASSERT_TRUE(other->AddChild(stranger));

  // Act
  bool removed = true;
  NOLINT_EXPECT_NO_THROW(removed = parent->RemoveChild(*stranger));

  // Assert
  EXPECT_FALSE(removed);
  EXPECT_FALSE(parent->HasChildren());
  EXPECT_EQ(stranger->GetParent().get(), other.get());
  EXPECT_TRUE(IsChildOf(*other, *stranger));
}

NOLINT_TEST_F(SceneNodeHierarchyTest, RemoveChild_IsIdempotent)
{
  // Arrange
  const auto parent = MakeNode("parent");
  const auto child = MakeNode("child");
  ASSERT_TRUE(parent->AddChild(child));
  ASSERT_TRUE(parent->RemoveChild(*child));

  // Act & Assert
  EXPECT_FALSE(parent->RemoveChild(*child));
  EXPECT_TRUE(child->IsRoot());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, Traverse_IsDepthFirstPreOrder)
{
  // Arrange
  //   root
  //   +-- a
  //   |   +-- a1
  //   |   +-- a2
  //   +-- b
  //       +-- b1
  const auto root = MakeNode("root");
  const auto a = MakeNode("a");
  const auto b = MakeNode("b");
  ASSERT_TRUE(root->AddChild(a));
  ASSERT_TRUE(root->AddChild(b));
  ASSERT_TRUE(a->AddChild(MakeNode("a1")));
  ASSERT_TRUE(a->AddChild(MakeNode("a2")));
  ASSERT_TRUE(b->AddChild(MakeNode("b1")));

  // Act
  const auto first = TraversalOrder(*root);
  const auto second = TraversalOrder(*root);

  // Assert
  const std::vector<std::string> expected { "root", "a", "a1", "a2", "b",
    "b1" };
  EXPECT_EQ(first, expected);
  EXPECT_EQ(second, expected);
}

NOLINT_TEST_F(SceneNodeHierarchyTest, Traverse_MutableVisitorCanEditNodes)
{
  // Arrange
  const auto root = MakeNode("root");
  ASSERT_TRUE(root->AddChild(MakeNode("child")));

  // Act
  root->Traverse([](SceneNode& node) { node.SetVisible(false); });

  // Assert
  EXPECT_FALSE(root->IsVisible());
  EXPECT_FALSE(root->GetChildren()[0]->IsVisible());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, DestroyingParent_TurnsChildrenIntoRoots)
{
  // Arrange
  auto parent = MakeNode("parent");
  const auto child = MakeNode("child");
  ASSERT_TRUE(parent->AddChild(child));

  // Act
  parent.reset();

  // Assert
  EXPECT_TRUE(child->IsRoot());
}

NOLINT_TEST_F(SceneNodeHierarchyTest, RemoveChild_ReleasesUnreferencedSubtree)
{
  // Arrange
  const auto parent = MakeNode("parent");
  auto child = MakeNode("child");
  const std::weak_ptr<SceneNode> watcher = child;
  ASSERT_TRUE(parent->AddChild(std::move(child)));

  // Act
  ASSERT_TRUE(parent->RemoveChild(*watcher.lock()));

  // Assert
  EXPECT_TRUE(watcher.expired());
}

} // namespace
