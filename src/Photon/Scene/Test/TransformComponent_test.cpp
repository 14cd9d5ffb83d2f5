//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <Photon/Testing/GTest.h>

#include <Photon/Scene/Detail/TransformComponent.h>

using photon::scene::detail::TransformComponent;
using photon::testing::ExpectNear;

namespace {

class TransformComponentTest : public testing::Test {
protected:
  using Vec3 = TransformComponent::Vec3;
  using Quat = TransformComponent::Quat;
  using Mat4 = TransformComponent::Mat4;

  // Helper: bring the component to a clean state.
  void Clean()
  {
    component_.UpdateLocalMatrix();
    component_.UpdateWorldTransformAsRoot();
    ASSERT_FALSE(component_.IsDirty());
  }

  TransformComponent component_;
};

NOLINT_TEST_F(TransformComponentTest, DefaultConstruction_IsIdentityAndDirty)
{
  // Assert
  ExpectNear(component_.GetLocalPosition(), Vec3 { 0.0F });
  EXPECT_EQ(component_.GetLocalRotation(), Quat(1.0F, 0.0F, 0.0F, 0.0F));
  ExpectNear(component_.GetLocalScale(), Vec3 { 1.0F });
  EXPECT_EQ(component_.GetLocalMatrix(), Mat4 { 1.0F });
  EXPECT_EQ(component_.GetWorldMatrix(), Mat4 { 1.0F });
  EXPECT_TRUE(component_.IsDirty());
}

NOLINT_TEST_F(TransformComponentTest, Setters_MarkDirtyOnlyOnChange)
{
  // Arrange
  Clean();

  // Act: same value
  component_.SetLocalPosition(Vec3 { 0.0F });

  // Assert
  EXPECT_FALSE(component_.IsDirty());

  // Act: new value
  component_.SetLocalPosition(Vec3 { 1.0F, 2.0F, 3.0F });

  // Assert
  EXPECT_TRUE(component_.IsDirty());
  ExpectNear(component_.GetLocalPosition(), { 1.0F, 2.0F, 3.0F });
}

NOLINT_TEST_F(TransformComponentTest, Setters_DoNotRecomputeLocalMatrix)
{
  // Arrange
  Clean();

  // Act
  component_.SetLocalScale(Vec3 { 2.0F });

  // Assert
  EXPECT_EQ(component_.GetLocalMatrix(), Mat4 { 1.0F });
}

NOLINT_TEST_F(TransformComponentTest, UpdateLocalMatrix_AlwaysMarksDirty)
{
  // Arrange
  Clean();

  // Act: nothing changed since the last update
  component_.UpdateLocalMatrix();

  // Assert
  EXPECT_TRUE(component_.IsDirty());
}

NOLINT_TEST_F(TransformComponentTest, UpdateWorldTransform_ComposesWithParent)
{
  // Arrange
  component_.SetLocalPosition({ 1.0F, 0.0F, 0.0F });
  component_.UpdateLocalMatrix();
  const auto parent = glm::translate(Mat4 { 1.0F }, Vec3 { 0.0F, 5.0F, 0.0F });

  // Act
  component_.UpdateWorldTransform(parent);

  // Assert
  EXPECT_FALSE(component_.IsDirty());
  ExpectNear(component_.GetWorldMatrix(), parent * component_.GetLocalMatrix());
  ExpectNear(component_.GetWorldPosition(), { 1.0F, 5.0F, 0.0F });
}

NOLINT_TEST_F(TransformComponentTest, Translate_LocalFollowsRotation)
{
  // Arrange
  component_.SetLocalRotation(
    glm::angleAxis(glm::radians(90.0F), Vec3 { 0.0F, 0.0F, 1.0F }));

  // Act
  component_.Translate({ 1.0F, 0.0F, 0.0F });

  // Assert
  ExpectNear(component_.GetLocalPosition(), { 0.0F, 1.0F, 0.0F });

  // Act
  component_.Translate({ 1.0F, 0.0F, 0.0F }, false);

  // Assert
  ExpectNear(component_.GetLocalPosition(), { 1.0F, 1.0F, 0.0F });
}

NOLINT_TEST_F(TransformComponentTest, Scale_MultipliesComponentWise)
{
  // Arrange
  component_.SetLocalScale({ 2.0F, 3.0F, 4.0F });
  Clean();

  // Act
  component_.Scale({ 0.5F, 2.0F, 1.0F });

  // Assert
  ExpectNear(component_.GetLocalScale(), { 1.0F, 6.0F, 4.0F });
  EXPECT_TRUE(component_.IsDirty());
}

NOLINT_TEST_F(TransformComponentTest, WorldScaleAndRotation_DecomposedFromWorld)
{
  // Arrange
  const auto rotation
    = glm::angleAxis(glm::radians(45.0F), Vec3 { 0.0F, 1.0F, 0.0F });
  component_.SetLocalTransform({ 3.0F, 0.0F, 0.0F }, rotation, Vec3 { 2.0F });
  component_.UpdateLocalMatrix();

  // Act
  component_.UpdateWorldTransformAsRoot();

  // Assert
  ExpectNear(component_.GetWorldScale(), Vec3 { 2.0F }, 1e-4F);
  const auto world_rotation = component_.GetWorldRotation();
  ExpectNear(world_rotation * Vec3 { 1.0F, 0.0F, 0.0F },
    rotation * Vec3 { 1.0F, 0.0F, 0.0F }, 1e-4F);
}

} // namespace
