//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <Photon/Core/Transforms/Compose.h>

namespace photon::transforms {

auto ComposeTrs(const glm::vec3& translation, const glm::quat& rotation,
  const glm::vec3& scale) -> glm::mat4
{
  const glm::mat4 translation_matrix
    = glm::translate(glm::mat4 { 1.0F }, translation);
  const glm::mat4 rotation_matrix = glm::mat4_cast(rotation);
  const glm::mat4 scale_matrix = glm::scale(glm::mat4 { 1.0F }, scale);

  return translation_matrix * rotation_matrix * scale_matrix;
}

auto LookAtRotation(
  const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
  -> glm::quat
{
  constexpr float kEpsilon = 1e-12F;
  constexpr float kNudge = 1e-4F;

  // Backward axis: the object looks down its own -Z.
  glm::vec3 z_axis = eye - target;
  if (glm::dot(z_axis, z_axis) < kEpsilon) {
    z_axis = glm::vec3 { 0.0F, 0.0F, 1.0F };
  }
  z_axis = glm::normalize(z_axis);

  glm::vec3 x_axis = glm::cross(up, z_axis);
  if (glm::dot(x_axis, x_axis) < kEpsilon) {
    if (std::abs(up.z) == 1.0F) {
      z_axis.x += kNudge;
    } else {
      z_axis.z += kNudge;
    }
    z_axis = glm::normalize(z_axis);
    x_axis = glm::cross(up, z_axis);
  }
  x_axis = glm::normalize(x_axis);

  const glm::vec3 y_axis = glm::cross(z_axis, x_axis);

  const glm::mat3 basis { x_axis, y_axis, z_axis };
  return glm::normalize(glm::quat_cast(basis));
}

} // namespace photon::transforms
