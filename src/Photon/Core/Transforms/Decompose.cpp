//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/matrix_decompose.hpp>

#include <Photon/Core/Transforms/Decompose.h>

namespace photon::transforms {

namespace {
  constexpr float kMinScale = 1e-6F;

  const glm::quat kIdentityRotation { 1.0F, 0.0F, 0.0F, 0.0F };

  // Normalizes the three basis columns of the upper 3x3 block. Returns false
  // if any of them is too short to carry a direction.
  auto NormalizedBasis(const glm::mat4& transform, glm::vec3& scale,
    glm::mat3& basis) noexcept -> bool
  {
    const glm::vec3 basis_x { transform[0] };
    const glm::vec3 basis_y { transform[1] };
    const glm::vec3 basis_z { transform[2] };
    scale = glm::vec3 { glm::length(basis_x), glm::length(basis_y),
      glm::length(basis_z) };
    if (scale.x < kMinScale || scale.y < kMinScale || scale.z < kMinScale) {
      return false;
    }
    basis[0] = basis_x / scale.x;
    basis[1] = basis_y / scale.y;
    basis[2] = basis_z / scale.z;
    return true;
  }
} // namespace

auto TryDecomposeTransform(const glm::mat4& transform, glm::vec3& translation,
  glm::quat& rotation, glm::vec3& scale) -> bool
{
  if (!IsFinite(transform)) {
    return false;
  }

  glm::vec3 skew {};
  glm::vec4 perspective {};
  auto rotation_out = kIdentityRotation;
  auto scale_out = glm::vec3 { 1.0F, 1.0F, 1.0F };
  auto translation_out = glm::vec3 { 0.0F, 0.0F, 0.0F };

  if (!glm::decompose(transform, scale_out, rotation_out, translation_out, skew,
        perspective)) {
    return false;
  }

  rotation_out = glm::normalize(rotation_out);
  if (!IsFinite(translation_out) || !IsFinite(rotation_out)
    || !IsFinite(scale_out)) {
    return false;
  }

  translation = translation_out;
  rotation = rotation_out;
  scale = scale_out;
  return true;
}

auto DecomposeTransformOrFallback(const glm::mat4& transform,
  glm::vec3& translation, glm::quat& rotation, glm::vec3& scale) -> bool
{
  if (TryDecomposeTransform(transform, translation, rotation, scale)) {
    return false;
  }

  if (!IsFinite(transform)) {
    translation = glm::vec3 { 0.0F, 0.0F, 0.0F };
    rotation = kIdentityRotation;
    scale = glm::vec3 { 1.0F, 1.0F, 1.0F };
    return true;
  }

  translation = glm::vec3(transform[3]);

  glm::mat3 basis {};
  if (!NormalizedBasis(transform, scale, basis)) {
    rotation = kIdentityRotation;
    return true;
  }
  rotation = glm::normalize(glm::quat_cast(basis));
  if (!IsFinite(rotation)) {
    rotation = kIdentityRotation;
  }
  return true;
}

auto ExtractRotation(const glm::mat4& transform) -> glm::quat
{
  if (!IsFinite(transform)) {
    return kIdentityRotation;
  }

  glm::vec3 scale {};
  glm::mat3 basis {};
  if (!NormalizedBasis(transform, scale, basis)) {
    return kIdentityRotation;
  }

  const auto rotation = glm::normalize(glm::quat_cast(basis));
  return IsFinite(rotation) ? rotation : kIdentityRotation;
}

} // namespace photon::transforms
