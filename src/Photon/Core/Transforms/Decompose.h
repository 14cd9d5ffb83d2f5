//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/fwd.hpp>

#include <Photon/Core/Transforms/IsFinite.h>
#include <Photon/Core/api_export.h>

namespace photon::transforms {

//! Strict TRS decomposition with no fallbacks.
/*!
 Returns false, leaving the outputs untouched, when the matrix is non-finite or
 cannot be decomposed into a valid TRS representation.
*/
PHTN_CORE_NDAPI auto TryDecomposeTransform(const glm::mat4& transform,
  glm::vec3& translation, glm::quat& rotation, glm::vec3& scale) -> bool;

//! Decompose a transform and apply a best-effort fallback when needed.
/*!
 Always produces a TRS. Non-finite input yields identity TRS output. If any
 axis scale is near zero, the rotation is set to identity while preserving the
 extracted translation and scale.

 @return True when the fallback path is used.
*/
PHTN_CORE_API auto DecomposeTransformOrFallback(const glm::mat4& transform,
  glm::vec3& translation, glm::quat& rotation, glm::vec3& scale) -> bool;

//! Rotation part of an affine transform, with the scale of each basis axis
//! removed.
/*!
 Translation and skew are ignored. A degenerate (near-zero) axis or non-finite
 input yields the identity rotation.
*/
PHTN_CORE_NDAPI auto ExtractRotation(const glm::mat4& transform) -> glm::quat;

} // namespace photon::transforms
