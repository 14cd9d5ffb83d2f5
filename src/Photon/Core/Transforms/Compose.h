//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/fwd.hpp>

#include <Photon/Core/api_export.h>

namespace photon::transforms {

//! Composes a transform matrix from translation, rotation and scale.
/*!
 @return T x R x S, i.e. scale is applied first and translation last.
*/
PHTN_CORE_NDAPI auto ComposeTrs(const glm::vec3& translation,
  const glm::quat& rotation, const glm::vec3& scale) -> glm::mat4;

//! Orientation that makes an object at `eye` face `target`.
/*!
 Follows the camera convention: the local -Z axis of the resulting rotation
 points from `eye` toward `target`, and the local +Y axis is as close to `up`
 as the view direction allows.

 Degenerate inputs are resolved rather than rejected:
 - `eye == target`: the view axis falls back to +Z, which with the default up
   vector yields the identity rotation.
 - `up` parallel to the view direction: the view axis is nudged by 1e-4 on a
   perpendicular component so that a right vector can still be formed.
*/
PHTN_CORE_NDAPI auto LookAtRotation(const glm::vec3& eye,
  const glm::vec3& target, const glm::vec3& up) -> glm::quat;

} // namespace photon::transforms
