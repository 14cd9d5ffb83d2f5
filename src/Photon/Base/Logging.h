//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// Single entry point to the logging library. Everything in Photon logs through
// loguru with fmt-style format strings, e.g. `LOG_F(INFO, "node '{}'", name)`.
// The build must define LOGURU_USE_FMTLIB=1 for every target including this
// header, otherwise the `{}` placeholders are interpreted as printf formats.

#if !defined(LOGURU_USE_FMTLIB) || LOGURU_USE_FMTLIB != 1
#  error "Photon requires loguru to be built with LOGURU_USE_FMTLIB=1"
#endif

#include <loguru.hpp>
