//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef PHTN_MAT_STATIC
#    define PHTN_MAT_API
#  else
#    ifdef PHTN_MAT_EXPORTS
#      define PHTN_MAT_API __declspec(dllexport)
#    else
#      define PHTN_MAT_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef PHTN_MAT_EXPORTS
#    define PHTN_MAT_API __attribute__((visibility("default")))
#  else
#    define PHTN_MAT_API
#  endif
#else
#  define PHTN_MAT_API
#endif

#define PHTN_MAT_NDAPI [[nodiscard]] PHTN_MAT_API
