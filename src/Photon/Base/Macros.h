//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// use this inside a class declaration to make it non-copyable
#define PHOTON_MAKE_NON_COPYABLE(Type)                                         \
  Type(const Type&) = delete;                                                  \
  auto operator=(const Type&)->Type& = delete;

// use this inside a class declaration to make it non-movable
// NOLINTBEGIN
#define PHOTON_MAKE_NON_MOVABLE(Type)                                          \
  Type(Type&&) = delete;                                                       \
  auto operator=(Type&&)->Type& = delete;
// NOLINTEND

// use this inside a class declaration to declare default copy constructor and
// assignment operator
#define PHOTON_DEFAULT_COPYABLE(Type)                                          \
  Type(const Type&) = default;                                                 \
  auto operator=(const Type&)->Type& = default;

// use this inside a class declaration to declare default move constructor and
// move assignment operator
// NOLINTBEGIN
#define PHOTON_DEFAULT_MOVABLE(Type)                                           \
  Type(Type&&) = default;                                                      \
  auto operator=(Type&&)->Type& = default;
// NOLINTEND
