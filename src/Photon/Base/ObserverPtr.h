//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace photon {

//! Concept for valid observer_ptr element types
template <typename T>
concept ObservableType = !std::is_reference_v<T>;

//! Non-owning pointer vocabulary type.
/*!
 Wraps a raw pointer to make the absence of ownership explicit in APIs and data
 structures. Used for every back-reference in Photon: a scene node observes its
 parent, a subscription observes the store it was obtained from.

 The observed object must outlive the observer_ptr, or the observer_ptr must be
 reset before the object goes away. observer_ptr never deletes anything.

 ```cpp
 photon::observer_ptr<SceneNode> parent = node.GetParent();
 if (parent) { parent->UpdateWorldMatrix(); }
 ```
*/
template <typename T>
  requires ObservableType<T>
class observer_ptr {
public:
  using element_type = T;

  constexpr observer_ptr() noexcept = default;

  constexpr observer_ptr(std::nullptr_t) noexcept { }

  constexpr explicit observer_ptr(T* p) noexcept
    : ptr_(p)
  {
  }

  constexpr observer_ptr(const observer_ptr&) noexcept = default;
  constexpr auto operator=(const observer_ptr&) noexcept
    -> observer_ptr& = default;

  //! Implicit conversion to observer_ptr<U> if T* converts to U*, e.g. to add
  //! const.
  template <typename U>
    requires ObservableType<U> && std::convertible_to<T*, U*>
  constexpr operator observer_ptr<U>() const noexcept
  {
    return observer_ptr<U>(ptr_);
  }

  constexpr explicit operator T*() const noexcept { return ptr_; }

  [[nodiscard]] constexpr auto get() const noexcept -> T* { return ptr_; }

  constexpr auto operator*() const noexcept -> T&
    requires(!std::is_void_v<T>)
  {
    return *ptr_;
  }

  constexpr auto operator->() const noexcept -> T* { return ptr_; }

  constexpr explicit operator bool() const noexcept { return ptr_ != nullptr; }

  constexpr void reset(T* p = nullptr) noexcept { ptr_ = p; }

  //! Stop watching the object and return the pointer that was watched.
  constexpr auto release() noexcept -> T* { return std::exchange(ptr_, nullptr); }

  constexpr auto operator==(const observer_ptr& other) const noexcept
    -> bool = default;

  constexpr auto operator<=>(const observer_ptr& other) const noexcept
    -> std::strong_ordering
  {
    return std::compare_three_way {}(ptr_, other.ptr_);
  }

  constexpr auto operator==(std::nullptr_t) const noexcept -> bool
  {
    return ptr_ == nullptr;
  }

private:
  T* ptr_ { nullptr };
};

template <typename T>
  requires ObservableType<T>
constexpr auto make_observer(T* p) noexcept -> observer_ptr<T>
{
  return observer_ptr<T>(p);
}

} // namespace photon

template <typename T>
  requires photon::ObservableType<T>
struct std::hash<photon::observer_ptr<T>> {
  auto operator()(const photon::observer_ptr<T>& p) const noexcept
    -> std::size_t
  {
    return std::hash<T*> {}(p.get());
  }
};
