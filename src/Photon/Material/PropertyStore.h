//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <Photon/Base/Macros.h>
#include <Photon/Base/ObserverPtr.h>
#include <Photon/Material/Texture.h>
#include <Photon/Material/api_export.h>

namespace photon::material {

//! Value of a material property. `std::monostate` stands for "none".
/*!
 Enumerated properties are stored by name (`std::string`); textures are held by
 shared reference and compare by identity.
*/
using PropertyValue
  = std::variant<std::monostate, bool, float, std::string, TextureRef>;

//! Key-tagged, observable storage for material properties.
/*!
 The store does not validate anything: it holds values that the owning
 material has already validated. What it adds is change tracking. Set() only
 records (and reports) an actual change, and every change is pushed
 synchronously to the subscribers, so dependent systems never need to poll.

 ### Batching

 A `Batch` defers notifications until the outermost batch ends. Use it when a
 value and the flags derived from it change together, so that subscribers
 never observe one without the other. Each changed key is reported once, with
 its final value.

 @note Not thread-safe.
*/
class PropertyStore {
public:
  using ChangeCallback
    = std::function<void(std::string_view key, const PropertyValue& value)>;

  //! Move-only RAII handle on a change subscription.
  /*!
   Destroying (or cancelling) the subscription unregisters the callback. A
   subscription may safely outlive its store.
  */
  class Subscription {
  public:
    Subscription() noexcept = default;
    PHTN_MAT_API Subscription(Subscription&& other) noexcept;
    PHTN_MAT_API auto operator=(Subscription&& other) noexcept
      -> Subscription&;
    PHTN_MAT_API ~Subscription() noexcept;

    PHOTON_MAKE_NON_COPYABLE(Subscription)

    //! Explicitly cancel early; otherwise the destructor unsubscribes.
    PHTN_MAT_API void Cancel() noexcept;

    [[nodiscard]] auto IsActive() const noexcept -> bool
    {
      return id_ != 0 && !alive_token_.expired();
    }

  private:
    friend class PropertyStore;
    uint64_t id_ { 0 };
    observer_ptr<PropertyStore> owner_ { nullptr };
    std::weak_ptr<int> alive_token_ {};
  };

  //! RAII scope deferring change notifications.
  class Batch {
  public:
    PHTN_MAT_API explicit Batch(PropertyStore& store) noexcept;
    PHTN_MAT_API ~Batch() noexcept;

    PHOTON_MAKE_NON_COPYABLE(Batch)
    PHOTON_MAKE_NON_MOVABLE(Batch)

  private:
    PropertyStore& store_;
  };

  PHTN_MAT_API PropertyStore();
  ~PropertyStore() = default;

  // Subscriptions keep a pointer to the store; it must stay where it is.
  PHOTON_MAKE_NON_COPYABLE(PropertyStore)
  PHOTON_MAKE_NON_MOVABLE(PropertyStore)

  //! Stores `value` under `key`.
  /*!
   @return true if the stored value changed (the key was new, or held a
   different value), in which case subscribers are notified.
  */
  PHTN_MAT_API auto Set(std::string_view key, PropertyValue value) -> bool;

  //! Gets the value stored under `key`, or null if there is none.
  PHTN_MAT_NDAPI auto Get(std::string_view key) const noexcept
    -> observer_ptr<const PropertyValue>;

  //! Gets the value stored under `key` if it holds a `T`.
  template <typename T>
  [[nodiscard]] auto GetAs(const std::string_view key) const -> std::optional<T>
  {
    const auto value = Get(key);
    if (!value) {
      return std::nullopt;
    }
    if (const auto* typed = std::get_if<T>(value.get())) {
      return *typed;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto Contains(const std::string_view key) const noexcept
    -> bool
  {
    return static_cast<bool>(Get(key));
  }

  [[nodiscard]] auto Size() const noexcept -> std::size_t
  {
    return values_.size();
  }

  //! Registers `callback` to be invoked after each change.
  PHTN_MAT_NDAPI auto Subscribe(ChangeCallback callback) -> Subscription;

private:
  auto Unsubscribe(uint64_t id) noexcept -> void;
  auto Notify(std::string_view key, const PropertyValue& value) -> void;
  auto EndBatch() -> void;

  std::map<std::string, PropertyValue, std::less<>> values_ {};

  std::unordered_map<uint64_t, ChangeCallback> subscribers_ {};
  uint64_t next_subscriber_id_ { 1 };
  std::shared_ptr<int> alive_token_;

  int batch_depth_ { 0 };
  std::vector<std::string> pending_keys_ {};
};

} // namespace photon::material
