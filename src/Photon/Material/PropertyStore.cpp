//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <exception>
#include <utility>

#include <Photon/Base/Logging.h>
#include <Photon/Material/PropertyStore.h>

using photon::material::PropertyStore;
using photon::material::PropertyValue;

//=== Subscription ===--------------------------------------------------------//

PropertyStore::Subscription::Subscription(Subscription&& other) noexcept
  : id_(std::exchange(other.id_, 0))
  , owner_(std::exchange(other.owner_, nullptr))
  , alive_token_(std::move(other.alive_token_))
{
  other.alive_token_.reset();
}

auto PropertyStore::Subscription::operator=(Subscription&& other) noexcept
  -> Subscription&
{
  if (this != &other) {
    Cancel();
    id_ = std::exchange(other.id_, 0);
    owner_ = std::exchange(other.owner_, nullptr);
    alive_token_ = std::move(other.alive_token_);
    other.alive_token_.reset();
  }
  return *this;
}

PropertyStore::Subscription::~Subscription() noexcept { Cancel(); }

void PropertyStore::Subscription::Cancel() noexcept
{
  if (id_ == 0 || !owner_) {
    return;
  }
  if (!alive_token_.expired()) {
    owner_->Unsubscribe(id_);
  }
  id_ = 0;
  owner_ = nullptr;
  alive_token_.reset();
}

//=== Batch ===---------------------------------------------------------------//

PropertyStore::Batch::Batch(PropertyStore& store) noexcept
  : store_(store)
{
  ++store_.batch_depth_;
}

PropertyStore::Batch::~Batch() noexcept
{
  try {
    store_.EndBatch();
  } catch (const std::exception& ex) {
    LOG_F(ERROR, "property change notification failed: {}", ex.what());
  }
}

//=== PropertyStore ===-------------------------------------------------------//

PropertyStore::PropertyStore()
  : alive_token_(std::make_shared<int>(0))
{
}

auto PropertyStore::Set(const std::string_view key, PropertyValue value)
  -> bool
{
  auto it = values_.find(key);
  if (it == values_.end()) {
    it = values_.emplace(std::string(key), std::move(value)).first;
  } else if (it->second == value) {
    return false;
  } else {
    it->second = std::move(value);
  }

  DLOG_F(3, "property '{}' changed", key);
  if (batch_depth_ > 0) {
    if (std::ranges::find(pending_keys_, key) == pending_keys_.end()) {
      pending_keys_.emplace_back(key);
    }
  } else {
    Notify(it->first, it->second);
  }
  return true;
}

auto PropertyStore::Get(const std::string_view key) const noexcept
  -> observer_ptr<const PropertyValue>
{
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return observer_ptr<const PropertyValue> {};
  }
  return make_observer(&it->second);
}

auto PropertyStore::Subscribe(ChangeCallback callback) -> Subscription
{
  const auto id = next_subscriber_id_++;
  subscribers_.emplace(id, std::move(callback));

  Subscription subscription;
  subscription.id_ = id;
  subscription.owner_ = make_observer(this);
  subscription.alive_token_ = alive_token_;
  return subscription;
}

auto PropertyStore::Unsubscribe(const uint64_t id) noexcept -> void
{
  subscribers_.erase(id);
}

/*!
 Callbacks are invoked in subscription order. A callback may cancel any
 subscription, including its own, while being notified; cancelled callbacks
 that have not run yet are skipped. An exception escaping a callback is logged
 and does not prevent the other subscribers from being notified.
*/
auto PropertyStore::Notify(const std::string_view key, const PropertyValue& value)
  -> void
{
  std::vector<uint64_t> ids;
  ids.reserve(subscribers_.size());
  for (const auto& [id, callback] : subscribers_) {
    ids.push_back(id);
  }
  std::ranges::sort(ids);

  for (const auto id : ids) {
    const auto it = subscribers_.find(id);
    if (it == subscribers_.end()) {
      continue;
    }
    // Copy, so that the callback survives its own cancellation.
    const auto callback = it->second;
    try {
      callback(key, value);
    } catch (const std::exception& ex) {
      LOG_F(ERROR, "subscriber #{} failed on change of '{}': {}", id, key,
        ex.what());
    }
  }
}

auto PropertyStore::EndBatch() -> void
{
  if (--batch_depth_ > 0) {
    return;
  }
  auto keys = std::exchange(pending_keys_, {});
  for (const auto& key : keys) {
    if (const auto value = Get(key)) {
      Notify(key, *value);
    }
  }
}
