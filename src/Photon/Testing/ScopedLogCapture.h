//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Photon/Base/Logging.h>
#include <Photon/Base/Macros.h>

namespace photon::testing {

//! Records the log messages emitted while it is alive.
/*!
 Installs a loguru callback on construction and removes it on destruction.
 Only messages at `max_verbosity` or more severe are kept, so a capture at
 `loguru::Verbosity_WARNING` sees warnings and errors only.

 ```cpp
 ScopedLogCapture capture { "cycle", loguru::Verbosity_WARNING };
 parent->AddChild(parent);
 EXPECT_TRUE(capture.Contains("cycle"));
 ```
*/
class ScopedLogCapture {
public:
  struct Entry {
    loguru::Verbosity verbosity;
    std::string text;
  };

  explicit ScopedLogCapture(std::string id = "ScopedLogCapture",
    const loguru::Verbosity max_verbosity = loguru::Verbosity_MAX)
    : id_(std::move(id))
  {
    loguru::add_callback(
      id_.c_str(), &ScopedLogCapture::OnLog, this, max_verbosity);
  }

  ~ScopedLogCapture() { (void)loguru::remove_callback(id_.c_str()); }

  PHOTON_MAKE_NON_COPYABLE(ScopedLogCapture)
  PHOTON_MAKE_NON_MOVABLE(ScopedLogCapture)

  [[nodiscard]] auto Contains(const std::string_view needle) const -> bool
  {
    return Count(needle) > 0;
  }

  [[nodiscard]] auto Count(const std::string_view needle) const -> int
  {
    int count = 0;
    for (const auto& entry : entries_) {
      if (entry.text.find(needle) != std::string::npos) {
        ++count;
      }
    }
    return count;
  }

  //! Number of captured errors (and more severe messages).
  [[nodiscard]] auto ErrorCount() const -> int
  {
    int count = 0;
    for (const auto& entry : entries_) {
      if (entry.verbosity <= loguru::Verbosity_ERROR) {
        ++count;
      }
    }
    return count;
  }

  [[nodiscard]] auto Entries() const -> const std::vector<Entry>&
  {
    return entries_;
  }

  void Clear() { entries_.clear(); }

private:
  static void OnLog(void* user_data, const loguru::Message& message)
  {
    auto* self = static_cast<ScopedLogCapture*>(user_data);
    if (self == nullptr || message.message == nullptr) {
      return;
    }
    self->entries_.push_back({ message.verbosity, message.message });
  }

  std::string id_;
  std::vector<Entry> entries_;
};

} // namespace photon::testing
