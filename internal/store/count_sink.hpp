#pragma once

#include <cstdint>
#include <optional>

namespace gallery::store {

/*
  Write-only targets for the store's derived counts.

  The store pushes both values after every mutation and after
  the startup load of predefined requests.
*/
class CountSink {
 public:
  virtual ~CountSink() = default;

  virtual void SetArtworkCount(std::int64_t count)       = 0;
  virtual void SetActiveRequestCount(std::int64_t count) = 0;
};

// Keeps the last pushed values; nullopt until the first push.
class LatestCountSink final : public CountSink {
 public:
  void SetArtworkCount(std::int64_t count) override {
    artwork_count_ = count;
  }

  void SetActiveRequestCount(std::int64_t count) override {
    active_request_count_ = count;
  }

  std::optional<std::int64_t> artwork_count() const {
    return artwork_count_;
  }

  std::optional<std::int64_t> active_request_count() const {
    return active_request_count_;
  }

 private:
  std::optional<std::int64_t> artwork_count_;
  std::optional<std::int64_t> active_request_count_;
};

} // namespace gallery::store
