#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace gallery::store {

/*
  Payload-less change notification.

  Handlers run synchronously in registration order. An exception
  thrown by a handler propagates out of Fire() and skips the
  handlers registered after it.
*/
class ChangeSignal {
 public:
  using Handler      = std::function<void()>;
  using Subscription = std::uint64_t;

  Subscription Subscribe(Handler handler);
  bool         Unsubscribe(Subscription subscription);

  void Fire() const;

  std::size_t Size() const {
    return handlers_.size();
  }

 private:
  struct Entry {
    Subscription id;
    Handler      handler;
  };

  std::vector<Entry> handlers_;
  Subscription       next_id_ = 1;
};

} // namespace gallery::store
