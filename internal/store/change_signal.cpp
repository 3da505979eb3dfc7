#include "change_signal.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gallery::store {

ChangeSignal::Subscription ChangeSignal::Subscribe(Handler handler) {
  if (!handler) {
    throw std::invalid_argument("change handler must not be empty");
  }

  const auto id = next_id_++;
  handlers_.push_back({id, std::move(handler)});
  return id;
}

bool ChangeSignal::Unsubscribe(Subscription subscription) {
  auto it = std::find_if(handlers_.begin(), handlers_.end(), [subscription](const Entry& entry) { return entry.id == subscription; });
  if (it == handlers_.end()) return false;

  handlers_.erase(it);
  return true;
}

void ChangeSignal::Fire() const {
  // Handlers may subscribe or unsubscribe while being notified;
  // iterate over the set registered when the signal fired.
  const auto snapshot = handlers_;
  for (const auto& entry : snapshot) {
    entry.handler();
  }
}

} // namespace gallery::store
