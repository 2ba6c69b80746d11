#include "Events/EventBus.hpp"

namespace orbital::application {

  size_t EventBus::poll() {
    const size_t delivering = pending_;
    pending_ = 1 - pending_;

    Queue& queue = queues_[delivering];
    const size_t delivered = queue.size();
    for (const auto& event : queue) {
      deliver(*event);
    }
    queue.clear();
    return delivered;
  }

  void EventBus::deliver(const ParkedEvent& event) const {
    const auto it = handlers_.find(event.type());
    if (it == handlers_.end()) {
      return;
    }
    for (const auto& handler : it->second) {
      handler(event.get());
    }
  }

}  // namespace orbital::application
