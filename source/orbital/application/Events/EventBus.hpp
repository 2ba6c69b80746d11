#pragma once

#include <array>
#include <functional>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

#include "common.hpp"

namespace orbital::application {

  /**
   * Carries camera and control edits from the host to the CameraSystem. Edits emitted while a
   * frame runs are parked in the pending slot; poll() between frames flips the slots and hands
   * the parked edits to their handlers, so no orbit camera changes halfway through an update.
   */
  class EventBus {
  public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // handlers for one event type run in subscription order
    template <typename T> void subscribe(std::function<void(const T&)> handler) {
      handlers_[std::type_index(typeid(T))].emplace_back(
          [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const T*>(event));
          });
    }

    template <typename T> void emit(const T& event) {
      queues_[pending_].push_back(std::make_unique<Parked<T>>(event));
    }

    /**
     * Delivers every event emitted since the previous poll and returns how many there were.
     * Handlers that emit again land in the next poll.
     */
    size_t poll();

    [[nodiscard]] size_t pending_events() const { return queues_[pending_].size(); }

  private:
    struct ParkedEvent {
      virtual ~ParkedEvent() = default;
      [[nodiscard]] virtual std::type_index type() const = 0;
      [[nodiscard]] virtual const void* get() const = 0;
    };

    template <typename T> struct Parked final : ParkedEvent {
      explicit Parked(const T& event) : event_(event) {}

      [[nodiscard]] std::type_index type() const override { return std::type_index(typeid(T)); }
      [[nodiscard]] const void* get() const override { return &event_; }

      T event_;
    };

    using Handler = std::function<void(const void*)>;
    using Queue = std::vector<std::unique_ptr<ParkedEvent>>;

    void deliver(const ParkedEvent& event) const;

    std::unordered_map<std::type_index, std::vector<Handler>> handlers_;

    std::array<Queue, 2> queues_;
    size_t pending_{0};
  };

}  // namespace orbital::application
