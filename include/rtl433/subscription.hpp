#pragma once

#include "rtl433/device_registry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rtl433 {

namespace detail {

// Bounded per-subscriber queue shared between the hub and one Subscription.
struct EventQueue {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<ChangeEvent> events;
    std::size_t limit{1024};
    std::size_t dropped{0};
    bool closed{false};
};

} // namespace detail

// Receiving end of the change feed. Move-only; destroying it detaches from
// the hub without affecting other subscribers.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::shared_ptr<detail::EventQueue> queue);
    ~Subscription();

    Subscription(Subscription&&) noexcept = default;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Block until an event arrives. Empty once the feed is closed or
    // cancelled and no queued events remain.
    std::optional<ChangeEvent> next();

    // As next(), giving up after `timeout` (also empty then; check closed()).
    std::optional<ChangeEvent> next_for(std::chrono::milliseconds timeout);

    // Detach and wake any blocked next(). Queued events are discarded.
    void cancel();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] bool valid() const { return queue_ != nullptr; }
    // Events discarded because this subscriber fell behind.
    [[nodiscard]] std::size_t dropped() const;
    [[nodiscard]] std::size_t pending() const;

private:
    std::shared_ptr<detail::EventQueue> queue_;
};

// Fans change events out to every live subscription. When a subscriber's
// queue is full the oldest event is dropped and counted.
class EventHub {
public:
    explicit EventHub(std::size_t queue_limit = 1024);

    Subscription subscribe();

    void publish(const ChangeEvent& event);
    void publish(const std::vector<ChangeEvent>& events);

    // Close every current subscription; their next() drains what is queued
    // and then returns empty. Subscriptions taken afterwards start closed
    // until reopen().
    void close();
    void reopen();

    void set_queue_limit(std::size_t limit);

    [[nodiscard]] std::size_t subscribers() const;
    [[nodiscard]] std::size_t dropped_total() const;
    [[nodiscard]] std::size_t published() const;

private:
    void prune_locked();

    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<detail::EventQueue>> queues_;
    std::size_t queue_limit_;
    bool closed_{false};
    std::size_t dropped_total_{0};
    std::size_t published_{0};
};

} // namespace rtl433
