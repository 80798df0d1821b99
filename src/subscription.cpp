#include "rtl433/subscription.hpp"

#include <algorithm>

namespace rtl433 {

namespace {

std::optional<ChangeEvent> pop_front(detail::EventQueue& q) {
    if (q.events.empty()) return std::nullopt;
    ChangeEvent event = std::move(q.events.front());
    q.events.pop_front();
    return event;
}

} // namespace

Subscription::Subscription(std::shared_ptr<detail::EventQueue> queue) : queue_(std::move(queue)) {}

Subscription::~Subscription() {
    cancel();
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        cancel();
        queue_ = std::move(other.queue_);
    }
    return *this;
}

std::optional<ChangeEvent> Subscription::next() {
    if (!queue_) return std::nullopt;
    std::unique_lock<std::mutex> lock(queue_->mutex);
    queue_->cv.wait(lock, [this] { return queue_->closed || !queue_->events.empty(); });
    return pop_front(*queue_);
}

std::optional<ChangeEvent> Subscription::next_for(std::chrono::milliseconds timeout) {
    if (!queue_) return std::nullopt;
    std::unique_lock<std::mutex> lock(queue_->mutex);
    queue_->cv.wait_for(lock, timeout, [this] { return queue_->closed || !queue_->events.empty(); });
    return pop_front(*queue_);
}

void Subscription::cancel() {
    if (!queue_) return;
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->closed = true;
        queue_->events.clear();
    }
    queue_->cv.notify_all();
}

bool Subscription::closed() const {
    if (!queue_) return true;
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->closed;
}

std::size_t Subscription::dropped() const {
    if (!queue_) return 0;
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->dropped;
}

std::size_t Subscription::pending() const {
    if (!queue_) return 0;
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->events.size();
}

EventHub::EventHub(std::size_t queue_limit) : queue_limit_(std::max<std::size_t>(queue_limit, 1)) {}

Subscription EventHub::subscribe() {
    auto queue = std::make_shared<detail::EventQueue>();
    std::lock_guard<std::mutex> lock(mutex_);
    queue->limit = queue_limit_;
    queue->closed = closed_;
    prune_locked();
    if (!closed_) queues_.push_back(queue);
    return Subscription(std::move(queue));
}

void EventHub::publish(const ChangeEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    ++published_;
    for (const auto& weak : queues_) {
        auto queue = weak.lock();
        if (!queue) continue;
        {
            std::lock_guard<std::mutex> qlock(queue->mutex);
            if (queue->closed) continue;
            if (queue->events.size() >= queue->limit) {
                queue->events.pop_front();
                ++queue->dropped;
                ++dropped_total_;
            }
            queue->events.push_back(event);
        }
        queue->cv.notify_one();
    }
}

void EventHub::publish(const std::vector<ChangeEvent>& events) {
    for (const auto& event : events) publish(event);
}

void EventHub::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (const auto& weak : queues_) {
        auto queue = weak.lock();
        if (!queue) continue;
        {
            std::lock_guard<std::mutex> qlock(queue->mutex);
            queue->closed = true;
        }
        queue->cv.notify_all();
    }
    queues_.clear();
}

void EventHub::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

void EventHub::set_queue_limit(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_limit_ = std::max<std::size_t>(limit, 1);
}

std::size_t EventHub::subscribers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t live = 0;
    for (const auto& weak : queues_) {
        auto queue = weak.lock();
        if (!queue) continue;
        std::lock_guard<std::mutex> qlock(queue->mutex);
        if (!queue->closed) ++live;
    }
    return live;
}

std::size_t EventHub::dropped_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_total_;
}

std::size_t EventHub::published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

void EventHub::prune_locked() {
    queues_.erase(std::remove_if(queues_.begin(), queues_.end(),
                                 [](const std::weak_ptr<detail::EventQueue>& weak) {
                                     auto queue = weak.lock();
                                     if (!queue) return true;
                                     std::lock_guard<std::mutex> qlock(queue->mutex);
                                     return queue->closed;
                                 }),
                  queues_.end());
}

} // namespace rtl433
