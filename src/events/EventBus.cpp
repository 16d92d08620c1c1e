// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/events/EventBus.h"

#include "linkwatch/log/Log.h"

#include <algorithm>
#include <iterator>

namespace linkwatch::events {

// -----------------------------------------------------------------------------
// Subscription
// -----------------------------------------------------------------------------

Subscription::Subscription(std::uint64_t id, std::set<EventType> filter, std::size_t capacity)
    : id_(id), filter_(std::move(filter)), capacity_(std::max<std::size_t>(capacity, 1)) {}

bool Subscription::wants(EventType type) const noexcept {
    return filter_.empty() || filter_.count(type) != 0;
}

void Subscription::push(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (buffer_.size() >= capacity_) {
            buffer_.pop_front();
            const auto dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
            // Log the first drop and then every 1000th to keep slow consumers visible.
            if (dropped == 1 || dropped % 1000 == 0) {
                LWLOG_WARN("[bus] subscriber %llu lagging, dropped %llu events",
                           static_cast<unsigned long long>(id_),
                           static_cast<unsigned long long>(dropped));
            }
        }
        buffer_.push_back(event);
    }
    cv_.notify_one();
}

std::optional<Event> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !buffer_.empty(); });
    if (buffer_.empty()) return std::nullopt;
    Event event = std::move(buffer_.front());
    buffer_.pop_front();
    delivered_.fetch_add(1, std::memory_order_relaxed);
    return event;
}

std::vector<Event> Subscription::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out(std::make_move_iterator(buffer_.begin()),
                           std::make_move_iterator(buffer_.end()));
    buffer_.clear();
    delivered_.fetch_add(out.size(), std::memory_order_relaxed);
    return out;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Subscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t Subscription::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------

EventBus::EventBus(EventBusOptions opts) : opts_(opts) {}

EventBus::~EventBus() {
    shutdown();
}

SubscriptionPtr EventBus::subscribe(std::set<EventType> filter, std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return nullptr;
    auto sub = std::make_shared<Subscription>(next_subscriber_id_++, std::move(filter),
                                              capacity ? capacity : opts_.subscriber_buffer);
    subscribers_.push_back(sub);
    LWLOG_DEBUG("[bus] subscriber %llu attached (total %zu)",
                static_cast<unsigned long long>(sub->id()), subscribers_.size());
    return sub;
}

void EventBus::unsubscribe(const SubscriptionPtr& sub) {
    if (!sub) return;
    sub->close();
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), sub),
                       subscribers_.end());
    LWLOG_DEBUG("[bus] subscriber %llu detached (total %zu)",
                static_cast<unsigned long long>(sub->id()), subscribers_.size());
}

std::uint64_t EventBus::publish(Event event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return 0;

    event.sequence = next_sequence_++;
    if (event.timestamp == Timestamp{}) event.timestamp = Clock::now();

    if (opts_.history_size > 0) {
        if (history_.size() >= opts_.history_size) history_.pop_front();
        history_.push_back(event);
    }

    // Subscription::push only takes the subscriber's own lock and never
    // waits on the consumer, so holding mutex_ here keeps the global publish
    // order identical for every subscriber.
    for (const auto& sub : subscribers_) {
        if (sub->wants(event.type)) sub->push(event);
    }

    published_.fetch_add(1, std::memory_order_relaxed);
    LWLOG_TRACE("[bus] published %s", to_json(event).dump().c_str());
    return event.sequence;
}

std::vector<Event> EventBus::history(std::optional<EventType> type, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out;
    for (const auto& e : history_) {
        if (!type || e.type == *type) out.push_back(e);
    }
    if (out.size() > limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return out;
}

void EventBus::shutdown() {
    std::vector<SubscriptionPtr> subs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        subs.swap(subscribers_);
    }
    for (const auto& sub : subs) sub->close();
    LWLOG_DEBUG("[bus] shut down, closed %zu subscriptions", subs.size());
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace linkwatch::events
