// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file EventBus.h
 * @brief In-process publish/subscribe with per-subscriber buffers and a history ring.
 *
 * Delivery policy
 * ---------------
 *  - publish() never blocks on consumers. Each Subscription owns a bounded
 *    buffer; when it is full the OLDEST buffered event is discarded and the
 *    subscription's dropped() counter increases. Retained events keep their
 *    generation order.
 *  - The history ring keeps the most recent N events regardless of how far
 *    behind any subscriber is.
 *  - shutdown() closes every subscription and wakes blocked consumers.
 */

#include "linkwatch/topology/Types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace linkwatch::events {

/**
 * @brief One consumer's view of the bus.
 *
 * Produced by EventBus::subscribe(); the consumer drains it with next() from
 * its own thread.
 */
class Subscription {
public:
    Subscription(std::uint64_t id, std::set<EventType> filter, std::size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    std::uint64_t id() const noexcept { return id_; }

    /// True when @p type passes this subscription's filter (empty = all).
    bool wants(EventType type) const noexcept;

    /**
     * @brief Wait up to @p timeout for the next event.
     *
     * @return std::nullopt on timeout or once the subscription is closed and
     *         drained.
     */
    std::optional<Event> next(std::chrono::milliseconds timeout);

    /// Non-blocking drain of everything currently buffered.
    std::vector<Event> drain();

    void close();
    bool closed() const;

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::uint64_t delivered() const noexcept { return delivered_.load(std::memory_order_relaxed); }
    std::size_t buffered() const;

private:
    friend class EventBus;

    /// Called by the bus; drops the oldest event when full.
    void push(const Event& event);

    const std::uint64_t id_;
    const std::set<EventType> filter_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> buffer_;
    bool closed_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> delivered_{0};
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

struct EventBusOptions {
    std::size_t history_size = 100;       ///< Events kept for history queries.
    std::size_t subscriber_buffer = 256;  ///< Default per-subscription capacity.
};

/**
 * @brief Lifecycle-managed event bus; create one per daemon (or per test).
 */
class EventBus {
public:
    explicit EventBus(EventBusOptions opts = {});
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Attach a new subscriber.
     *
     * @param filter   Event types to receive; empty receives everything.
     * @param capacity Buffer size; 0 uses EventBusOptions::subscriber_buffer.
     * @return nullptr after shutdown().
     */
    SubscriptionPtr subscribe(std::set<EventType> filter = {}, std::size_t capacity = 0);

    void unsubscribe(const SubscriptionPtr& sub);

    /**
     * @brief Stamp a sequence number, record in history and fan out.
     *
     * @return The sequence number assigned, 0 when the bus is shut down.
     */
    std::uint64_t publish(Event event);

    /**
     * @brief Most recent events, oldest first, optionally filtered by type.
     */
    std::vector<Event> history(std::optional<EventType> type = std::nullopt,
                               std::size_t limit = 100) const;

    void shutdown();

    std::size_t subscriber_count() const;
    std::uint64_t published() const noexcept { return published_.load(std::memory_order_relaxed); }

private:
    const EventBusOptions opts_;

    mutable std::mutex mutex_;
    std::vector<SubscriptionPtr> subscribers_;
    std::deque<Event> history_;
    std::uint64_t next_sequence_{1};
    std::uint64_t next_subscriber_id_{1};
    bool shut_down_{false};

    std::atomic<std::uint64_t> published_{0};
};

} // namespace linkwatch::events
