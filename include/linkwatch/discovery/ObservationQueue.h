// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "linkwatch/discovery/Observation.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace linkwatch::discovery {

/**
 * @brief Bounded hand-off between a source's internal threads and poll().
 *
 * Producers never block: when the queue is full the oldest counter sample
 * is discarded. Counter samples are cumulative, so losing one only widens
 * the next rate window. Link status signals are dropped only when nothing
 * but status signals is queued, oldest first.
 */
class ObservationQueue {
public:
    explicit ObservationQueue(std::size_t capacity = 4096);

    /// @return false when the queue is closed. An accepted push may still be counted in dropped().
    bool push(RawObservation obs);

    /**
     * @brief Wait up to @p max_wait for data, then hand everything queued to
     *        @p handler outside the lock.
     *
     * @return Number of observations delivered.
     */
    std::size_t drain(const ObservationHandler& handler, std::chrono::milliseconds max_wait);

    /// Wake waiters and reject further pushes.
    void close();

    /// Accept pushes again after close().
    void reopen();

    std::size_t size() const;
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RawObservation> queue_;
    bool closed_{false};
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace linkwatch::discovery
