// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/discovery/ObservationQueue.h"

#include "linkwatch/log/Log.h"

#include <algorithm>
#include <utility>
#include <variant>

namespace linkwatch::discovery {

ObservationQueue::ObservationQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool ObservationQueue::push(RawObservation obs) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        if (queue_.size() >= capacity_) {
            const auto dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
            if (dropped == 1 || dropped % 1000 == 0) {
                LWLOG_WARN("[discovery] observation queue full, dropped %llu",
                           static_cast<unsigned long long>(dropped));
            }
            // Status signals are not repeated by the source; counter samples are.
            auto victim = std::find_if(queue_.begin(), queue_.end(), [](const RawObservation& o) {
                return std::holds_alternative<RawCounterSample>(o);
            });
            if (victim != queue_.end()) {
                queue_.erase(victim);
            } else if (std::holds_alternative<RawCounterSample>(obs)) {
                return true;
            } else {
                queue_.pop_front();
            }
        }
        queue_.push_back(std::move(obs));
    }
    cv_.notify_one();
    return true;
}

std::size_t ObservationQueue::drain(const ObservationHandler& handler,
                                    std::chrono::milliseconds max_wait) {
    std::deque<RawObservation> batch;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, max_wait, [this] { return closed_ || !queue_.empty(); });
        batch.swap(queue_);
    }
    for (const auto& obs : batch) handler(obs);
    return batch.size();
}

void ObservationQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void ObservationQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

std::size_t ObservationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace linkwatch::discovery
