// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/state/IdleSweeper.h"

#include "linkwatch/log/Log.h"
#include "linkwatch/topology/TopologyStore.h"

#include <algorithm>

namespace linkwatch::state {

IdleSweeper::IdleSweeper(TopologyStore& store,
                         std::chrono::milliseconds idle_timeout,
                         std::chrono::milliseconds interval)
    : store_(store),
      idle_timeout_(idle_timeout),
      interval_(std::max(interval, std::chrono::milliseconds(1))) {}

IdleSweeper::~IdleSweeper() {
    stop();
}

void IdleSweeper::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&IdleSweeper::loop, this);
    LWLOG_INFO("[sweeper] started (timeout=%lld ms, interval=%lld ms)",
               static_cast<long long>(idle_timeout_.count()),
               static_cast<long long>(interval_.count()));
}

void IdleSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    if (running_.exchange(false)) {
        LWLOG_INFO("[sweeper] stopped after %llu sweeps",
                   static_cast<unsigned long long>(sweeps_.load()));
    }
}

std::size_t IdleSweeper::sweep_once() {
    const auto demoted = store_.sweep_idle(Clock::now(), idle_timeout_);
    sweeps_.fetch_add(1);
    if (demoted) {
        demoted_.fetch_add(demoted);
        LWLOG_DEBUG("[sweeper] %zu link(s) demoted to idle", demoted);
    }
    return demoted;
}

void IdleSweeper::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;
        lock.unlock();
        sweep_once();
        lock.lock();
    }
}

} // namespace linkwatch::state
