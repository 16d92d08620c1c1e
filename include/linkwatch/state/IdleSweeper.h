// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace linkwatch {
class TopologyStore;
}

namespace linkwatch::state {

/**
 * @brief Background thread that periodically applies the idle timeout.
 *
 * The sweep interval is independent of the timeout itself. stop() wakes the
 * thread immediately instead of waiting out the interval.
 */
class IdleSweeper {
public:
    IdleSweeper(TopologyStore& store,
                std::chrono::milliseconds idle_timeout,
                std::chrono::milliseconds interval);
    ~IdleSweeper();

    IdleSweeper(const IdleSweeper&) = delete;
    IdleSweeper& operator=(const IdleSweeper&) = delete;

    void start();
    void stop();

    /// Run one sweep on the caller's thread.
    std::size_t sweep_once();

    bool running() const noexcept { return running_.load(); }
    std::uint64_t sweeps() const noexcept { return sweeps_.load(); }
    std::uint64_t demoted() const noexcept { return demoted_.load(); }

private:
    void loop();

    TopologyStore& store_;
    const std::chrono::milliseconds idle_timeout_;
    const std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::atomic<std::uint64_t> sweeps_{0};
    std::atomic<std::uint64_t> demoted_{0};
};

} // namespace linkwatch::state
