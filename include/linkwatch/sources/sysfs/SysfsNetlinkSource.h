// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "linkwatch/config/Config.h"
#include "linkwatch/discovery/ObservationQueue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace linkwatch {

/**
 * @brief Local interface discovery: sysfs counter polling plus rtnetlink.
 *
 * Two internal threads feed one ObservationQueue:
 *  - the poller reads <root>/<iface>/statistics/{rx,tx}_{bytes,packets}
 *    every poll interval and emits RawCounterSample, and reports operstate
 *    changes as RawLinkStatus;
 *  - the netlink listener joins RTMGRP_LINK and emits RawLinkStatus on
 *    RTM_NEWLINK / RTM_DELLINK when IFF_RUNNING flips.
 *
 * Both threads share one per-interface "last known up" table so a change
 * seen by either is reported once.
 */
class SysfsNetlinkSource final : public discovery::ObservationSource {
public:
    struct Options {
        std::string root = "/sys/class/net";             ///< sysfs net class directory.
        std::vector<std::string> interfaces{};          ///< Allow-list; empty = all but loopback.
        bool netlink = true;                            ///< Start the rtnetlink listener.
        std::chrono::milliseconds poll_interval{100};   ///< Counter polling period.
    };

    SysfsNetlinkSource() = default;
    ~SysfsNetlinkSource() override;

    void configure(const Options& opts);
    void configure_from_config(const Config& cfg);

    const char* name() const noexcept override { return "sysfs"; }

    /**
     * @brief Start the poller (and the netlink listener when enabled).
     *
     * Fails when the sysfs root does not exist. A netlink socket that cannot
     * be opened is logged and polling continues without it.
     */
    bool open() override;
    void close() override;
    bool poll(const discovery::ObservationHandler& handler,
              std::chrono::milliseconds max_wait) override;
    discovery::SourceStats stats() const override;

    /**
     * @brief Read every selected interface once and enqueue the results.
     *
     * Runs on the poller thread; exposed so tests can drive scans without
     * waiting on the timer.
     *
     * @return Number of counter samples enqueued.
     */
    std::size_t scan_once(Timestamp now);

    /// Interfaces under @p root that pass @p allow (loopback always skipped).
    static std::vector<std::string> list_interfaces(const std::string& root,
                                                    const std::vector<std::string>& allow);

    /// One counter sample for @p iface, or std::nullopt if a file is unreadable.
    static std::optional<discovery::RawCounterSample> read_counters(const std::string& root,
                                                                    const std::string& iface,
                                                                    Timestamp ts);

    /// operstate "up"/"unknown" => true, "down"/"lowerlayerdown"/... => false.
    static std::optional<bool> read_operstate(const std::string& root, const std::string& iface);

private:
    void poller_loop();
    void netlink_loop();
    bool open_netlink();
    void close_netlink();
    void handle_netlink_buffer(const char* data, std::size_t len, Timestamp ts);

    /// Emit a status only when it differs from the last one recorded for @p iface.
    void report_status(const std::string& iface, bool up, Timestamp ts);

    Options opts_{};
    discovery::ObservationQueue queue_{4096};

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread poller_thread_;
    std::thread netlink_thread_;

    int netlink_fd_{-1};
    int wake_fd_{-1};   ///< eventfd used to unblock the netlink poll().

    std::mutex status_mutex_;
    std::unordered_map<std::string, bool> last_up_;

    std::atomic<std::uint64_t> observations_{0};
    std::atomic<std::uint64_t> decode_errors_{0};
};

} // namespace linkwatch
