// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "linkwatch/discovery/Observation.h"
#include "linkwatch/topology/Types.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace linkwatch::state {

/**
 * @brief Rates derived from two consecutive counter samples of one link.
 */
struct MetricsUpdate {
    std::string link_id;
    Metrics metrics{};
    Timestamp timestamp{};
};

/**
 * @brief Turns cumulative counters into bps/pps/utilization.
 *
 * Keeps one baseline per key. The first sample for a key only seeds the
 * baseline. A sample whose counters went backwards is a reset or wraparound:
 * the baseline is reseeded and nothing is emitted. Thread-safe.
 */
class ObservationNormalizer {
public:
    /**
     * @param link_id    Topology link the sample belongs to.
     * @param speed_mbps Nominal link speed; 0 means unknown (utilization 0).
     */
    std::optional<MetricsUpdate> apply(const discovery::RawCounterSample& sample,
                                       const std::string& link_id,
                                       std::uint32_t speed_mbps);

    /// Drop the baseline of @p key (e.g. after its link was removed).
    void forget(const std::string& key);

    std::size_t tracked() const;
    std::uint64_t resets() const;

private:
    struct Baseline {
        std::uint64_t rx_bytes{0};
        std::uint64_t tx_bytes{0};
        std::uint64_t rx_packets{0};
        std::uint64_t tx_packets{0};
        Timestamp timestamp{};
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Baseline> baselines_;
    std::uint64_t resets_{0};
};

} // namespace linkwatch::state
