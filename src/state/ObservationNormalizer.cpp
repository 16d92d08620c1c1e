// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/state/ObservationNormalizer.h"

#include "linkwatch/log/Log.h"

#include <algorithm>
#include <chrono>

namespace linkwatch::state {

std::optional<MetricsUpdate> ObservationNormalizer::apply(const discovery::RawCounterSample& sample,
                                                          const std::string& link_id,
                                                          std::uint32_t speed_mbps) {
    std::lock_guard<std::mutex> lock(mutex_);

    Baseline next{sample.rx_bytes, sample.tx_bytes, sample.rx_packets, sample.tx_packets,
                  sample.timestamp};

    auto it = baselines_.find(sample.key);
    if (it == baselines_.end()) {
        baselines_.emplace(sample.key, next);
        return std::nullopt;
    }
    Baseline& prev = it->second;

    const double elapsed = std::chrono::duration<double>(sample.timestamp - prev.timestamp).count();
    if (elapsed <= 0.0) {
        // Duplicate or out-of-order sample: keep the newer baseline.
        return std::nullopt;
    }

    if (sample.rx_bytes < prev.rx_bytes || sample.tx_bytes < prev.tx_bytes ||
        sample.rx_packets < prev.rx_packets || sample.tx_packets < prev.tx_packets) {
        LWLOG_DEBUG("[normalizer] counter reset on %s, reseeding baseline", sample.key.c_str());
        prev = next;
        ++resets_;
        return std::nullopt;
    }

    MetricsUpdate update;
    update.link_id = link_id;
    update.timestamp = sample.timestamp;

    Metrics& m = update.metrics;
    m.rx_bps = static_cast<double>(sample.rx_bytes - prev.rx_bytes) * 8.0 / elapsed;
    m.tx_bps = static_cast<double>(sample.tx_bytes - prev.tx_bytes) * 8.0 / elapsed;
    m.rx_pps = static_cast<double>(sample.rx_packets - prev.rx_packets) / elapsed;
    m.tx_pps = static_cast<double>(sample.tx_packets - prev.tx_packets) / elapsed;
    m.rx_bytes_total = sample.rx_bytes;
    m.tx_bytes_total = sample.tx_bytes;
    if (speed_mbps > 0) {
        const double capacity_bps = static_cast<double>(speed_mbps) * 1e6;
        m.utilization = std::clamp(std::max(m.rx_bps, m.tx_bps) / capacity_bps, 0.0, 1.0);
    }

    prev = next;
    return update;
}

void ObservationNormalizer::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    baselines_.erase(key);
}

std::size_t ObservationNormalizer::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return baselines_.size();
}

std::uint64_t ObservationNormalizer::resets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resets_;
}

} // namespace linkwatch::state
