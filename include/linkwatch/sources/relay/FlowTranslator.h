// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file FlowTranslator.h
 * @brief Maps relay flow records and endpoint updates onto topology links.
 */

#include "linkwatch/discovery/Observation.h"

#include "relay.pb.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace linkwatch {

/**
 * @brief Stateful translation from the relay's endpoint view to link counters.
 *
 * Endpoint updates maintain an endpoint -> (link, side) cache. Each flow whose
 * source or destination is bound adds its bytes/packets to that link's
 * cumulative counters: traffic leaving the link's source side counts as tx,
 * traffic leaving the target side as rx. The resulting RawCounterSample is
 * keyed by link id, so the normalizer sees a monotonically growing counter
 * exactly like a kernel interface.
 *
 * Not thread-safe; the relay source serialises access.
 */
class FlowTranslator {
public:
    enum class Side { Source, Target };

    struct Binding {
        std::string link_id;
        Side side{Side::Source};
    };

    /// Label keys consulted when an update carries no explicit link/side.
    static constexpr const char* kLinkLabel = "linkwatch.io/link";
    static constexpr const char* kSideLabel = "linkwatch.io/side";

    /// "namespace/pod", else the IP, else "identity:N".
    static std::string endpoint_key(const relay::Endpoint& endpoint);

    /**
     * @brief Apply an endpoint add/modify/delete.
     *
     * Deleting a bound endpoint yields RawLinkStatus{down, endpoint_deleted};
     * binding an endpoint again to a link that lost one yields {up}.
     */
    std::vector<discovery::RawObservation> on_endpoint(const relay::EndpointUpdate& update,
                                                       Timestamp fallback_ts);

    /**
     * @brief Account one flow record.
     *
     * @return Updated cumulative counters of the affected link, or nullopt for
     *         unmapped endpoints and DROPPED/ERROR verdicts.
     */
    std::optional<discovery::RawCounterSample> on_flow(const relay::FlowRecord& flow,
                                                       Timestamp fallback_ts);

    std::optional<Binding> binding(const std::string& endpoint_key) const;
    std::size_t bound_endpoints() const noexcept { return endpoints_.size(); }
    std::uint64_t unmapped_flows() const noexcept { return unmapped_flows_; }
    std::uint64_t dropped_flows() const noexcept { return dropped_flows_; }

private:
    struct Counters {
        std::uint64_t rx_bytes{0};
        std::uint64_t tx_bytes{0};
        std::uint64_t rx_packets{0};
        std::uint64_t tx_packets{0};
    };

    std::unordered_map<std::string, Binding> endpoints_;
    std::unordered_map<std::string, Counters> counters_;
    std::unordered_set<std::string> severed_links_;   ///< Links reported down by endpoint deletion.
    std::uint64_t unmapped_flows_{0};
    std::uint64_t dropped_flows_{0};
};

/// Nanoseconds since the epoch, or @p fallback when @p nanos is 0.
Timestamp timestamp_from_unix_nanos(std::int64_t nanos, Timestamp fallback);

} // namespace linkwatch
