// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file AgentEventCodec.h
 * @brief Validation and application of agent-submitted JSON events.
 *
 * Accepted document:
 *
 *   {
 *     "event_type": "link_state_change" | "metrics_update",
 *     "link_id":    "link1",          // or "interface": "eth1"
 *     "old_state":  "active",         // informational
 *     "new_state":  "down",           // required for link_state_change
 *     "metrics":    { "rx_bps": ... },// required for metrics_update
 *     "timestamp":  "2024-01-15T10:30:00Z" | 1705314600.0,
 *     "source":     "netlink"
 *   }
 *
 * The document is checked against a JSON schema before any field is read.
 */

#include "linkwatch/topology/Status.h"
#include "linkwatch/topology/TopologyStore.h"
#include "linkwatch/topology/Types.h"

#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>

#include <optional>
#include <string>
#include <vector>

namespace linkwatch::app {

struct AgentEvent {
    EventType type{EventType::MetricsUpdate};
    std::string link_id;                    ///< Empty when addressed by interface.
    std::string interface;
    std::optional<LinkState> old_state{};
    std::optional<LinkState> new_state{};
    std::optional<Metrics> metrics{};
    std::optional<Timestamp> timestamp{};
    std::string source{"agent"};
};

/// Per-item outcome of a batch submission.
struct BatchItemResult {
    std::string key;      ///< link_id or interface of the item, when readable.
    Status status;
};

class AgentEventCodec {
public:
    AgentEventCodec();

    /// JSON schema every agent document is validated against.
    static const nlohmann::json& schema();

    Status decode(const std::string& text, AgentEvent& out) const;
    Status decode(const nlohmann::json& doc, AgentEvent& out) const;

    /**
     * @brief Apply a decoded event to @p store.
     *
     * link_state_change becomes set_state(), metrics_update becomes
     * upsert_metrics(). A missing timestamp is replaced by @p received_at.
     */
    Status apply(const AgentEvent& event, TopologyStore& store, Timestamp received_at) const;

    /// decode() followed by apply().
    Status submit(const std::string& text, TopologyStore& store, Timestamp received_at) const;

    /**
     * @brief Submit a JSON array of events; each item succeeds or fails on its own.
     *
     * @param results Receives one entry per array item.
     * @return Validation when @p text is not a JSON array, Ok otherwise.
     */
    Status submit_batch(const std::string& text,
                        TopologyStore& store,
                        Timestamp received_at,
                        std::vector<BatchItemResult>& results) const;

private:
    nlohmann::json_schema::json_validator validator_;
};

} // namespace linkwatch::app
