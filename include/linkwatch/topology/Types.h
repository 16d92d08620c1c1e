// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Types.h
 * @brief Topology data model: nodes, links, metrics and bus events.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace linkwatch {

/// Wall-clock timestamp carried by observations, records and events.
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class LinkState {
    Active,  ///< Link up, traffic flowing.
    Idle,    ///< Link up, no traffic.
    Down     ///< Link down.
};

enum class NodeType { Router, Switch, Host, Server, Unknown };

enum class NodeStatus { Up, Down, Degraded, Unknown };

enum class EventType {
    LinkStateChange,
    MetricsUpdate,
    NodeAdded,
    NodeRemoved,
    LinkAdded,
    LinkRemoved
};

const char* to_string(LinkState state) noexcept;
const char* to_string(NodeType type) noexcept;
const char* to_string(NodeStatus status) noexcept;
const char* to_string(EventType type) noexcept;

std::optional<LinkState> parse_link_state(const std::string& text);
std::optional<NodeType> parse_node_type(const std::string& text);
std::optional<NodeStatus> parse_node_status(const std::string& text);
std::optional<EventType> parse_event_type(const std::string& text);

/**
 * @brief Traffic metrics of a link. Rates are per second; bps counts bits.
 */
struct Metrics {
    double rx_bps{0.0};
    double tx_bps{0.0};
    double rx_pps{0.0};
    double tx_pps{0.0};
    std::uint64_t rx_bytes_total{0};   ///< Monotonic counter (may wrap or reset upstream).
    std::uint64_t tx_bytes_total{0};
    double utilization{0.0};           ///< Always within [0, 1].
    std::optional<double> latency_ms{};
    std::optional<double> packet_loss{};

    /// True when either direction carries traffic.
    bool has_traffic() const noexcept { return rx_bps > 0.0 || tx_bps > 0.0; }
};

using Metadata = std::map<std::string, std::string>;

struct Node {
    std::string id;
    std::string label;
    NodeType type{NodeType::Router};
    NodeStatus status{NodeStatus::Unknown};
    std::string platform;
    std::optional<std::string> ip_address{};
    Metadata metadata;
};

struct Link {
    std::string id;
    std::string source_node_id;
    std::string target_node_id;
    std::string source_interface;
    std::string target_interface;
    LinkState state{LinkState::Idle};
    Metrics metrics{};
    std::uint32_t speed_mbps{0};
    std::uint32_t mtu{1500};
    Timestamp last_updated{};
    Metadata metadata;
};

/**
 * @brief Record published on the event bus.
 *
 * Link events carry link_id, node events node_id. State changes fill
 * old_state/new_state; metrics updates fill metrics. Added events carry a
 * copy of the created entity for subscribers that render the graph.
 */
struct Event {
    EventType type{EventType::MetricsUpdate};
    std::uint64_t sequence{0};          ///< Assigned by EventBus::publish().
    std::string link_id;
    std::string node_id;
    std::optional<LinkState> old_state{};
    std::optional<LinkState> new_state{};
    std::optional<Metrics> metrics{};
    std::optional<Node> node{};
    std::optional<Link> link{};
    Timestamp timestamp{};
    std::string source{"api"};
};

/**
 * @brief Point-in-time copy of the whole topology.
 */
struct TopologySnapshot {
    std::vector<Node> nodes;
    std::vector<Link> links;
    Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// Timestamp helpers
// -----------------------------------------------------------------------------

/// ISO-8601 UTC with millisecond precision, e.g. "2024-01-15T10:30:00.000Z".
std::string format_timestamp(Timestamp ts);

/// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z]" (UTC).
std::optional<Timestamp> parse_timestamp(const std::string& text);

/// Latest accepted observation time, 2100-01-01T00:00:00Z. Nanosecond
/// system_clock time points overflow in 2262.
constexpr double kMaxEpochSeconds = 4102444800.0;

/// True when @p seconds lies in [0, kMaxEpochSeconds].
bool epoch_seconds_in_range(double seconds) noexcept;

double to_epoch_seconds(Timestamp ts) noexcept;

/// Values outside [0, kMaxEpochSeconds] are clamped; check epoch_seconds_in_range() to reject them.
Timestamp from_epoch_seconds(double seconds) noexcept;

// -----------------------------------------------------------------------------
// JSON rendering (history dumps, logs, agent payloads)
// -----------------------------------------------------------------------------

nlohmann::json to_json(const Metrics& metrics);
nlohmann::json to_json(const Node& node);
nlohmann::json to_json(const Link& link);
nlohmann::json to_json(const Event& event);

} // namespace linkwatch
