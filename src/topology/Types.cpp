// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/topology/Types.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace linkwatch {
namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

const char* to_string(LinkState state) noexcept {
    switch (state) {
        case LinkState::Active: return "active";
        case LinkState::Idle:   return "idle";
        case LinkState::Down:   return "down";
    }
    return "unknown";
}

const char* to_string(NodeType type) noexcept {
    switch (type) {
        case NodeType::Router:  return "router";
        case NodeType::Switch:  return "switch";
        case NodeType::Host:    return "host";
        case NodeType::Server:  return "server";
        case NodeType::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Up:       return "up";
        case NodeStatus::Down:     return "down";
        case NodeStatus::Degraded: return "degraded";
        case NodeStatus::Unknown:  return "unknown";
    }
    return "unknown";
}

const char* to_string(EventType type) noexcept {
    switch (type) {
        case EventType::LinkStateChange: return "link_state_change";
        case EventType::MetricsUpdate:   return "metrics_update";
        case EventType::NodeAdded:       return "node_added";
        case EventType::NodeRemoved:     return "node_removed";
        case EventType::LinkAdded:       return "link_added";
        case EventType::LinkRemoved:     return "link_removed";
    }
    return "unknown";
}

std::optional<LinkState> parse_link_state(const std::string& text) {
    const auto s = lowercase(text);
    // Agents historically report "up_active"/"up_idle" for a running interface.
    if (s == "active" || s == "up_active") return LinkState::Active;
    if (s == "idle" || s == "up_idle") return LinkState::Idle;
    if (s == "down") return LinkState::Down;
    return std::nullopt;
}

std::optional<NodeType> parse_node_type(const std::string& text) {
    const auto s = lowercase(text);
    if (s == "router") return NodeType::Router;
    if (s == "switch") return NodeType::Switch;
    if (s == "host") return NodeType::Host;
    if (s == "server") return NodeType::Server;
    if (s == "unknown") return NodeType::Unknown;
    return std::nullopt;
}

std::optional<NodeStatus> parse_node_status(const std::string& text) {
    const auto s = lowercase(text);
    if (s == "up") return NodeStatus::Up;
    if (s == "down") return NodeStatus::Down;
    if (s == "degraded") return NodeStatus::Degraded;
    if (s == "unknown") return NodeStatus::Unknown;
    return std::nullopt;
}

std::optional<EventType> parse_event_type(const std::string& text) {
    const auto s = lowercase(text);
    if (s == "link_state_change") return EventType::LinkStateChange;
    if (s == "metrics_update") return EventType::MetricsUpdate;
    if (s == "node_added") return EventType::NodeAdded;
    if (s == "node_removed") return EventType::NodeRemoved;
    if (s == "link_added") return EventType::LinkAdded;
    if (s == "link_removed") return EventType::LinkRemoved;
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Timestamps
// -----------------------------------------------------------------------------

std::string format_timestamp(Timestamp ts) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(since_epoch / 1000);
    int ms = static_cast<int>(since_epoch % 1000);
    if (ms < 0) {
        ms += 1000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    double fraction = 0.0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        std::size_t end = pos + 1;
        while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
        if (end == pos + 1) return std::nullopt;
        fraction = std::stod("0" + text.substr(pos, end - pos));
        pos = end;
    }
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) ++pos;
    if (pos != text.size()) return std::nullopt;

    const std::time_t secs = timegm(&tm);
    const auto millis = static_cast<std::int64_t>(secs) * 1000 +
                        static_cast<std::int64_t>(std::llround(fraction * 1000.0));
    return Timestamp(std::chrono::milliseconds(millis));
}

double to_epoch_seconds(Timestamp ts) noexcept {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

bool epoch_seconds_in_range(double seconds) noexcept {
    return seconds >= 0.0 && seconds <= kMaxEpochSeconds;
}

Timestamp from_epoch_seconds(double seconds) noexcept {
    if (!(seconds >= 0.0)) seconds = 0.0;
    if (seconds > kMaxEpochSeconds) seconds = kMaxEpochSeconds;
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(seconds)));
}

// -----------------------------------------------------------------------------
// JSON rendering
// -----------------------------------------------------------------------------

nlohmann::json to_json(const Metrics& m) {
    nlohmann::json j = {
        {"rx_bps", m.rx_bps},
        {"tx_bps", m.tx_bps},
        {"rx_pps", m.rx_pps},
        {"tx_pps", m.tx_pps},
        {"rx_bytes_total", m.rx_bytes_total},
        {"tx_bytes_total", m.tx_bytes_total},
        {"utilization", m.utilization},
    };
    j["latency_ms"] = m.latency_ms ? nlohmann::json(*m.latency_ms) : nlohmann::json(nullptr);
    j["packet_loss"] = m.packet_loss ? nlohmann::json(*m.packet_loss) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json to_json(const Node& node) {
    nlohmann::json j = {
        {"id", node.id},
        {"label", node.label},
        {"type", to_string(node.type)},
        {"status", to_string(node.status)},
        {"platform", node.platform},
        {"metadata", node.metadata},
    };
    j["ip_address"] = node.ip_address ? nlohmann::json(*node.ip_address) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json to_json(const Link& link) {
    return {
        {"id", link.id},
        {"source", link.source_node_id},
        {"target", link.target_node_id},
        {"source_interface", link.source_interface},
        {"target_interface", link.target_interface},
        {"state", to_string(link.state)},
        {"metrics", to_json(link.metrics)},
        {"speed_mbps", link.speed_mbps},
        {"mtu", link.mtu},
        {"last_updated", format_timestamp(link.last_updated)},
        {"metadata", link.metadata},
    };
}

nlohmann::json to_json(const Event& event) {
    nlohmann::json data = nlohmann::json::object();
    if (!event.link_id.empty()) data["link_id"] = event.link_id;
    if (!event.node_id.empty()) data["node_id"] = event.node_id;
    if (event.old_state) data["old_state"] = to_string(*event.old_state);
    if (event.new_state) data["new_state"] = to_string(*event.new_state);
    if (event.metrics) data["metrics"] = to_json(*event.metrics);
    if (event.node) data["node"] = to_json(*event.node);
    if (event.link) data["link"] = to_json(*event.link);

    return {
        {"type", to_string(event.type)},
        {"sequence", event.sequence},
        {"data", data},
        {"timestamp", format_timestamp(event.timestamp)},
        {"source", event.source},
    };
}

} // namespace linkwatch
