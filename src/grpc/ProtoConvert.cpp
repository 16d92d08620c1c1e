// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/grpc/ProtoConvert.h"

namespace linkwatch::grpc_service {

api::LinkState to_proto(LinkState state) {
    switch (state) {
        case LinkState::Active: return api::LINK_STATE_ACTIVE;
        case LinkState::Idle:   return api::LINK_STATE_IDLE;
        case LinkState::Down:   return api::LINK_STATE_DOWN;
    }
    return api::LINK_STATE_UNSPECIFIED;
}

api::NodeType to_proto(NodeType type) {
    switch (type) {
        case NodeType::Router:  return api::NODE_TYPE_ROUTER;
        case NodeType::Switch:  return api::NODE_TYPE_SWITCH;
        case NodeType::Host:    return api::NODE_TYPE_HOST;
        case NodeType::Server:  return api::NODE_TYPE_SERVER;
        case NodeType::Unknown: return api::NODE_TYPE_UNKNOWN;
    }
    return api::NODE_TYPE_UNSPECIFIED;
}

api::NodeStatus to_proto(NodeStatus status) {
    switch (status) {
        case NodeStatus::Up:       return api::NODE_STATUS_UP;
        case NodeStatus::Down:     return api::NODE_STATUS_DOWN;
        case NodeStatus::Degraded: return api::NODE_STATUS_DEGRADED;
        case NodeStatus::Unknown:  return api::NODE_STATUS_UNKNOWN;
    }
    return api::NODE_STATUS_UNSPECIFIED;
}

api::EventType to_proto(EventType type) {
    switch (type) {
        case EventType::LinkStateChange: return api::EVENT_TYPE_LINK_STATE_CHANGE;
        case EventType::MetricsUpdate:   return api::EVENT_TYPE_METRICS_UPDATE;
        case EventType::NodeAdded:       return api::EVENT_TYPE_NODE_ADDED;
        case EventType::NodeRemoved:     return api::EVENT_TYPE_NODE_REMOVED;
        case EventType::LinkAdded:       return api::EVENT_TYPE_LINK_ADDED;
        case EventType::LinkRemoved:     return api::EVENT_TYPE_LINK_REMOVED;
    }
    return api::EVENT_TYPE_UNSPECIFIED;
}

std::optional<LinkState> from_proto(api::LinkState state) {
    switch (state) {
        case api::LINK_STATE_ACTIVE: return LinkState::Active;
        case api::LINK_STATE_IDLE:   return LinkState::Idle;
        case api::LINK_STATE_DOWN:   return LinkState::Down;
        default:                     return std::nullopt;
    }
}

std::optional<EventType> from_proto(api::EventType type) {
    switch (type) {
        case api::EVENT_TYPE_LINK_STATE_CHANGE: return EventType::LinkStateChange;
        case api::EVENT_TYPE_METRICS_UPDATE:    return EventType::MetricsUpdate;
        case api::EVENT_TYPE_NODE_ADDED:        return EventType::NodeAdded;
        case api::EVENT_TYPE_NODE_REMOVED:      return EventType::NodeRemoved;
        case api::EVENT_TYPE_LINK_ADDED:        return EventType::LinkAdded;
        case api::EVENT_TYPE_LINK_REMOVED:      return EventType::LinkRemoved;
        default:                                return std::nullopt;
    }
}

NodeType from_proto(api::NodeType type) {
    switch (type) {
        case api::NODE_TYPE_SWITCH:      return NodeType::Switch;
        case api::NODE_TYPE_HOST:        return NodeType::Host;
        case api::NODE_TYPE_SERVER:      return NodeType::Server;
        case api::NODE_TYPE_UNKNOWN:     return NodeType::Unknown;
        case api::NODE_TYPE_ROUTER:
        case api::NODE_TYPE_UNSPECIFIED:
        default:                         return NodeType::Router;
    }
}

NodeStatus from_proto(api::NodeStatus status) {
    switch (status) {
        case api::NODE_STATUS_UP:       return NodeStatus::Up;
        case api::NODE_STATUS_DOWN:     return NodeStatus::Down;
        case api::NODE_STATUS_DEGRADED: return NodeStatus::Degraded;
        default:                        return NodeStatus::Unknown;
    }
}

// -----------------------------------------------------------------------------
// Messages
// -----------------------------------------------------------------------------

void fill(const Metrics& in, api::Metrics* out) {
    out->set_rx_bps(in.rx_bps);
    out->set_tx_bps(in.tx_bps);
    out->set_rx_pps(in.rx_pps);
    out->set_tx_pps(in.tx_pps);
    out->set_rx_bytes_total(in.rx_bytes_total);
    out->set_tx_bytes_total(in.tx_bytes_total);
    out->set_utilization(in.utilization);
    if (in.latency_ms) out->set_latency_ms(*in.latency_ms);
    if (in.packet_loss) out->set_packet_loss(*in.packet_loss);
}

void fill(const Node& in, api::Node* out) {
    out->set_id(in.id);
    out->set_label(in.label);
    out->set_type(to_proto(in.type));
    out->set_status(to_proto(in.status));
    out->set_platform(in.platform);
    if (in.ip_address) out->set_ip_address(*in.ip_address);
    for (const auto& [k, v] : in.metadata) (*out->mutable_metadata())[k] = v;
}

void fill(const Link& in, api::Link* out) {
    out->set_id(in.id);
    out->set_source_node_id(in.source_node_id);
    out->set_target_node_id(in.target_node_id);
    out->set_source_interface(in.source_interface);
    out->set_target_interface(in.target_interface);
    out->set_state(to_proto(in.state));
    fill(in.metrics, out->mutable_metrics());
    out->set_speed_mbps(in.speed_mbps);
    out->set_mtu(in.mtu);
    out->set_last_updated(format_timestamp(in.last_updated));
    for (const auto& [k, v] : in.metadata) (*out->mutable_metadata())[k] = v;
}

void fill(const Event& in, api::Event* out) {
    out->set_type(to_proto(in.type));
    out->set_sequence(in.sequence);
    out->set_link_id(in.link_id);
    out->set_node_id(in.node_id);
    if (in.old_state) out->set_old_state(to_proto(*in.old_state));
    if (in.new_state) out->set_new_state(to_proto(*in.new_state));
    if (in.metrics) fill(*in.metrics, out->mutable_metrics());
    if (in.node) fill(*in.node, out->mutable_node());
    if (in.link) fill(*in.link, out->mutable_link());
    out->set_timestamp(format_timestamp(in.timestamp));
    out->set_source(in.source);
}

void fill(const TopologySnapshot& in, api::Topology* out) {
    for (const auto& n : in.nodes) fill(n, out->add_nodes());
    for (const auto& l : in.links) fill(l, out->add_links());
    out->set_timestamp(format_timestamp(in.timestamp));
}

Metrics from_proto(const api::Metrics& in) {
    Metrics m;
    m.rx_bps = in.rx_bps();
    m.tx_bps = in.tx_bps();
    m.rx_pps = in.rx_pps();
    m.tx_pps = in.tx_pps();
    m.rx_bytes_total = in.rx_bytes_total();
    m.tx_bytes_total = in.tx_bytes_total();
    m.utilization = in.utilization();
    if (in.has_latency_ms()) m.latency_ms = in.latency_ms();
    if (in.has_packet_loss()) m.packet_loss = in.packet_loss();
    return m;
}

Node from_proto(const api::Node& in) {
    Node n;
    n.id = in.id();
    n.label = in.label();
    n.type = from_proto(in.type());
    n.status = from_proto(in.status());
    n.platform = in.platform();
    if (in.has_ip_address()) n.ip_address = in.ip_address();
    n.metadata.insert(in.metadata().begin(), in.metadata().end());
    return n;
}

Link from_proto(const api::Link& in) {
    Link l;
    l.id = in.id();
    l.source_node_id = in.source_node_id();
    l.target_node_id = in.target_node_id();
    l.source_interface = in.source_interface();
    l.target_interface = in.target_interface();
    l.speed_mbps = in.speed_mbps();
    if (in.mtu() > 0) l.mtu = in.mtu();
    l.metadata.insert(in.metadata().begin(), in.metadata().end());
    return l;
}

std::optional<Timestamp> request_timestamp(const std::string& text, Timestamp fallback) {
    if (text.empty()) return fallback;
    return parse_timestamp(text);
}

::grpc::Status to_grpc(const Status& status) {
    switch (status.code()) {
        case ErrorCode::Ok:
            return ::grpc::Status::OK;
        case ErrorCode::Validation:
            return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, status.message());
        case ErrorCode::NotFound:
            return ::grpc::Status(::grpc::StatusCode::NOT_FOUND, status.message());
        case ErrorCode::AlreadyExists:
            return ::grpc::Status(::grpc::StatusCode::ALREADY_EXISTS, status.message());
        case ErrorCode::FailedPrecondition:
            return ::grpc::Status(::grpc::StatusCode::FAILED_PRECONDITION, status.message());
        case ErrorCode::Conflict:
            return ::grpc::Status(::grpc::StatusCode::ABORTED, status.message());
        case ErrorCode::Internal:
            break;
    }
    return ::grpc::Status(::grpc::StatusCode::INTERNAL, status.message());
}

} // namespace linkwatch::grpc_service
