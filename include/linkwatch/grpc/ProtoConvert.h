// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file ProtoConvert.h
 * @brief Conversions between the topology model and linkwatch.api messages.
 */

#include "linkwatch/topology/Status.h"
#include "linkwatch/topology/Types.h"

#include "linkwatch.pb.h"

#include <grpcpp/grpcpp.h>

#include <optional>

namespace linkwatch::grpc_service {

api::LinkState to_proto(LinkState state);
api::NodeType to_proto(NodeType type);
api::NodeStatus to_proto(NodeStatus status);
api::EventType to_proto(EventType type);

/// std::nullopt for the UNSPECIFIED value.
std::optional<LinkState> from_proto(api::LinkState state);
std::optional<EventType> from_proto(api::EventType type);
NodeType from_proto(api::NodeType type);
NodeStatus from_proto(api::NodeStatus status);

void fill(const Metrics& in, api::Metrics* out);
void fill(const Node& in, api::Node* out);
void fill(const Link& in, api::Link* out);
void fill(const Event& in, api::Event* out);
void fill(const TopologySnapshot& in, api::Topology* out);

Metrics from_proto(const api::Metrics& in);
Node from_proto(const api::Node& in);
Link from_proto(const api::Link& in);

/**
 * @brief Optional ISO-8601 request timestamp.
 *
 * Empty text yields @p fallback; unparsable text yields std::nullopt.
 */
std::optional<Timestamp> request_timestamp(const std::string& text, Timestamp fallback);

/// Map a store Status onto the RPC status space.
::grpc::Status to_grpc(const Status& status);

} // namespace linkwatch::grpc_service
