// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/grpc/LinkWatchService.h"

#include "linkwatch/grpc/ProtoConvert.h"
#include "linkwatch/log/Log.h"

#include <grpcpp/grpcpp.h>

#include <set>

namespace linkwatch::grpc_service {
namespace {

::grpc::Status invalid(const std::string& message) {
    return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, message);
}

::grpc::Status not_found(const std::string& message) {
    return ::grpc::Status(::grpc::StatusCode::NOT_FOUND, message);
}

} // namespace

LinkWatchServiceImpl::LinkWatchServiceImpl(TopologyStore& store,
                                           events::EventBus& bus,
                                           discovery::PushSource* push,
                                           const app::ObservationPipeline* pipeline)
    : store_(store), bus_(bus), push_(push), pipeline_(pipeline) {}

// -----------------------------------------------------------------------------
// Topology
// -----------------------------------------------------------------------------

::grpc::Status LinkWatchServiceImpl::GetTopology(::grpc::ServerContext*,
                                                 const api::GetTopologyRequest*,
                                                 api::Topology* response) {
    fill(store_.get_topology(), response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::AddNode(::grpc::ServerContext*,
                                             const api::AddNodeRequest* request,
                                             api::Node* response) {
    if (!request || !request->has_node()) return invalid("missing node");
    Node node = from_proto(request->node());
    const std::string id = node.id;
    if (auto st = store_.add_node(std::move(node)); !st) return to_grpc(st);

    auto stored = store_.get_node(id);
    if (!stored) return not_found("node vanished after insertion: " + id);
    fill(*stored, response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::RemoveNode(::grpc::ServerContext*,
                                                const api::RemoveNodeRequest* request,
                                                api::Node* response) {
    if (!request || request->node_id().empty()) return invalid("missing node_id");
    auto existing = store_.get_node(request->node_id());
    if (auto st = store_.remove_node(request->node_id()); !st) return to_grpc(st);
    if (existing) fill(*existing, response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::AddLink(::grpc::ServerContext*,
                                             const api::AddLinkRequest* request,
                                             api::Link* response) {
    if (!request || !request->has_link()) return invalid("missing link");
    Link link = from_proto(request->link());
    const std::string id = link.id;
    if (auto st = store_.add_link(std::move(link)); !st) return to_grpc(st);

    auto stored = store_.get_link(id);
    if (!stored) return not_found("link vanished after insertion: " + id);
    fill(*stored, response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::RemoveLink(::grpc::ServerContext*,
                                                const api::RemoveLinkRequest* request,
                                                api::Link* response) {
    if (!request || request->link_id().empty()) return invalid("missing link_id");
    auto existing = store_.get_link(request->link_id());
    if (auto st = store_.remove_link(request->link_id()); !st) return to_grpc(st);
    if (existing) fill(*existing, response);
    return ::grpc::Status::OK;
}

// -----------------------------------------------------------------------------
// Links
// -----------------------------------------------------------------------------

::grpc::Status LinkWatchServiceImpl::ListLinks(::grpc::ServerContext*,
                                               const api::ListLinksRequest* request,
                                               api::ListLinksResponse* response) {
    std::optional<LinkState> filter;
    if (request) filter = from_proto(request->state());
    for (const auto& link : store_.get_links(filter)) fill(link, response->add_links());
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::GetLink(::grpc::ServerContext*,
                                             const api::GetLinkRequest* request,
                                             api::Link* response) {
    if (!request || request->link_id().empty()) return invalid("missing link_id");
    auto link = store_.get_link(request->link_id());
    if (!link) return not_found("link not found: " + request->link_id());
    fill(*link, response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::GetLinkByInterface(::grpc::ServerContext*,
                                                        const api::GetLinkByInterfaceRequest* request,
                                                        api::Link* response) {
    if (!request || request->interface_name().empty()) return invalid("missing interface_name");
    auto link_id = store_.find_link_by_interface(request->interface_name());
    if (!link_id) return not_found("no link uses interface " + request->interface_name());
    // The link may be removed between the lookup and the read.
    auto link = store_.get_link(*link_id);
    if (!link) return not_found("no link uses interface " + request->interface_name());
    fill(*link, response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::GetLinkMetrics(::grpc::ServerContext*,
                                                    const api::GetLinkMetricsRequest* request,
                                                    api::Metrics* response) {
    if (!request || request->link_id().empty()) return invalid("missing link_id");
    auto link = store_.get_link(request->link_id());
    if (!link) return not_found("link not found: " + request->link_id());
    fill(link->metrics, response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::SetLinkState(::grpc::ServerContext*,
                                                  const api::SetLinkStateRequest* request,
                                                  api::Link* response) {
    if (!request || request->link_id().empty()) return invalid("missing link_id");
    auto state = from_proto(request->state());
    if (!state) return invalid("state must be active, idle or down");
    auto ts = request_timestamp(request->timestamp(), Clock::now());
    if (!ts) return invalid("timestamp is not ISO-8601 UTC");

    if (auto st = store_.set_state(request->link_id(), *state, *ts); !st) return to_grpc(st);
    auto link = store_.get_link(request->link_id());
    if (!link) return not_found("link not found: " + request->link_id());
    fill(*link, response);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::UpdateLinkMetrics(::grpc::ServerContext*,
                                                       const api::UpdateLinkMetricsRequest* request,
                                                       api::Link* response) {
    if (!request || request->link_id().empty()) return invalid("missing link_id");
    if (!request->has_metrics()) return invalid("missing metrics");
    auto ts = request_timestamp(request->timestamp(), Clock::now());
    if (!ts) return invalid("timestamp is not ISO-8601 UTC");

    auto st = store_.upsert_metrics(request->link_id(), from_proto(request->metrics()), *ts);
    if (!st) return to_grpc(st);
    auto link = store_.get_link(request->link_id());
    if (!link) return not_found("link not found: " + request->link_id());
    fill(*link, response);
    return ::grpc::Status::OK;
}

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------

::grpc::Status LinkWatchServiceImpl::SubmitEvent(::grpc::ServerContext*,
                                                 const api::SubmitEventRequest* request,
                                                 api::SubmitEventResponse* response) {
    if (!request) return invalid("missing request");
    auto st = codec_.submit(request->json(), store_, Clock::now());
    if (!st) return to_grpc(st);
    response->set_accepted(true);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::SubmitEventBatch(::grpc::ServerContext*,
                                                      const api::SubmitEventBatchRequest* request,
                                                      api::SubmitEventBatchResponse* response) {
    if (!request) return invalid("missing request");
    std::vector<app::BatchItemResult> results;
    if (auto st = codec_.submit_batch(request->json(), store_, Clock::now(), results); !st) {
        return to_grpc(st);
    }

    std::uint32_t processed = 0;
    std::uint32_t failed = 0;
    for (const auto& r : results) {
        auto* item = response->add_results();
        item->set_key(r.key);
        item->set_processed(r.status.is_ok());
        if (r.status.is_ok()) {
            ++processed;
        } else {
            item->set_error(r.status.message());
            ++failed;
        }
    }
    response->set_processed(processed);
    response->set_failed(failed);
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::GetEventHistory(::grpc::ServerContext*,
                                                     const api::GetEventHistoryRequest* request,
                                                     api::GetEventHistoryResponse* response) {
    std::optional<EventType> type;
    std::size_t limit = 100;
    if (request) {
        type = from_proto(request->type());
        if (request->limit() > 0) limit = request->limit();
    }
    for (const auto& ev : bus_.history(type, limit)) fill(ev, response->add_events());
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::StreamEvents(::grpc::ServerContext* context,
                                                  const api::StreamEventsRequest* request,
                                                  ::grpc::ServerWriter<api::StreamEventsMessage>* writer) {
    std::set<EventType> filter;
    bool skip_initial = false;
    if (request) {
        for (int i = 0; i < request->types_size(); ++i) {
            if (auto t = from_proto(request->types(i))) filter.insert(*t);
        }
        skip_initial = request->skip_initial_state();
    }

    auto sub = bus_.subscribe(std::move(filter));
    if (!sub) {
        return ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "event bus is shut down");
    }
    LWLOG_INFO("[grpc] event stream %llu opened by %s",
               static_cast<unsigned long long>(sub->id()), context->peer().c_str());

    if (!skip_initial) {
        api::StreamEventsMessage first;
        fill(store_.get_topology(), first.mutable_initial_state());
        if (!writer->Write(first)) {
            bus_.unsubscribe(sub);
            return ::grpc::Status::OK;
        }
    }

    while (!context->IsCancelled()) {
        auto ev = sub->next(stream_poll_);
        if (!ev) {
            if (sub->closed()) break;
            continue;
        }
        api::StreamEventsMessage msg;
        fill(*ev, msg.mutable_event());
        if (!writer->Write(msg)) break;
    }

    LWLOG_INFO("[grpc] event stream %llu closed (delivered %llu, dropped %llu)",
               static_cast<unsigned long long>(sub->id()),
               static_cast<unsigned long long>(sub->delivered()),
               static_cast<unsigned long long>(sub->dropped()));
    bus_.unsubscribe(sub);
    return ::grpc::Status::OK;
}

api::AgentAck LinkWatchServiceImpl::handle_agent_message(const api::AgentMessage& msg) {
    api::AgentAck ack;
    ack.set_id(msg.id());
    const auto now = Clock::now();

    auto reject = [&ack](const std::string& error) {
        ack.set_accepted(false);
        ack.set_error(error);
        return ack;
    };

    switch (msg.payload_case()) {
    case api::AgentMessage::kEventJson: {
        auto st = codec_.submit(msg.event_json(), store_, now);
        if (!st) return reject(st.message());
        break;
    }
    case api::AgentMessage::kStatus: {
        if (!push_) return reject("raw observations are not accepted");
        const auto& s = msg.status();
        auto ts = request_timestamp(s.timestamp(), now);
        if (!ts) return reject("timestamp is not ISO-8601 UTC");
        if (s.key().empty()) return reject("missing key");
        discovery::RawLinkStatus obs;
        obs.key = s.key();
        obs.key_kind = s.by_link_id() ? discovery::KeyKind::LinkId : discovery::KeyKind::Interface;
        obs.up = s.up();
        obs.timestamp = *ts;
        if (!push_->push(obs)) return reject("push source closed");
        break;
    }
    case api::AgentMessage::kCounters: {
        if (!push_) return reject("raw observations are not accepted");
        const auto& c = msg.counters();
        auto ts = request_timestamp(c.timestamp(), now);
        if (!ts) return reject("timestamp is not ISO-8601 UTC");
        if (c.key().empty()) return reject("missing key");
        discovery::RawCounterSample obs;
        obs.key = c.key();
        obs.key_kind = c.by_link_id() ? discovery::KeyKind::LinkId : discovery::KeyKind::Interface;
        obs.rx_bytes = c.rx_bytes();
        obs.tx_bytes = c.tx_bytes();
        obs.rx_packets = c.rx_packets();
        obs.tx_packets = c.tx_packets();
        obs.timestamp = *ts;
        if (!push_->push(obs)) return reject("push source closed");
        break;
    }
    case api::AgentMessage::PAYLOAD_NOT_SET:
        return reject("empty agent message");
    }

    ack.set_accepted(true);
    return ack;
}

::grpc::Status LinkWatchServiceImpl::AgentChannel(
    ::grpc::ServerContext* context,
    ::grpc::ServerReaderWriter<api::AgentAck, api::AgentMessage>* stream) {
    LWLOG_INFO("[grpc] agent connected from %s", context->peer().c_str());
    std::uint64_t accepted = 0;
    std::uint64_t rejected = 0;

    api::AgentMessage msg;
    while (stream->Read(&msg)) {
        const auto ack = handle_agent_message(msg);
        if (ack.accepted()) {
            ++accepted;
        } else {
            ++rejected;
            LWLOG_DEBUG("[grpc] agent message %llu rejected: %s",
                        static_cast<unsigned long long>(msg.id()), ack.error().c_str());
        }
        if (!stream->Write(ack)) break;
    }

    LWLOG_INFO("[grpc] agent %s disconnected (%llu accepted, %llu rejected)",
               context->peer().c_str(),
               static_cast<unsigned long long>(accepted),
               static_cast<unsigned long long>(rejected));
    return ::grpc::Status::OK;
}

::grpc::Status LinkWatchServiceImpl::GetHealth(::grpc::ServerContext*,
                                               const api::GetHealthRequest*,
                                               api::GetHealthResponse* response) {
    const auto s = store_.stats();
    response->set_status("healthy");
    response->set_node_count(static_cast<std::uint32_t>(s.node_count));
    response->set_link_count(static_cast<std::uint32_t>(s.link_count));
    response->set_active_links(static_cast<std::uint32_t>(s.active_links));
    response->set_idle_links(static_cast<std::uint32_t>(s.idle_links));
    response->set_down_links(static_cast<std::uint32_t>(s.down_links));
    response->set_subscribers(static_cast<std::uint32_t>(bus_.subscriber_count()));
    response->set_events_published(bus_.published());
    response->set_uptime_seconds(s.uptime_seconds);

    if (pipeline_) {
        for (const auto& src : pipeline_->source_stats()) {
            auto* h = response->add_sources();
            h->set_name(src.name);
            h->set_connected(src.stats.connected);
            h->set_observations(src.stats.observations);
            h->set_decode_errors(src.stats.decode_errors);
            h->set_reconnects(src.stats.reconnects);
        }
    }
    return ::grpc::Status::OK;
}

} // namespace linkwatch::grpc_service
