// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "linkwatch/app/core/AgentEventCodec.h"
#include "linkwatch/app/core/ObservationPipeline.h"
#include "linkwatch/discovery/PushSource.h"
#include "linkwatch/events/EventBus.h"
#include "linkwatch/topology/TopologyStore.h"

#include "linkwatch.grpc.pb.h"

#include <chrono>

namespace linkwatch::grpc_service {

/**
 * @brief gRPC control and query surface of the daemon.
 *
 * Owns no topology state: every handler delegates to the TopologyStore, the
 * EventBus or the agent codec. Handlers are invoked concurrently by gRPC
 * worker threads; streaming handlers each drain their own bus subscription.
 */
class LinkWatchServiceImpl final :
    public linkwatch::api::LinkWatch::Service {
public:
    // -------------------------------------------------------------------------
    // Lifecycle / configuration
    // -------------------------------------------------------------------------

    /**
     * @param push     Agent push source for raw observations; may be null, in
     *                 which case AgentChannel only accepts JSON events.
     * @param pipeline Used for per-source health; may be null.
     */
    LinkWatchServiceImpl(TopologyStore& store,
                         events::EventBus& bus,
                         discovery::PushSource* push = nullptr,
                         const app::ObservationPipeline* pipeline = nullptr);

    /// Wake-up period of streaming handlers while checking for cancellation.
    void set_stream_poll(std::chrono::milliseconds poll) { stream_poll_ = poll; }

    // -------------------------------------------------------------------------
    // Topology
    // -------------------------------------------------------------------------

    ::grpc::Status GetTopology(::grpc::ServerContext* context,
                               const api::GetTopologyRequest* request,
                               api::Topology* response) override;

    ::grpc::Status AddNode(::grpc::ServerContext* context,
                           const api::AddNodeRequest* request,
                           api::Node* response) override;

    /// Fails with FAILED_PRECONDITION while links still reference the node.
    ::grpc::Status RemoveNode(::grpc::ServerContext* context,
                              const api::RemoveNodeRequest* request,
                              api::Node* response) override;

    ::grpc::Status AddLink(::grpc::ServerContext* context,
                           const api::AddLinkRequest* request,
                           api::Link* response) override;

    ::grpc::Status RemoveLink(::grpc::ServerContext* context,
                              const api::RemoveLinkRequest* request,
                              api::Link* response) override;

    // -------------------------------------------------------------------------
    // Links
    // -------------------------------------------------------------------------

    ::grpc::Status ListLinks(::grpc::ServerContext* context,
                             const api::ListLinksRequest* request,
                             api::ListLinksResponse* response) override;

    ::grpc::Status GetLink(::grpc::ServerContext* context,
                           const api::GetLinkRequest* request,
                           api::Link* response) override;

    /// Resolves a plain or node-qualified interface name; NOT_FOUND when no link uses it.
    ::grpc::Status GetLinkByInterface(::grpc::ServerContext* context,
                                      const api::GetLinkByInterfaceRequest* request,
                                      api::Link* response) override;

    ::grpc::Status GetLinkMetrics(::grpc::ServerContext* context,
                                  const api::GetLinkMetricsRequest* request,
                                  api::Metrics* response) override;

    /// Explicit override; an older timestamp than the last override is ABORTED.
    ::grpc::Status SetLinkState(::grpc::ServerContext* context,
                                const api::SetLinkStateRequest* request,
                                api::Link* response) override;

    ::grpc::Status UpdateLinkMetrics(::grpc::ServerContext* context,
                                     const api::UpdateLinkMetricsRequest* request,
                                     api::Link* response) override;

    // -------------------------------------------------------------------------
    // Events
    // -------------------------------------------------------------------------

    ::grpc::Status SubmitEvent(::grpc::ServerContext* context,
                               const api::SubmitEventRequest* request,
                               api::SubmitEventResponse* response) override;

    ::grpc::Status SubmitEventBatch(::grpc::ServerContext* context,
                                    const api::SubmitEventBatchRequest* request,
                                    api::SubmitEventBatchResponse* response) override;

    ::grpc::Status GetEventHistory(::grpc::ServerContext* context,
                                   const api::GetEventHistoryRequest* request,
                                   api::GetEventHistoryResponse* response) override;

    /**
     * @brief Live event feed.
     *
     * The subscription is taken before the initial topology snapshot is
     * built, so no event is lost between the two; an event may therefore
     * already be reflected in the snapshot it follows.
     */
    ::grpc::Status StreamEvents(::grpc::ServerContext* context,
                                const api::StreamEventsRequest* request,
                                ::grpc::ServerWriter<api::StreamEventsMessage>* writer) override;

    /// Bidirectional agent ingest: one AgentAck per AgentMessage.
    ::grpc::Status AgentChannel(::grpc::ServerContext* context,
                                ::grpc::ServerReaderWriter<api::AgentAck, api::AgentMessage>* stream) override;

    ::grpc::Status GetHealth(::grpc::ServerContext* context,
                             const api::GetHealthRequest* request,
                             api::GetHealthResponse* response) override;

    /// Handle one agent message; exposed for tests.
    api::AgentAck handle_agent_message(const api::AgentMessage& msg);

private:
    TopologyStore& store_;
    events::EventBus& bus_;
    discovery::PushSource* push_;
    const app::ObservationPipeline* pipeline_;
    app::AgentEventCodec codec_;
    std::chrono::milliseconds stream_poll_{250};
};

} // namespace linkwatch::grpc_service
