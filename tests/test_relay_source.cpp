// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/log/Log.h"
#include "linkwatch/sources/relay/FlowTranslator.h"
#include "linkwatch/sources/relay/RelayFlowSource.h"

#include <grpcpp/grpcpp.h>

#include "relay.grpc.pb.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <thread>
#include <variant>

using namespace std::chrono_literals;
using linkwatch::FlowTranslator;
using linkwatch::RelayFlowSource;
using linkwatch::discovery::KeyKind;
using linkwatch::discovery::RawCounterSample;
using linkwatch::discovery::RawLinkStatus;
using linkwatch::discovery::RawObservation;
namespace relay = linkwatch::relay;

static relay::Endpoint pod(const char* ns, const char* name) {
    relay::Endpoint e;
    e.set_namespace_name(ns);
    e.set_pod_name(name);
    return e;
}

static relay::EndpointUpdate bind(const relay::Endpoint& ep, const char* link, relay::LinkSide side) {
    relay::EndpointUpdate u;
    u.set_kind(relay::EndpointUpdate::ADDED);
    *u.mutable_endpoint() = ep;
    u.set_link_id(link);
    u.set_side(side);
    return u;
}

static relay::FlowRecord flow(const relay::Endpoint& src, const relay::Endpoint& dst,
                              std::uint64_t bytes, std::uint64_t packets,
                              relay::Verdict verdict = relay::FORWARDED) {
    relay::FlowRecord f;
    *f.mutable_source() = src;
    *f.mutable_destination() = dst;
    f.set_bytes(bytes);
    f.set_packets(packets);
    f.set_verdict(verdict);
    return f;
}

/// Minimal relay: binds two pods to link1, then streams flows between them.
class FakeObserver final : public relay::Observer::Service {
public:
    grpc::Status WatchEndpoints(grpc::ServerContext* ctx,
                                const relay::WatchEndpointsRequest*,
                                grpc::ServerWriter<relay::EndpointUpdate>* writer) override {
        writer->Write(bind(pod("lab", "r1"), "link1", relay::SIDE_SOURCE));
        writer->Write(bind(pod("lab", "r2"), "link1", relay::SIDE_TARGET));
        while (!ctx->IsCancelled()) std::this_thread::sleep_for(5ms);
        return grpc::Status::CANCELLED;
    }

    grpc::Status GetFlows(grpc::ServerContext* ctx,
                          const relay::GetFlowsRequest*,
                          grpc::ServerWriter<relay::FlowRecord>* writer) override {
        for (int i = 0; i < 200 && !ctx->IsCancelled(); ++i) {
            if (!writer->Write(flow(pod("lab", "r1"), pod("lab", "r2"), 1000, 1))) break;
            std::this_thread::sleep_for(10ms);
        }
        return grpc::Status::OK;
    }
};

int main() {
    linkwatch::Logger::init({linkwatch::LogLevel::ERROR, linkwatch::LogMode::Silent, ""});
    const auto fallback = linkwatch::from_epoch_seconds(1'700'000'000.0);

    // Endpoint keys.
    {
        assert(FlowTranslator::endpoint_key(pod("lab", "r1")) == "lab/r1");
        relay::Endpoint by_ip;
        by_ip.set_ip("10.0.0.5");
        by_ip.set_identity(7);
        assert(FlowTranslator::endpoint_key(by_ip) == "10.0.0.5");
        relay::Endpoint by_identity;
        by_identity.set_identity(42);
        assert(FlowTranslator::endpoint_key(by_identity) == "identity:42");
    }

    // Bindings from explicit fields and from labels; flows become per-link counters.
    {
        FlowTranslator tr;
        assert(tr.on_endpoint(bind(pod("lab", "r1"), "link1", relay::SIDE_SOURCE), fallback).empty());

        relay::EndpointUpdate labelled;
        labelled.set_kind(relay::EndpointUpdate::MODIFIED);
        *labelled.mutable_endpoint() = pod("lab", "r2");
        (*labelled.mutable_endpoint()->mutable_labels())[FlowTranslator::kLinkLabel] = "link1";
        (*labelled.mutable_endpoint()->mutable_labels())[FlowTranslator::kSideLabel] = "target";
        assert(tr.on_endpoint(labelled, fallback).empty());

        relay::EndpointUpdate unbound;
        unbound.set_kind(relay::EndpointUpdate::ADDED);
        *unbound.mutable_endpoint() = pod("lab", "client");
        assert(tr.on_endpoint(unbound, fallback).empty());

        assert(tr.bound_endpoints() == 2);
        auto b = tr.binding("lab/r2");
        assert(b && b->link_id == "link1" && b->side == FlowTranslator::Side::Target);
        assert(!tr.binding("lab/client"));

        auto f1 = flow(pod("lab", "r1"), pod("lab", "r2"), 1000, 2);
        f1.set_time_unix_nano(1'700'000'001'000'000'000LL);
        auto s1 = tr.on_flow(f1, fallback);
        assert(s1);
        assert(s1->key == "link1" && s1->key_kind == KeyKind::LinkId);
        assert(s1->tx_bytes == 1000 && s1->tx_packets == 2);
        assert(s1->rx_bytes == 0 && s1->rx_packets == 0);
        assert(std::fabs(linkwatch::to_epoch_seconds(s1->timestamp) - 1'700'000'001.0) < 1e-6);

        auto s2 = tr.on_flow(flow(pod("lab", "r2"), pod("lab", "r1"), 500, 0), fallback);
        assert(s2 && s2->rx_bytes == 500 && s2->rx_packets == 1);
        assert(s2->tx_bytes == 1000);
        assert(s2->timestamp == fallback);

        // Only the destination is known: direction follows the destination's side.
        auto s3 = tr.on_flow(flow(pod("lab", "client"), pod("lab", "r1"), 100, 1), fallback);
        assert(s3 && s3->rx_bytes == 600 && s3->tx_bytes == 1000);

        assert(!tr.on_flow(flow(pod("lab", "r1"), pod("lab", "r2"), 999, 1, relay::DROPPED), fallback));
        assert(!tr.on_flow(flow(pod("lab", "r1"), pod("lab", "r2"), 999, 1, relay::ERROR), fallback));
        assert(tr.dropped_flows() == 2);
        assert(!tr.on_flow(flow(pod("x", "a"), pod("x", "b"), 1, 1), fallback));
        assert(tr.unmapped_flows() == 1);

        // Losing an endpoint severs the link; binding it again restores it.
        relay::EndpointUpdate gone;
        gone.set_kind(relay::EndpointUpdate::DELETED);
        *gone.mutable_endpoint() = pod("lab", "r2");
        auto down = tr.on_endpoint(gone, fallback);
        assert(down.size() == 1);
        auto* status = std::get_if<RawLinkStatus>(&down[0]);
        assert(status && status->key == "link1" && !status->up && status->endpoint_deleted);
        assert(tr.bound_endpoints() == 1);
        assert(tr.on_endpoint(gone, fallback).empty());

        auto up = tr.on_endpoint(bind(pod("lab", "r2b"), "link1", relay::SIDE_TARGET), fallback);
        assert(up.size() == 1);
        status = std::get_if<RawLinkStatus>(&up[0]);
        assert(status && status->up && !status->endpoint_deleted);
    }

    // Reconnect backoff doubles up to the ceiling.
    {
        RelayFlowSource::Options opts;
        opts.reconnect_initial = 500ms;
        opts.reconnect_max = 3000ms;
        assert(RelayFlowSource::backoff_delay(opts, 0) == 500ms);
        assert(RelayFlowSource::backoff_delay(opts, 1) == 1000ms);
        assert(RelayFlowSource::backoff_delay(opts, 2) == 2000ms);
        assert(RelayFlowSource::backoff_delay(opts, 3) == 3000ms);
        assert(RelayFlowSource::backoff_delay(opts, 31) == 3000ms);
    }

    // End to end against an in-process relay.
    {
        FakeObserver observer;
        grpc::ServerBuilder builder;
        builder.RegisterService(&observer);
        auto server = builder.BuildAndStart();
        assert(server);

        RelayFlowSource src(server->InProcessChannel(grpc::ChannelArguments()));
        RelayFlowSource::Options opts;
        opts.relay_addr = "in-process";
        opts.reconnect_initial = 10ms;
        opts.reconnect_max = 50ms;
        src.configure(opts);
        assert(std::string(src.name()) == "hubble");
        assert(src.open());

        std::uint64_t tx_bytes = 0;
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (tx_bytes < 3000 && std::chrono::steady_clock::now() < deadline) {
            src.poll([&](const RawObservation& obs) {
                if (auto* s = std::get_if<RawCounterSample>(&obs)) {
                    assert(s->key == "link1" && s->key_kind == KeyKind::LinkId);
                    tx_bytes = s->tx_bytes;
                }
            }, 20ms);
        }
        assert(tx_bytes >= 3000);
        assert(src.stats().observations >= 3);

        const auto before = std::chrono::steady_clock::now();
        src.close();
        assert(std::chrono::steady_clock::now() - before < 3s);
        assert(!src.stats().connected);

        server->Shutdown(std::chrono::system_clock::now() + 1s);
    }

    return 0;
}
