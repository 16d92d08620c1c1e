// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/sources/relay/RelayFlowSource.h"

#include "linkwatch/log/Log.h"

#include <algorithm>

namespace linkwatch {
namespace {

// RAII guard registering a ClientContext so close() can TryCancel it.
class ContextRegistration {
public:
    ContextRegistration(std::mutex& mutex, grpc::ClientContext*& slot, grpc::ClientContext* ctx)
        : mutex_(mutex), slot_(slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = ctx;
    }
    ~ContextRegistration() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = nullptr;
    }

private:
    std::mutex& mutex_;
    grpc::ClientContext*& slot_;
};

} // namespace

RelayFlowSource::RelayFlowSource(std::shared_ptr<grpc::Channel> channel)
    : channel_(std::move(channel)) {}

RelayFlowSource::~RelayFlowSource() {
    close();
}

void RelayFlowSource::configure(const Options& opts) {
    opts_ = opts;
    if (opts_.reconnect_initial.count() <= 0) opts_.reconnect_initial = std::chrono::milliseconds(500);
    if (opts_.reconnect_max < opts_.reconnect_initial) opts_.reconnect_max = opts_.reconnect_initial;
}

void RelayFlowSource::configure_from_config(const Config& cfg) {
    Options opts;
    opts.relay_addr = cfg.hubble.relay_addr;
    opts.reconnect_initial = std::chrono::milliseconds(cfg.hubble.reconnect_initial_ms);
    opts.reconnect_max = std::chrono::milliseconds(cfg.hubble.reconnect_max_ms);
    configure(opts);
}

std::chrono::milliseconds RelayFlowSource::backoff_delay(const Options& opts, unsigned attempt) {
    auto delay = opts.reconnect_initial;
    for (unsigned i = 0; i < attempt && delay < opts.reconnect_max; ++i) delay *= 2;
    return std::min(delay, opts.reconnect_max);
}

bool RelayFlowSource::open() {
    if (running_.load()) return true;
    if (!channel_) {
        channel_ = grpc::CreateChannel(opts_.relay_addr, grpc::InsecureChannelCredentials());
    }
    stub_ = relay::Observer::NewStub(channel_);
    queue_.reopen();
    running_.store(true);

    flows_thread_ = std::thread(&RelayFlowSource::stream_loop, this, StreamKind::Flows);
    endpoints_thread_ = std::thread(&RelayFlowSource::stream_loop, this, StreamKind::Endpoints);
    LWLOG_INFO("[relay] following flows from %s", opts_.relay_addr.c_str());
    return true;
}

void RelayFlowSource::close() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(ctx_mutex_);
        if (flows_ctx_) flows_ctx_->TryCancel();
        if (endpoints_ctx_) endpoints_ctx_->TryCancel();
    }

    if (flows_thread_.joinable()) flows_thread_.join();
    if (endpoints_thread_.joinable()) endpoints_thread_.join();
    queue_.close();
    LWLOG_INFO("[relay] closed after %llu reconnects",
               static_cast<unsigned long long>(reconnects_.load()));
}

bool RelayFlowSource::poll(const discovery::ObservationHandler& handler,
                           std::chrono::milliseconds max_wait) {
    queue_.drain(handler, max_wait);
    return running_.load();
}

discovery::SourceStats RelayFlowSource::stats() const {
    discovery::SourceStats s;
    s.observations = observations_.load();
    s.decode_errors = decode_errors_.load();
    s.reconnects = reconnects_.load();
    s.connected = connected_streams_.load() > 0;
    return s;
}

bool RelayFlowSource::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

void RelayFlowSource::stream_loop(StreamKind kind) {
    const char* label = kind == StreamKind::Flows ? "GetFlows" : "WatchEndpoints";
    unsigned attempt = 0;
    while (running_.load()) {
        const bool received = kind == StreamKind::Flows ? run_flows_once() : run_endpoints_once();
        if (!running_.load()) break;

        if (received) attempt = 0;
        const auto delay = backoff_delay(opts_, attempt);
        if (attempt < 32) ++attempt;
        reconnects_.fetch_add(1);
        LWLOG_WARN("[relay] %s stream ended, reconnecting in %lld ms",
                   label, static_cast<long long>(delay.count()));
        if (!wait_backoff(delay)) break;
    }
}

bool RelayFlowSource::run_flows_once() {
    grpc::ClientContext ctx;
    ContextRegistration reg(ctx_mutex_, flows_ctx_, &ctx);
    if (!running_.load()) return false;

    relay::GetFlowsRequest req;
    req.set_follow(true);
    auto reader = stub_->GetFlows(&ctx, req);

    bool received = false;
    relay::FlowRecord flow;
    while (reader->Read(&flow)) {
        if (!received) {
            received = true;
            connected_streams_.fetch_add(1);
        }
        std::optional<discovery::RawCounterSample> sample;
        {
            std::lock_guard<std::mutex> lock(translator_mutex_);
            sample = translator_.on_flow(flow, Clock::now());
        }
        if (sample && queue_.push(std::move(*sample))) observations_.fetch_add(1);
    }
    if (received) connected_streams_.fetch_sub(1);

    const grpc::Status status = reader->Finish();
    if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
        if (status.error_code() == grpc::StatusCode::INTERNAL ||
            status.error_code() == grpc::StatusCode::DATA_LOSS) {
            decode_errors_.fetch_add(1);
        }
        LWLOG_WARN("[relay] GetFlows failed: %s", status.error_message().c_str());
    }
    return received;
}

bool RelayFlowSource::run_endpoints_once() {
    grpc::ClientContext ctx;
    ContextRegistration reg(ctx_mutex_, endpoints_ctx_, &ctx);
    if (!running_.load()) return false;

    relay::WatchEndpointsRequest req;
    auto reader = stub_->WatchEndpoints(&ctx, req);

    bool received = false;
    relay::EndpointUpdate update;
    while (reader->Read(&update)) {
        if (!received) {
            received = true;
            connected_streams_.fetch_add(1);
        }
        std::vector<discovery::RawObservation> out;
        {
            std::lock_guard<std::mutex> lock(translator_mutex_);
            out = translator_.on_endpoint(update, Clock::now());
        }
        for (auto& obs : out) {
            if (queue_.push(std::move(obs))) observations_.fetch_add(1);
        }
    }
    if (received) connected_streams_.fetch_sub(1);

    const grpc::Status status = reader->Finish();
    if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
        LWLOG_WARN("[relay] WatchEndpoints failed: %s", status.error_message().c_str());
    }
    return received;
}

} // namespace linkwatch
