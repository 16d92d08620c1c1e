// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "linkwatch/config/Config.h"
#include "linkwatch/discovery/ObservationQueue.h"
#include "linkwatch/sources/relay/FlowTranslator.h"

#include <grpcpp/grpcpp.h>

#include "relay.grpc.pb.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace linkwatch {

/**
 * @brief Remote flow discovery over the relay's Observer service.
 *
 * Runs two long-lived server streams on their own threads: GetFlows (follow
 * mode) and WatchEndpoints. Whenever a stream ends or the relay is
 * unreachable the thread backs off exponentially (initial delay doubled up to
 * the cap, reset after a stream delivered data) and reconnects; it only stops
 * on close(), which cancels both in-flight calls.
 */
class RelayFlowSource final : public discovery::ObservationSource {
public:
    struct Options {
        std::string relay_addr = "hubble-relay:4245";
        std::chrono::milliseconds reconnect_initial{500};
        std::chrono::milliseconds reconnect_max{10000};
    };

    RelayFlowSource() = default;

    /// Use an existing channel (tests, in-process servers).
    explicit RelayFlowSource(std::shared_ptr<grpc::Channel> channel);
    ~RelayFlowSource() override;

    void configure(const Options& opts);
    void configure_from_config(const Config& cfg);

    const char* name() const noexcept override { return "hubble"; }
    bool open() override;
    void close() override;
    bool poll(const discovery::ObservationHandler& handler,
              std::chrono::milliseconds max_wait) override;
    discovery::SourceStats stats() const override;

    /// Delay before reconnect attempt number @p attempt (0-based).
    static std::chrono::milliseconds backoff_delay(const Options& opts, unsigned attempt);

private:
    enum class StreamKind { Flows, Endpoints };

    void stream_loop(StreamKind kind);

    /// One call: returns true when at least one message was received.
    bool run_flows_once();
    bool run_endpoints_once();

    /// Sleep up to @p delay; returns false when close() interrupted it.
    bool wait_backoff(std::chrono::milliseconds delay);

    Options opts_{};
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<relay::Observer::Stub> stub_;
    discovery::ObservationQueue queue_{4096};

    std::mutex translator_mutex_;
    FlowTranslator translator_;

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::mutex ctx_mutex_;
    grpc::ClientContext* flows_ctx_{nullptr};
    grpc::ClientContext* endpoints_ctx_{nullptr};

    std::thread flows_thread_;
    std::thread endpoints_thread_;

    std::atomic<std::uint64_t> observations_{0};
    std::atomic<std::uint64_t> decode_errors_{0};
    std::atomic<std::uint64_t> reconnects_{0};
    std::atomic<int> connected_streams_{0};
};

} // namespace linkwatch
