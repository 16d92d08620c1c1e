// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/app/core/ObservationPipeline.h"
#include "linkwatch/config/Config.h"
#include "linkwatch/discovery/ObservationSourceFactory.h"
#include "linkwatch/discovery/PushSource.h"
#include "linkwatch/events/EventBus.h"
#include "linkwatch/grpc/LinkWatchService.h"
#include "linkwatch/log/Log.h"
#include "linkwatch/state/IdleSweeper.h"
#include "linkwatch/state/ObservationNormalizer.h"
#include "linkwatch/topology/DemoTopology.h"
#include "linkwatch/topology/TopologyStore.h"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <signal.h>
#include <thread>

namespace {

struct DaemonArgs {
    std::string config_path{"linkwatch.yaml"};
    std::optional<std::string> listen{};
    std::optional<linkwatch::LogLevel> log_level{};
    bool demo{false};
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [-c|--config FILE] [-l|--listen ADDR]"
              << " [--log trace|debug|info|warn|error] [--demo]\n";
}

DaemonArgs parse_args(int argc, char** argv) {
    DaemonArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-l" || arg == "--listen") && i + 1 < argc) {
            args.listen = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            args.log_level = linkwatch::parse_log_level(argv[++i]);
        } else if (arg == "--demo") {
            args.demo = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << '\n';
        }
    }
    return args;
}

linkwatch::LoggerConfig logger_config(const linkwatch::Config& cfg,
                                      const DaemonArgs& args) {
    linkwatch::LoggerConfig lc;
    lc.level = args.log_level.value_or(
        linkwatch::parse_log_level(cfg.log_level).value_or(linkwatch::LogLevel::INFO));
    lc.mode = linkwatch::parse_log_mode(cfg.log_mode).value_or(linkwatch::LogMode::Console);
    lc.file_path = cfg.log_file;
    return lc;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);

    // Handle SIGINT/SIGTERM for graceful shutdown using sigwait. Blocked
    // before any thread starts so every thread inherits the mask.
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    linkwatch::Logger::init({.level = args.log_level.value_or(linkwatch::LogLevel::INFO)});

    auto cfg = linkwatch::Config::from_file(args.config_path);
    if (!cfg) {
        LWLOG_WARN("Failed to load config at %s, using defaults", args.config_path.c_str());
        cfg = linkwatch::Config{};
    }
    cfg->apply_env();
    if (args.listen) cfg->listen = *args.listen;
    if (args.demo) cfg->demo_mode = true;

    linkwatch::Logger::init(logger_config(*cfg, args));
    LWLOG_INFO("linkwatchd starting (discovery=%s, idle_timeout=%.1fs, demo=%s)",
               linkwatch::to_string(cfg->discovery_mode),
               cfg->state.idle_timeout_seconds,
               cfg->demo_mode ? "on" : "off");

    linkwatch::events::EventBus bus({cfg->events.history_size, cfg->events.subscriber_buffer});
    linkwatch::TopologyStore store(bus);

    if (cfg->demo_mode) {
        if (auto st = linkwatch::load_demo_topology(store); !st) {
            LWLOG_ERROR("Demo topology rejected: %s", st.message().c_str());
        }
    }

    linkwatch::state::ObservationNormalizer normalizer;
    linkwatch::app::ObservationPipeline pipeline(store, normalizer);

    auto* push = static_cast<linkwatch::discovery::PushSource*>(
        pipeline.add_source(std::make_unique<linkwatch::discovery::PushSource>()));
    pipeline.add_source(linkwatch::discovery::create_observation_source(*cfg));
    pipeline.start();

    linkwatch::state::IdleSweeper sweeper(store,
                                          cfg->idle_timeout(),
                                          std::chrono::milliseconds(cfg->state.sweep_interval_ms));
    sweeper.start();

    linkwatch::grpc_service::LinkWatchServiceImpl service(store, bus, push, &pipeline);

    ::grpc::ServerBuilder builder;
    builder.AddListeningPort(cfg->listen, ::grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<::grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        LWLOG_ERROR("Failed to start linkwatchd gRPC server on %s", cfg->listen.c_str());
        sweeper.stop();
        pipeline.stop();
        bus.shutdown();
        return 1;
    }

    LWLOG_INFO("linkwatchd listening on %s", cfg->listen.c_str());
    std::thread sig_thread([&]() {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            LWLOG_INFO("linkwatchd received signal %d, shutting down...", sig);
            // Closing the bus ends every event stream; the deadline cancels
            // agent channels still blocked on reads.
            bus.shutdown();
            server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
        }
    });

    server->Wait();
    if (sig_thread.joinable()) sig_thread.join();

    sweeper.stop();
    pipeline.stop();
    LWLOG_INFO("linkwatchd shutdown complete");
    return 0;
}
