// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/config/Config.h"
#include "linkwatch/log/Log.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>

#ifndef LINKWATCH_CONFIG_DIR
#error "LINKWATCH_CONFIG_DIR must point at the config/ directory"
#endif

namespace fs = std::filesystem;
using linkwatch::Config;
using linkwatch::DiscoveryMode;

static fs::path write_config(const fs::path& dir, const char* name, const std::string& body) {
    const auto path = dir / name;
    std::ofstream out(path);
    out << body;
    return path;
}

int main() {
    linkwatch::Logger::init({linkwatch::LogLevel::ERROR, linkwatch::LogMode::Silent, ""});

    // Defaults.
    {
        Config cfg;
        assert(cfg.discovery_mode == DiscoveryMode::Sysfs);
        assert(cfg.listen == "0.0.0.0:50061");
        assert(cfg.idle_timeout() == std::chrono::milliseconds(5000));
        assert(cfg.events.history_size == 100);
        assert(cfg.sysfs.root == "/sys/class/net");
        assert(!cfg.demo_mode);
    }

    // The shipped file validates and matches the defaults.
    {
        auto cfg = Config::from_file(std::string(LINKWATCH_CONFIG_DIR) + "/linkwatch.yaml");
        assert(cfg);
        assert(cfg->discovery_mode == DiscoveryMode::Sysfs);
        assert(cfg->hubble.relay_addr == "hubble-relay:4245");
        assert(cfg->idle_timeout() == std::chrono::milliseconds(5000));
        assert(cfg->sysfs.netlink && cfg->sysfs.interfaces.empty());
    }

    const fs::path dir = fs::temp_directory_path() / ("linkwatch_config_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    fs::copy_file(fs::path(LINKWATCH_CONFIG_DIR) / "config_schema.json", dir / "config_schema.json",
                  fs::copy_options::overwrite_existing);

    // Custom values.
    {
        auto path = write_config(dir, "custom.yaml", R"(
listen: "127.0.0.1:6000"
demo_mode: true
log:
  level: debug
discovery:
  mode: hubble
  sysfs:
    interfaces: [eth1, eth2]
  hubble:
    relay_addr: "relay.kube-system:80"
    reconnect_initial_ms: 2000
    reconnect_max_ms: 1000
state:
  idle_timeout_seconds: 2.5
events:
  history_size: 10
)");
        auto cfg = Config::from_file(path.string());
        assert(cfg);
        assert(cfg->listen == "127.0.0.1:6000");
        assert(cfg->demo_mode);
        assert(cfg->log_level == "debug");
        assert(cfg->log_mode == "console");
        assert(cfg->discovery_mode == DiscoveryMode::Hubble);
        assert((cfg->sysfs.interfaces == std::vector<std::string>{"eth1", "eth2"}));
        assert(cfg->hubble.relay_addr == "relay.kube-system:80");
        // The backoff ceiling never sits below the initial delay.
        assert(cfg->hubble.reconnect_max_ms == 2000);
        assert(cfg->idle_timeout() == std::chrono::milliseconds(2500));
        assert(cfg->state.sweep_interval_ms == 1000);
        assert(cfg->events.history_size == 10);
        assert(cfg->events.subscriber_buffer == 256);
    }

    // Rejections: schema violations, unknown keys, broken YAML, missing file.
    {
        auto bad_mode = write_config(dir, "bad_mode.yaml", "discovery:\n  mode: carrier-pigeon\n");
        assert(!Config::from_file(bad_mode.string()));

        auto unknown = write_config(dir, "unknown.yaml", "listen: \":1\"\nretries: 3\n");
        assert(!Config::from_file(unknown.string()));

        auto negative = write_config(dir, "negative.yaml", "state:\n  idle_timeout_seconds: 0\n");
        assert(!Config::from_file(negative.string()));

        auto broken = write_config(dir, "broken.yaml", "log: [unclosed\n");
        assert(!Config::from_file(broken.string()));

        assert(!Config::from_file((dir / "missing.yaml").string()));
    }

    // Environment overrides; invalid values are skipped.
    {
        const std::map<std::string, std::string> env{
            {"DISCOVERY_MODE", "NONE"},
            {"IDLE_TIMEOUT_SECONDS", "7"},
            {"SWEEP_INTERVAL_MS", "abc"},
            {"POLL_INTERVAL_MS", "0"},
            {"DEMO_MODE", "yes"},
            {"LOG_LEVEL", "WARN"},
            {"HUBBLE_RELAY_ADDR", "relay:4245"},
        };
        auto lookup = [&env](const char* name) -> std::optional<std::string> {
            auto it = env.find(name);
            if (it == env.end()) return std::nullopt;
            return it->second;
        };

        Config cfg;
        assert(cfg.apply_env(lookup) == 5);
        assert(cfg.discovery_mode == DiscoveryMode::None);
        assert(cfg.idle_timeout() == std::chrono::milliseconds(7000));
        assert(cfg.state.sweep_interval_ms == 1000);
        assert(cfg.sysfs.poll_interval_ms == 100);
        assert(cfg.demo_mode);
        assert(cfg.log_level == "warn");
        assert(cfg.hubble.relay_addr == "relay:4245");

        Config untouched;
        assert(untouched.apply_env([](const char*) { return std::optional<std::string>{}; }) == 0);
        assert(untouched.discovery_mode == DiscoveryMode::Sysfs);
    }

    fs::remove_all(dir);
    return 0;
}
