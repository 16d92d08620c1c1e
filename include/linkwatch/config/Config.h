// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Config.h
 * @brief Daemon configuration parsed from YAML and overridden by environment.
 */
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace linkwatch {

/**
 * @brief Discovery backend selected at startup.
 */
enum class DiscoveryMode {
    Sysfs,   ///< Local interface counters + rtnetlink link notifications.
    Hubble,  ///< Remote flow relay over gRPC.
    None     ///< Agent push and API calls only.
};

const char* to_string(DiscoveryMode mode) noexcept;
std::optional<DiscoveryMode> parse_discovery_mode(const std::string& text);

/**
 * @brief In-memory representation of the YAML configuration file.
 */
struct Config {
    struct SysfsConfig {
        std::string root = "/sys/class/net";    // Directory holding one entry per interface.
        std::vector<std::string> interfaces{};  // Allow-list; empty polls every non-loopback interface.
        bool netlink = true;                    // Listen for RTM_NEWLINK/RTM_DELLINK.
        unsigned poll_interval_ms = 100;
    };

    struct HubbleConfig {
        std::string relay_addr = "hubble-relay:4245";
        unsigned reconnect_initial_ms = 500;
        unsigned reconnect_max_ms = 10000;
    };

    struct StateConfig {
        double   idle_timeout_seconds = 5.0;
        unsigned sweep_interval_ms = 1000;
    };

    struct EventsConfig {
        std::size_t history_size = 100;
        std::size_t subscriber_buffer = 256;
    };

    DiscoveryMode discovery_mode = DiscoveryMode::Sysfs;
    SysfsConfig   sysfs{};
    HubbleConfig  hubble{};
    StateConfig   state{};
    EventsConfig  events{};

    bool        demo_mode = false;
    std::string listen    = "0.0.0.0:50061";

    // Logging
    std::string log_mode  = "console";        // console|file|silent
    std::string log_level = "info";           // trace|debug|info|warn|error
    std::string log_file  = "linkwatch.log";  // Only used when mode==file.

    std::chrono::milliseconds idle_timeout() const;

    /**
     * @brief Parse configuration from a YAML file.
     *
     * The document is validated against config_schema.json located in the
     * same directory before any key is read.
     *
     * @param path File path to read.
     * @return Populated config on success, std::nullopt on failure.
     */
    static std::optional<Config> from_file(const std::string& path);

    using EnvLookup = std::function<std::optional<std::string>(const char*)>;

    /// getenv() wrapped as an EnvLookup.
    static std::optional<std::string> process_env(const char* name);

    /**
     * @brief Apply DISCOVERY_MODE, HUBBLE_RELAY_ADDR, IDLE_TIMEOUT_SECONDS,
     *        SWEEP_INTERVAL_MS, POLL_INTERVAL_MS, DEMO_MODE, LOG_LEVEL and
     *        LINKWATCH_LISTEN on top of the current values.
     *
     * Invalid values are ignored with a warning.
     *
     * @return Number of overrides applied.
     */
    std::size_t apply_env(const EnvLookup& lookup = &Config::process_env);
};

} // namespace linkwatch
