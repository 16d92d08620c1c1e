// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/config/Config.h"

#include "linkwatch/log/Log.h"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace linkwatch {
namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

template <typename T>
void set_if_present(const YAML::Node& node, const char* key, T& target) {
    if (!node) return;
    if (auto child = node[key]) {
        target = child.as<T>();
    }
}

// Convert YAML scalars to JSON types with best-effort typing.
nlohmann::json yaml_scalar_to_json(const YAML::Node& node) {
    bool b{};
    if (YAML::convert<bool>::decode(node, b)) return b;
    long long i{};
    if (YAML::convert<long long>::decode(node, i)) return i;
    double d{};
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.Scalar();
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return yaml_scalar_to_json(node);
    case YAML::NodeType::Sequence: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& elem : node) arr.push_back(yaml_to_json(elem));
        return arr;
    }
    case YAML::NodeType::Map: {
        nlohmann::json obj = nlohmann::json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj[it->first.as<std::string>()] = yaml_to_json(it->second);
        }
        return obj;
    }
    default:
        return nullptr;
    }
}

std::optional<nlohmann::json> load_schema(const std::string& config_path) {
    namespace fs = std::filesystem;
    fs::path schema_path = fs::path(config_path).parent_path() / "config_schema.json";
    std::ifstream in(schema_path);
    if (!in) return std::nullopt;
    auto schema = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (schema.is_discarded()) return std::nullopt;
    return schema;
}

bool validate_root(const YAML::Node& root, const nlohmann::json& schema, std::string& error) {
    try {
        nlohmann::json_schema::json_validator validator(
            nullptr,
            nlohmann::json_schema::default_string_format_check);
        validator.set_root_schema(schema);
        validator.validate(yaml_to_json(root));
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
}

void apply_discovery_config(const YAML::Node& discovery, Config& cfg) {
    if (!discovery) return;
    if (auto mode = discovery["mode"]) {
        // The schema restricts the enum, so a parse failure cannot happen here.
        if (auto parsed = parse_discovery_mode(mode.as<std::string>())) {
            cfg.discovery_mode = *parsed;
        }
    }
    if (auto sysfs = discovery["sysfs"]) {
        set_if_present(sysfs, "root", cfg.sysfs.root);
        set_if_present(sysfs, "interfaces", cfg.sysfs.interfaces);
        set_if_present(sysfs, "netlink", cfg.sysfs.netlink);
        set_if_present(sysfs, "poll_interval_ms", cfg.sysfs.poll_interval_ms);
    }
    if (auto hubble = discovery["hubble"]) {
        set_if_present(hubble, "relay_addr", cfg.hubble.relay_addr);
        set_if_present(hubble, "reconnect_initial_ms", cfg.hubble.reconnect_initial_ms);
        set_if_present(hubble, "reconnect_max_ms", cfg.hubble.reconnect_max_ms);
    }
}

std::optional<bool> parse_bool(const std::string& text) {
    const auto v = lower(text);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::optional<unsigned> parse_positive_uint(const std::string& text) {
    if (text.empty() || text[0] == '-') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const unsigned long v = std::strtoul(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || v == 0 || v > 0xFFFFFFFFul) {
        return std::nullopt;
    }
    return static_cast<unsigned>(v);
}

std::optional<double> parse_positive_double(const std::string& text) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(v) || v <= 0.0) {
        return std::nullopt;
    }
    return v;
}

} // namespace

const char* to_string(DiscoveryMode mode) noexcept {
    switch (mode) {
        case DiscoveryMode::Sysfs:  return "sysfs";
        case DiscoveryMode::Hubble: return "hubble";
        case DiscoveryMode::None:   return "none";
    }
    return "unknown";
}

std::optional<DiscoveryMode> parse_discovery_mode(const std::string& text) {
    const auto v = lower(text);
    if (v == "sysfs") return DiscoveryMode::Sysfs;
    if (v == "hubble") return DiscoveryMode::Hubble;
    if (v == "none") return DiscoveryMode::None;
    return std::nullopt;
}

std::chrono::milliseconds Config::idle_timeout() const {
    return std::chrono::milliseconds(
        static_cast<long long>(std::llround(state.idle_timeout_seconds * 1000.0)));
}

/**
 * @brief Populate a Config structure from a YAML document on disk.
 */
std::optional<Config> Config::from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        return std::nullopt;
    } catch (const YAML::ParserException& ex) {
        std::cerr << "Config parse error in " << path << ": " << ex.what() << '\n';
        return std::nullopt;
    }

    auto schema = load_schema(path);
    if (!schema) {
        std::cerr << "Failed to load config schema near " << path << '\n';
        return std::nullopt;
    }

    std::string validation_error;
    if (!validate_root(root, *schema, validation_error)) {
        std::cerr << "Config validation failed: " << validation_error << '\n';
        return std::nullopt;
    }

    Config cfg;
    try {
        if (auto log = root["log"]) {
            set_if_present(log, "mode", cfg.log_mode);
            set_if_present(log, "level", cfg.log_level);
            set_if_present(log, "file", cfg.log_file);
        }
        set_if_present(root, "listen", cfg.listen);
        set_if_present(root, "demo_mode", cfg.demo_mode);

        apply_discovery_config(root["discovery"], cfg);

        if (auto state = root["state"]) {
            set_if_present(state, "idle_timeout_seconds", cfg.state.idle_timeout_seconds);
            set_if_present(state, "sweep_interval_ms", cfg.state.sweep_interval_ms);
        }
        if (auto events = root["events"]) {
            set_if_present(events, "history_size", cfg.events.history_size);
            set_if_present(events, "subscriber_buffer", cfg.events.subscriber_buffer);
        }
    } catch (const YAML::Exception& ex) {
        std::cerr << "Config value error in " << path << ": " << ex.what() << '\n';
        return std::nullopt;
    }

    if (cfg.hubble.reconnect_max_ms < cfg.hubble.reconnect_initial_ms) {
        cfg.hubble.reconnect_max_ms = cfg.hubble.reconnect_initial_ms;
    }
    return cfg;
}

std::optional<std::string> Config::process_env(const char* name) {
    const char* value = std::getenv(name);
    if (!value) return std::nullopt;
    return std::string(value);
}

std::size_t Config::apply_env(const EnvLookup& lookup) {
    std::size_t applied = 0;
    auto warn_invalid = [](const char* name, const std::string& value) {
        LWLOG_WARN("[config] ignoring invalid %s=%s", name, value.c_str());
    };

    if (auto v = lookup("DISCOVERY_MODE")) {
        if (auto mode = parse_discovery_mode(*v)) {
            discovery_mode = *mode;
            ++applied;
        } else {
            warn_invalid("DISCOVERY_MODE", *v);
        }
    }
    if (auto v = lookup("HUBBLE_RELAY_ADDR")) {
        if (!v->empty()) {
            hubble.relay_addr = *v;
            ++applied;
        } else {
            warn_invalid("HUBBLE_RELAY_ADDR", *v);
        }
    }
    if (auto v = lookup("IDLE_TIMEOUT_SECONDS")) {
        if (auto seconds = parse_positive_double(*v)) {
            state.idle_timeout_seconds = *seconds;
            ++applied;
        } else {
            warn_invalid("IDLE_TIMEOUT_SECONDS", *v);
        }
    }
    if (auto v = lookup("SWEEP_INTERVAL_MS")) {
        if (auto ms = parse_positive_uint(*v)) {
            state.sweep_interval_ms = *ms;
            ++applied;
        } else {
            warn_invalid("SWEEP_INTERVAL_MS", *v);
        }
    }
    if (auto v = lookup("POLL_INTERVAL_MS")) {
        if (auto ms = parse_positive_uint(*v)) {
            sysfs.poll_interval_ms = *ms;
            ++applied;
        } else {
            warn_invalid("POLL_INTERVAL_MS", *v);
        }
    }
    if (auto v = lookup("DEMO_MODE")) {
        if (auto flag = parse_bool(*v)) {
            demo_mode = *flag;
            ++applied;
        } else {
            warn_invalid("DEMO_MODE", *v);
        }
    }
    if (auto v = lookup("LOG_LEVEL")) {
        if (parse_log_level(*v)) {
            log_level = lower(*v);
            ++applied;
        } else {
            warn_invalid("LOG_LEVEL", *v);
        }
    }
    if (auto v = lookup("LINKWATCH_LISTEN")) {
        if (!v->empty()) {
            listen = *v;
            ++applied;
        } else {
            warn_invalid("LINKWATCH_LISTEN", *v);
        }
    }
    return applied;
}

} // namespace linkwatch
