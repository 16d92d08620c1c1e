// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/app/core/AgentEventCodec.h"

#include "linkwatch/log/Log.h"

namespace linkwatch::app {
namespace {

constexpr const char* kSchemaText = R"json(
{
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "required": ["event_type"],
  "anyOf": [
    { "required": ["link_id"] },
    { "required": ["interface"] }
  ],
  "properties": {
    "event_type": { "enum": ["link_state_change", "metrics_update"] },
    "link_id": { "type": "string", "minLength": 1 },
    "interface": { "type": "string", "minLength": 1 },
    "old_state": { "enum": ["active", "idle", "down", "up_active", "up_idle"] },
    "new_state": { "enum": ["active", "idle", "down", "up_active", "up_idle"] },
    "source": { "type": "string", "minLength": 1 },
    "timestamp": {
      "oneOf": [
        { "type": "string", "minLength": 1 },
        { "type": "number", "minimum": 0, "maximum": 4102444800 }
      ]
    },
    "metrics": {
      "type": "object",
      "properties": {
        "rx_bps": { "type": "number", "minimum": 0 },
        "tx_bps": { "type": "number", "minimum": 0 },
        "rx_pps": { "type": "number", "minimum": 0 },
        "tx_pps": { "type": "number", "minimum": 0 },
        "rx_bytes_total": { "type": "integer", "minimum": 0 },
        "tx_bytes_total": { "type": "integer", "minimum": 0 },
        "utilization": { "type": "number", "minimum": 0, "maximum": 1 },
        "latency_ms": { "type": ["number", "null"], "minimum": 0 },
        "packet_loss": { "type": ["number", "null"], "minimum": 0 }
      }
    }
  },
  "allOf": [
    {
      "if": { "properties": { "event_type": { "const": "link_state_change" } } },
      "then": { "required": ["new_state"] }
    },
    {
      "if": { "properties": { "event_type": { "const": "metrics_update" } } },
      "then": { "required": ["metrics"] }
    }
  ]
}
)json";

template <typename T>
void read_if_present(const nlohmann::json& obj, const char* key, T& target) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) target = it->get<T>();
}

Metrics metrics_from_json(const nlohmann::json& j) {
    Metrics m;
    read_if_present(j, "rx_bps", m.rx_bps);
    read_if_present(j, "tx_bps", m.tx_bps);
    read_if_present(j, "rx_pps", m.rx_pps);
    read_if_present(j, "tx_pps", m.tx_pps);
    read_if_present(j, "rx_bytes_total", m.rx_bytes_total);
    read_if_present(j, "tx_bytes_total", m.tx_bytes_total);
    read_if_present(j, "utilization", m.utilization);
    if (auto it = j.find("latency_ms"); it != j.end() && it->is_number()) {
        m.latency_ms = it->get<double>();
    }
    if (auto it = j.find("packet_loss"); it != j.end() && it->is_number()) {
        m.packet_loss = it->get<double>();
    }
    return m;
}

} // namespace

const nlohmann::json& AgentEventCodec::schema() {
    static const nlohmann::json schema = nlohmann::json::parse(kSchemaText);
    return schema;
}

AgentEventCodec::AgentEventCodec()
    : validator_(nullptr, nlohmann::json_schema::default_string_format_check) {
    validator_.set_root_schema(schema());
}

Status AgentEventCodec::decode(const std::string& text, AgentEvent& out) const {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return {ErrorCode::Validation, "payload is not valid JSON"};
    }
    return decode(doc, out);
}

Status AgentEventCodec::decode(const nlohmann::json& doc, AgentEvent& out) const {
    try {
        validator_.validate(doc);
    } catch (const std::exception& ex) {
        return {ErrorCode::Validation, ex.what()};
    }

    AgentEvent ev;
    try {
        auto type = parse_event_type(doc.at("event_type").get<std::string>());
        if (!type) return {ErrorCode::Validation, "unsupported event_type"};
        ev.type = *type;

        read_if_present(doc, "link_id", ev.link_id);
        read_if_present(doc, "interface", ev.interface);
        read_if_present(doc, "source", ev.source);
        if (auto it = doc.find("old_state"); it != doc.end()) {
            ev.old_state = parse_link_state(it->get<std::string>());
        }
        if (auto it = doc.find("new_state"); it != doc.end()) {
            ev.new_state = parse_link_state(it->get<std::string>());
        }
        if (auto it = doc.find("metrics"); it != doc.end()) {
            ev.metrics = metrics_from_json(*it);
        }
        if (auto it = doc.find("timestamp"); it != doc.end()) {
            if (it->is_number()) {
                const double secs = it->get<double>();
                if (!epoch_seconds_in_range(secs)) {
                    return {ErrorCode::Validation, "timestamp is out of range"};
                }
                ev.timestamp = from_epoch_seconds(secs);
            } else {
                ev.timestamp = parse_timestamp(it->get<std::string>());
                if (!ev.timestamp) {
                    return {ErrorCode::Validation, "timestamp is not ISO-8601 UTC"};
                }
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        return {ErrorCode::Validation, ex.what()};
    }

    out = std::move(ev);
    return Status::ok();
}

Status AgentEventCodec::apply(const AgentEvent& event,
                              TopologyStore& store,
                              Timestamp received_at) const {
    std::string link_id = event.link_id;
    if (link_id.empty()) {
        auto resolved = store.find_link_by_interface(event.interface);
        if (!resolved) {
            return {ErrorCode::NotFound, "no link uses interface " + event.interface};
        }
        link_id = *resolved;
    }
    const Timestamp ts = event.timestamp.value_or(received_at);

    switch (event.type) {
    case EventType::LinkStateChange:
        if (!event.new_state) return {ErrorCode::Validation, "new_state is required"};
        return store.set_state(link_id, *event.new_state, ts, event.source);
    case EventType::MetricsUpdate:
        if (!event.metrics) return {ErrorCode::Validation, "metrics is required"};
        return store.upsert_metrics(link_id, *event.metrics, ts, event.source);
    default:
        return {ErrorCode::Validation, "unsupported event_type"};
    }
}

Status AgentEventCodec::submit(const std::string& text,
                               TopologyStore& store,
                               Timestamp received_at) const {
    AgentEvent ev;
    if (auto st = decode(text, ev); !st) {
        LWLOG_DEBUG("[agent] rejected payload: %s", st.message().c_str());
        return st;
    }
    return apply(ev, store, received_at);
}

Status AgentEventCodec::submit_batch(const std::string& text,
                                     TopologyStore& store,
                                     Timestamp received_at,
                                     std::vector<BatchItemResult>& results) const {
    results.clear();
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_array()) {
        return {ErrorCode::Validation, "batch payload must be a JSON array"};
    }

    results.reserve(doc.size());
    for (const auto& item : doc) {
        BatchItemResult r;
        if (item.is_object()) {
            for (const char* key : {"link_id", "interface"}) {
                auto it = item.find(key);
                if (it != item.end() && it->is_string()) {
                    r.key = it->get<std::string>();
                    break;
                }
            }
        }
        AgentEvent ev;
        r.status = decode(item, ev);
        if (r.status) r.status = apply(ev, store, received_at);
        results.push_back(std::move(r));
    }
    return Status::ok();
}

} // namespace linkwatch::app
