// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/sources/relay/FlowTranslator.h"

#include "linkwatch/log/Log.h"

namespace linkwatch {

Timestamp timestamp_from_unix_nanos(std::int64_t nanos, Timestamp fallback) {
    if (nanos <= 0) return fallback;
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos)));
}

std::string FlowTranslator::endpoint_key(const relay::Endpoint& endpoint) {
    if (!endpoint.namespace_name().empty() && !endpoint.pod_name().empty()) {
        return endpoint.namespace_name() + "/" + endpoint.pod_name();
    }
    if (!endpoint.ip().empty()) return endpoint.ip();
    return "identity:" + std::to_string(endpoint.identity());
}

std::vector<discovery::RawObservation> FlowTranslator::on_endpoint(const relay::EndpointUpdate& update,
                                                                   Timestamp fallback_ts) {
    std::vector<discovery::RawObservation> out;
    const std::string key = endpoint_key(update.endpoint());
    const Timestamp ts = timestamp_from_unix_nanos(update.time_unix_nano(), fallback_ts);

    if (update.kind() == relay::EndpointUpdate::DELETED) {
        auto it = endpoints_.find(key);
        if (it == endpoints_.end()) return out;

        discovery::RawLinkStatus status;
        status.key = it->second.link_id;
        status.key_kind = discovery::KeyKind::LinkId;
        status.up = false;
        status.endpoint_deleted = true;
        status.timestamp = ts;
        severed_links_.insert(it->second.link_id);
        LWLOG_INFO("[relay] endpoint %s deleted, link %s loses its %s side",
                   key.c_str(), it->second.link_id.c_str(),
                   it->second.side == Side::Source ? "source" : "target");
        endpoints_.erase(it);
        out.emplace_back(std::move(status));
        return out;
    }

    Binding b;
    b.link_id = update.link_id();
    relay::LinkSide side = update.side();
    const auto& labels = update.endpoint().labels();
    if (b.link_id.empty()) {
        auto it = labels.find(kLinkLabel);
        if (it != labels.end()) b.link_id = it->second;
    }
    if (side == relay::SIDE_UNKNOWN) {
        auto it = labels.find(kSideLabel);
        if (it != labels.end()) {
            if (it->second == "source") side = relay::SIDE_SOURCE;
            else if (it->second == "target") side = relay::SIDE_TARGET;
        }
    }
    if (b.link_id.empty() || side == relay::SIDE_UNKNOWN) {
        LWLOG_DEBUG("[relay] endpoint %s carries no link binding", key.c_str());
        return out;
    }
    b.side = side == relay::SIDE_SOURCE ? Side::Source : Side::Target;

    if (severed_links_.erase(b.link_id)) {
        discovery::RawLinkStatus status;
        status.key = b.link_id;
        status.key_kind = discovery::KeyKind::LinkId;
        status.up = true;
        status.timestamp = ts;
        out.emplace_back(std::move(status));
    }
    endpoints_[key] = std::move(b);
    return out;
}

std::optional<discovery::RawCounterSample> FlowTranslator::on_flow(const relay::FlowRecord& flow,
                                                                   Timestamp fallback_ts) {
    if (flow.verdict() == relay::DROPPED || flow.verdict() == relay::ERROR) {
        ++dropped_flows_;
        return std::nullopt;
    }

    // A flow leaving the source side travels source -> target (tx); one
    // leaving the target side travels target -> source (rx).
    const Binding* binding = nullptr;
    bool from_source_side = true;
    if (auto it = endpoints_.find(endpoint_key(flow.source())); it != endpoints_.end()) {
        binding = &it->second;
        from_source_side = it->second.side == Side::Source;
    } else if (auto jt = endpoints_.find(endpoint_key(flow.destination())); jt != endpoints_.end()) {
        binding = &jt->second;
        from_source_side = jt->second.side == Side::Target;
    }
    if (!binding) {
        ++unmapped_flows_;
        return std::nullopt;
    }

    Counters& c = counters_[binding->link_id];
    const std::uint64_t packets = flow.packets() ? flow.packets() : 1;
    if (from_source_side) {
        c.tx_bytes += flow.bytes();
        c.tx_packets += packets;
    } else {
        c.rx_bytes += flow.bytes();
        c.rx_packets += packets;
    }

    discovery::RawCounterSample sample;
    sample.key = binding->link_id;
    sample.key_kind = discovery::KeyKind::LinkId;
    sample.rx_bytes = c.rx_bytes;
    sample.tx_bytes = c.tx_bytes;
    sample.rx_packets = c.rx_packets;
    sample.tx_packets = c.tx_packets;
    sample.timestamp = timestamp_from_unix_nanos(flow.time_unix_nano(), fallback_ts);
    return sample;
}

std::optional<FlowTranslator::Binding> FlowTranslator::binding(const std::string& endpoint_key) const {
    auto it = endpoints_.find(endpoint_key);
    if (it == endpoints_.end()) return std::nullopt;
    return it->second;
}

} // namespace linkwatch
