// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/topology/TopologyStore.h"

#include "linkwatch/log/Log.h"

#include <algorithm>
#include <cmath>

namespace linkwatch {
namespace {

bool finite_non_negative(double v) {
    return std::isfinite(v) && v >= 0.0;
}

std::string qualified_iface(const std::string& node_id, const std::string& iface) {
    return node_id + ":" + iface;
}

} // namespace

std::vector<std::string> TopologyStore::LinkRecord::interface_keys() const {
    std::vector<std::string> keys;
    if (!source_interface.empty()) {
        keys.push_back(source_interface);
        keys.push_back(qualified_iface(source_node_id, source_interface));
    }
    if (!target_interface.empty()) {
        keys.push_back(target_interface);
        keys.push_back(qualified_iface(target_node_id, target_interface));
    }
    return keys;
}

Status validate_metrics(const Metrics& m) {
    if (!finite_non_negative(m.rx_bps) || !finite_non_negative(m.tx_bps) ||
        !finite_non_negative(m.rx_pps) || !finite_non_negative(m.tx_pps)) {
        return {ErrorCode::Validation, "rates must be finite and non-negative"};
    }
    if (!std::isfinite(m.utilization) || m.utilization < 0.0 || m.utilization > 1.0) {
        return {ErrorCode::Validation, "utilization must be within [0, 1]"};
    }
    if (m.latency_ms && !finite_non_negative(*m.latency_ms)) {
        return {ErrorCode::Validation, "latency_ms must be non-negative"};
    }
    if (m.packet_loss && !finite_non_negative(*m.packet_loss)) {
        return {ErrorCode::Validation, "packet_loss must be non-negative"};
    }
    return Status::ok();
}

TopologyStore::TopologyStore(events::EventBus& bus)
    : bus_(bus), started_at_(Clock::now()) {}

// -----------------------------------------------------------------------------
// Nodes
// -----------------------------------------------------------------------------

Status TopologyStore::add_node(Node node, const std::string& source) {
    if (node.id.empty()) {
        return {ErrorCode::Validation, "node id must not be empty"};
    }
    if (node.label.empty()) node.label = node.id;

    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    if (nodes_.count(node.id)) {
        return {ErrorCode::AlreadyExists, "node already exists: " + node.id};
    }
    auto [it, inserted] = nodes_.emplace(node.id, std::move(node));
    if (!inserted) {
        return {ErrorCode::Internal, "node insertion failed"};
    }

    Event ev;
    ev.type = EventType::NodeAdded;
    ev.node_id = it->first;
    ev.node = it->second;
    ev.timestamp = Clock::now();
    ev.source = source;
    bus_.publish(std::move(ev));

    LWLOG_INFO("[store] node %s added (%s)", it->first.c_str(), to_string(it->second.type));
    return Status::ok();
}

Status TopologyStore::remove_node(const std::string& node_id, const std::string& source) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return {ErrorCode::NotFound, "node not found: " + node_id};
    }
    for (const auto& [link_id, rec] : links_) {
        if (rec->source_node_id == node_id || rec->target_node_id == node_id) {
            return {ErrorCode::FailedPrecondition,
                    "node " + node_id + " is still referenced by link " + link_id};
        }
    }
    nodes_.erase(it);

    Event ev;
    ev.type = EventType::NodeRemoved;
    ev.node_id = node_id;
    ev.timestamp = Clock::now();
    ev.source = source;
    bus_.publish(std::move(ev));

    LWLOG_INFO("[store] node %s removed", node_id.c_str());
    return Status::ok();
}

// -----------------------------------------------------------------------------
// Links
// -----------------------------------------------------------------------------

Status TopologyStore::add_link(Link link, const std::string& source) {
    if (link.id.empty()) {
        return {ErrorCode::Validation, "link id must not be empty"};
    }
    if (link.source_node_id.empty() || link.target_node_id.empty()) {
        return {ErrorCode::Validation, "link endpoints must not be empty"};
    }

    link.state = LinkState::Idle;
    link.metrics = Metrics{};
    if (link.last_updated == Timestamp{}) link.last_updated = Clock::now();

    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    if (links_.count(link.id)) {
        return {ErrorCode::AlreadyExists, "link already exists: " + link.id};
    }
    for (const auto* endpoint : {&link.source_node_id, &link.target_node_id}) {
        if (!nodes_.count(*endpoint)) {
            return {ErrorCode::Validation, "unknown endpoint node: " + *endpoint};
        }
    }

    auto rec = std::make_shared<LinkRecord>(link, next_link_order_++);
    links_.emplace(link.id, rec);
    for (const auto& key : rec->interface_keys()) iface_index_[key] = link.id;

    Event ev;
    ev.type = EventType::LinkAdded;
    ev.link_id = link.id;
    ev.link = link;
    ev.timestamp = Clock::now();
    ev.source = source;
    bus_.publish(std::move(ev));

    LWLOG_INFO("[store] link %s added %s(%s) <-> %s(%s)",
               link.id.c_str(),
               link.source_node_id.c_str(), link.source_interface.c_str(),
               link.target_node_id.c_str(), link.target_interface.c_str());
    return Status::ok();
}

Status TopologyStore::remove_link(const std::string& link_id, const std::string& source) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = links_.find(link_id);
    if (it == links_.end()) {
        return {ErrorCode::NotFound, "link not found: " + link_id};
    }
    LinkRecordPtr rec = it->second;
    links_.erase(it);

    // Hand each name the removed link owned back to the newest remaining
    // link that uses it.
    for (const auto& key : rec->interface_keys()) {
        auto idx = iface_index_.find(key);
        if (idx == iface_index_.end() || idx->second != link_id) continue;
        const LinkRecord* heir = nullptr;
        for (const auto& [other_id, other] : links_) {
            if (heir && other->added_order < heir->added_order) continue;
            const auto keys = other->interface_keys();
            if (std::find(keys.begin(), keys.end(), key) != keys.end()) heir = other.get();
        }
        if (heir) {
            idx->second = heir->link_id;
        } else {
            iface_index_.erase(idx);
        }
    }

    // Wait for any in-flight per-link mutation so link_removed is the last
    // event this link produces.
    std::lock_guard<std::mutex> rec_lock(rec->mutex);
    rec->removed = true;

    Event ev;
    ev.type = EventType::LinkRemoved;
    ev.link_id = link_id;
    ev.timestamp = Clock::now();
    ev.source = source;
    bus_.publish(std::move(ev));

    LWLOG_INFO("[store] link %s removed", link_id.c_str());
    return Status::ok();
}

// -----------------------------------------------------------------------------
// Per-link mutations
// -----------------------------------------------------------------------------

TopologyStore::LinkRecordPtr TopologyStore::find_record(const std::string& link_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = links_.find(link_id);
    return it == links_.end() ? nullptr : it->second;
}

void TopologyStore::touch(LinkRecord& rec, Timestamp ts) noexcept {
    if (ts > rec.link.last_updated) rec.link.last_updated = ts;
}

void TopologyStore::record_transition(LinkRecord& rec,
                                      const std::optional<state::Transition>& transition,
                                      Timestamp ts,
                                      const std::string& source) {
    if (!transition) return;
    rec.link.state = transition->to;

    Event ev;
    ev.type = EventType::LinkStateChange;
    ev.link_id = rec.link.id;
    ev.old_state = transition->from;
    ev.new_state = transition->to;
    ev.metrics = rec.link.metrics;
    ev.timestamp = ts;
    ev.source = source;
    bus_.publish(std::move(ev));

    LWLOG_INFO("[store] link %s %s -> %s (%s via %s)",
               rec.link.id.c_str(), to_string(transition->from), to_string(transition->to),
               state::to_string(transition->trigger), source.c_str());
}

Status TopologyStore::upsert_metrics(const std::string& link_id,
                                     const Metrics& metrics,
                                     Timestamp ts,
                                     const std::string& source,
                                     MetricsPublish publish) {
    if (auto st = validate_metrics(metrics); !st) return st;

    auto rec = find_record(link_id);
    if (!rec) return {ErrorCode::NotFound, "link not found: " + link_id};

    std::lock_guard<std::mutex> lock(rec->mutex);
    if (rec->removed) return {ErrorCode::NotFound, "link not found: " + link_id};

    const bool quiet_repeat = !metrics.has_traffic() && !rec->link.metrics.has_traffic();
    rec->link.metrics = metrics;
    touch(*rec, ts);
    const auto transition = rec->machine.on_metrics(metrics, ts);

    if (publish == MetricsPublish::Always || !quiet_repeat) {
        Event ev;
        ev.type = EventType::MetricsUpdate;
        ev.link_id = link_id;
        ev.metrics = metrics;
        ev.timestamp = ts;
        ev.source = source;
        bus_.publish(std::move(ev));
    }

    record_transition(*rec, transition, ts, source);
    return Status::ok();
}

Status TopologyStore::set_state(const std::string& link_id,
                                LinkState requested,
                                Timestamp ts,
                                const std::string& source) {
    auto rec = find_record(link_id);
    if (!rec) return {ErrorCode::NotFound, "link not found: " + link_id};

    std::lock_guard<std::mutex> lock(rec->mutex);
    if (rec->removed) return {ErrorCode::NotFound, "link not found: " + link_id};

    if (!rec->machine.accepts_override(ts)) {
        LWLOG_WARN("[store] stale override for link %s rejected (%s)",
                   link_id.c_str(), format_timestamp(ts).c_str());
        return {ErrorCode::Conflict, "a newer state override was already applied to " + link_id};
    }
    touch(*rec, ts);
    record_transition(*rec, rec->machine.on_override(requested, ts), ts, source);
    return Status::ok();
}

Status TopologyStore::apply_link_status(const std::string& link_id,
                                        bool up,
                                        Timestamp ts,
                                        const std::string& source,
                                        bool endpoint_deleted) {
    auto rec = find_record(link_id);
    if (!rec) return {ErrorCode::NotFound, "link not found: " + link_id};

    std::lock_guard<std::mutex> lock(rec->mutex);
    if (rec->removed) return {ErrorCode::NotFound, "link not found: " + link_id};

    touch(*rec, ts);
    const auto transition = endpoint_deleted && !up
                                ? rec->machine.on_endpoint_deleted(ts)
                                : rec->machine.on_link_status(up, ts);
    record_transition(*rec, transition, ts, source);
    return Status::ok();
}

std::size_t TopologyStore::sweep_idle(Timestamp now, std::chrono::milliseconds timeout) {
    std::vector<LinkRecordPtr> records;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        records.reserve(links_.size());
        for (const auto& [id, rec] : links_) records.push_back(rec);
    }

    std::size_t demoted = 0;
    for (const auto& rec : records) {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (rec->removed) continue;
        const auto transition = rec->machine.on_idle_check(now, timeout);
        if (transition) {
            record_transition(*rec, transition, now, "sweeper");
            ++demoted;
        }
    }
    return demoted;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

TopologySnapshot TopologyStore::get_topology() const {
    TopologySnapshot snap;
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    snap.timestamp = Clock::now();
    snap.nodes.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) snap.nodes.push_back(node);
    snap.links.reserve(links_.size());
    for (const auto& [id, rec] : links_) {
        std::lock_guard<std::mutex> rec_lock(rec->mutex);
        snap.links.push_back(rec->link);
    }
    std::sort(snap.nodes.begin(), snap.nodes.end(),
              [](const Node& a, const Node& b) { return a.id < b.id; });
    std::sort(snap.links.begin(), snap.links.end(),
              [](const Link& a, const Link& b) { return a.id < b.id; });
    return snap;
}

std::vector<Link> TopologyStore::get_links(std::optional<LinkState> filter) const {
    std::vector<Link> out;
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    for (const auto& [id, rec] : links_) {
        std::lock_guard<std::mutex> rec_lock(rec->mutex);
        if (!filter || rec->link.state == *filter) out.push_back(rec->link);
    }
    std::sort(out.begin(), out.end(), [](const Link& a, const Link& b) { return a.id < b.id; });
    return out;
}

std::optional<Link> TopologyStore::get_link(const std::string& link_id) const {
    auto rec = find_record(link_id);
    if (!rec) return std::nullopt;
    std::lock_guard<std::mutex> lock(rec->mutex);
    if (rec->removed) return std::nullopt;
    return rec->link;
}

std::optional<Node> TopologyStore::get_node(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> TopologyStore::find_link_by_interface(const std::string& iface) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = iface_index_.find(iface);
    if (it == iface_index_.end()) return std::nullopt;
    return it->second;
}

StoreStats TopologyStore::stats() const {
    StoreStats s;
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    s.node_count = nodes_.size();
    s.link_count = links_.size();
    for (const auto& [id, rec] : links_) {
        std::lock_guard<std::mutex> rec_lock(rec->mutex);
        switch (rec->link.state) {
            case LinkState::Active: ++s.active_links; break;
            case LinkState::Idle:   ++s.idle_links; break;
            case LinkState::Down:   ++s.down_links; break;
        }
    }
    s.uptime_seconds = std::chrono::duration<double>(Clock::now() - started_at_).count();
    return s;
}

} // namespace linkwatch
