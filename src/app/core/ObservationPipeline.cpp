// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/app/core/ObservationPipeline.h"

#include "linkwatch/log/Log.h"

#include <functional>
#include <type_traits>
#include <variant>

namespace linkwatch::app {

ObservationPipeline::ObservationPipeline(TopologyStore& store,
                                         state::ObservationNormalizer& normalizer)
    : store_(store), normalizer_(normalizer) {}

ObservationPipeline::~ObservationPipeline() {
    stop();
}

discovery::ObservationSource* ObservationPipeline::add_source(discovery::ObservationSourcePtr source) {
    if (!source) return nullptr;
    auto slot = std::make_unique<Slot>();
    slot->source = std::move(source);
    auto* raw = slot->source.get();
    slots_.push_back(std::move(slot));
    return raw;
}

std::size_t ObservationPipeline::start() {
    if (running_.exchange(true)) return 0;
    std::size_t started = 0;
    for (auto& slot : slots_) {
        if (!slot->source->open()) {
            LWLOG_ERROR("[pipeline] source %s failed to open, skipping", slot->source->name());
            continue;
        }
        slot->running = true;
        slot->worker = std::thread(&ObservationPipeline::worker_loop, this, std::ref(*slot));
        ++started;
    }
    LWLOG_INFO("[pipeline] %zu of %zu source(s) running", started, slots_.size());
    return started;
}

void ObservationPipeline::stop() {
    if (!running_.exchange(false)) return;
    for (auto& slot : slots_) {
        if (slot->running) slot->source->close();
    }
    for (auto& slot : slots_) {
        if (slot->worker.joinable()) slot->worker.join();
        slot->running = false;
    }
    LWLOG_INFO("[pipeline] stopped (%llu observations)",
               static_cast<unsigned long long>(observations_.load()));
}

void ObservationPipeline::worker_loop(Slot& slot) {
    const std::string name = slot.source->name();
    const discovery::ObservationHandler handler = [this, &name](const discovery::RawObservation& obs) {
        handle(obs, name);
    };
    while (running_.load()) {
        if (!slot.source->poll(handler, poll_wait_)) {
            if (running_.load()) {
                LWLOG_WARN("[pipeline] source %s stopped delivering", name.c_str());
            }
            break;
        }
    }
}

std::optional<std::string> ObservationPipeline::resolve(const std::string& key,
                                                        discovery::KeyKind kind) {
    if (kind == discovery::KeyKind::LinkId) return key;
    return store_.find_link_by_interface(key);
}

void ObservationPipeline::handle(const discovery::RawObservation& obs, const std::string& source) {
    observations_.fetch_add(1, std::memory_order_relaxed);

    std::visit(
        [&](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            const auto link_id = resolve(o.key, o.key_kind);
            if (!link_id) {
                unresolved_.fetch_add(1, std::memory_order_relaxed);
                LWLOG_TRACE("[pipeline] %s: no link for %s", source.c_str(), o.key.c_str());
                return;
            }

            if constexpr (std::is_same_v<T, discovery::RawLinkStatus>) {
                auto st = store_.apply_link_status(*link_id, o.up, o.timestamp, source,
                                                   o.endpoint_deleted);
                if (!st) {
                    rejected_.fetch_add(1, std::memory_order_relaxed);
                    LWLOG_DEBUG("[pipeline] status for %s rejected: %s",
                                link_id->c_str(), st.message().c_str());
                    return;
                }
                status_applied_.fetch_add(1, std::memory_order_relaxed);
            } else {
                auto link = store_.get_link(*link_id);
                if (!link) {
                    unresolved_.fetch_add(1, std::memory_order_relaxed);
                    normalizer_.forget(o.key);
                    return;
                }
                auto update = normalizer_.apply(o, *link_id, link->speed_mbps);
                if (!update) return;
                auto st = store_.upsert_metrics(update->link_id, update->metrics,
                                                update->timestamp, source,
                                                MetricsPublish::OnChange);
                if (!st) {
                    rejected_.fetch_add(1, std::memory_order_relaxed);
                    LWLOG_DEBUG("[pipeline] metrics for %s rejected: %s",
                                link_id->c_str(), st.message().c_str());
                    return;
                }
                metrics_applied_.fetch_add(1, std::memory_order_relaxed);
            }
        },
        obs);
}

PipelineStats ObservationPipeline::stats() const {
    PipelineStats s;
    s.observations = observations_.load();
    s.unresolved = unresolved_.load();
    s.status_applied = status_applied_.load();
    s.metrics_applied = metrics_applied_.load();
    s.rejected = rejected_.load();
    return s;
}

std::vector<NamedSourceStats> ObservationPipeline::source_stats() const {
    std::vector<NamedSourceStats> out;
    out.reserve(slots_.size());
    for (const auto& slot : slots_) {
        out.push_back({slot->source->name(), slot->source->stats()});
    }
    return out;
}

} // namespace linkwatch::app
