// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file TopologyStore.h
 * @brief Authoritative registry of nodes and links.
 *
 * Locking model
 * -------------
 *  - registry_mutex_ (shared) guards the node map, the link map and the
 *    interface index. Structural changes (add/remove) hold it exclusively.
 *  - Every link record carries its own mutex. upsert_metrics, set_state,
 *    apply_link_status and the idle sweep hold only that mutex while they run
 *    the state machine and publish, so unrelated links never serialise on
 *    each other and events of one link reach the bus in generation order.
 *  - Lock order is always registry -> record.
 */

#include "linkwatch/events/EventBus.h"
#include "linkwatch/state/LinkStateMachine.h"
#include "linkwatch/topology/Status.h"
#include "linkwatch/topology/Types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace linkwatch {

/// When upsert_metrics() publishes a metrics_update.
enum class MetricsPublish {
    Always,
    OnChange ///< skip repeated quiet samples (periodic discovery polls)
};

struct StoreStats {
    std::size_t node_count{0};
    std::size_t link_count{0};
    std::size_t active_links{0};
    std::size_t idle_links{0};
    std::size_t down_links{0};
    double uptime_seconds{0.0};
};

class TopologyStore {
public:
    explicit TopologyStore(events::EventBus& bus);

    TopologyStore(const TopologyStore&) = delete;
    TopologyStore& operator=(const TopologyStore&) = delete;

    // -------------------------------------------------------------------------
    // Structural mutations
    // -------------------------------------------------------------------------

    Status add_node(Node node, const std::string& source = "api");

    /**
     * @brief Remove a node. Rejected with FailedPrecondition while any link
     *        still references it; links are never removed implicitly.
     */
    Status remove_node(const std::string& node_id, const std::string& source = "api");

    /**
     * @brief Register a link between two existing nodes.
     *
     * The link always starts in LinkState::Idle with zeroed metrics; any
     * state or metrics present in @p link are ignored and must be applied
     * through set_state() / upsert_metrics().
     */
    Status add_link(Link link, const std::string& source = "api");

    Status remove_link(const std::string& link_id, const std::string& source = "api");

    // -------------------------------------------------------------------------
    // Per-link atomic mutations
    // -------------------------------------------------------------------------

    /**
     * @brief Store metrics, feed the state machine and publish.
     *
     * Emits one metrics_update and, when the machine transitions, one
     * link_state_change, all under the link's lock. With
     * MetricsPublish::OnChange a zero-rate sample on a link whose stored
     * rates are already zero is stored without a metrics_update.
     */
    Status upsert_metrics(const std::string& link_id,
                          const Metrics& metrics,
                          Timestamp ts,
                          const std::string& source = "api",
                          MetricsPublish publish = MetricsPublish::Always);

    /**
     * @brief Explicit state override.
     *
     * An override stamped earlier than the last accepted one is rejected with
     * ErrorCode::Conflict (last write by timestamp wins). Requesting the
     * current state succeeds without publishing anything.
     */
    Status set_state(const std::string& link_id,
                     LinkState state,
                     Timestamp ts,
                     const std::string& source = "api");

    /**
     * @brief Discovery up/down signal for a link.
     *
     * @param endpoint_deleted Down because an upstream endpoint disappeared.
     */
    Status apply_link_status(const std::string& link_id,
                             bool up,
                             Timestamp ts,
                             const std::string& source,
                             bool endpoint_deleted = false);

    /**
     * @brief Demote every active link whose last traffic is older than @p timeout.
     *
     * @return Number of links moved to idle.
     */
    std::size_t sweep_idle(Timestamp now, std::chrono::milliseconds timeout);

    // -------------------------------------------------------------------------
    // Queries (copies; never expose records)
    // -------------------------------------------------------------------------

    TopologySnapshot get_topology() const;
    std::vector<Link> get_links(std::optional<LinkState> filter = std::nullopt) const;
    std::optional<Link> get_link(const std::string& link_id) const;
    std::optional<Node> get_node(const std::string& node_id) const;

    /**
     * @brief Resolve a kernel interface name ("eth1") or a node-qualified
     *        name ("router3:eth1") to the link using it.
     *
     * A name shared by several links resolves to the most recently added one
     * still present.
     */
    std::optional<std::string> find_link_by_interface(const std::string& iface) const;

    StoreStats stats() const;

private:
    struct LinkRecord {
        LinkRecord(Link initial, std::uint64_t order)
            : link_id(initial.id),
              source_node_id(initial.source_node_id),
              target_node_id(initial.target_node_id),
              source_interface(initial.source_interface),
              target_interface(initial.target_interface),
              added_order(order),
              link(std::move(initial)) {}

        // Identity fields never change, so the registry reads them without rec.mutex.
        const std::string link_id;
        const std::string source_node_id;
        const std::string target_node_id;
        const std::string source_interface;
        const std::string target_interface;
        const std::uint64_t added_order;

        /// Index keys this link answers to, plain and node-qualified.
        std::vector<std::string> interface_keys() const;

        std::mutex mutex;
        Link link;
        state::LinkStateMachine machine{LinkState::Idle};
        bool removed{false};
    };
    using LinkRecordPtr = std::shared_ptr<LinkRecord>;

    LinkRecordPtr find_record(const std::string& link_id) const;

    /// Caller holds rec.mutex.
    void record_transition(LinkRecord& rec,
                           const std::optional<state::Transition>& transition,
                           Timestamp ts,
                           const std::string& source);

    /// Caller holds rec.mutex.
    static void touch(LinkRecord& rec, Timestamp ts) noexcept;

    events::EventBus& bus_;
    const Timestamp started_at_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, Node> nodes_;
    std::unordered_map<std::string, LinkRecordPtr> links_;
    std::unordered_map<std::string, std::string> iface_index_;
    std::uint64_t next_link_order_{0};
};

/// Field-level checks shared by the store and the agent ingest path.
Status validate_metrics(const Metrics& metrics);

} // namespace linkwatch
