// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/events/EventBus.h"
#include "linkwatch/log/Log.h"
#include "linkwatch/topology/DemoTopology.h"
#include "linkwatch/topology/TopologyStore.h"

#include <cassert>
#include <chrono>
#include <map>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace linkwatch;

static Node make_node(const char* id) {
    Node n;
    n.id = id;
    n.status = NodeStatus::Up;
    return n;
}

static Link make_link(const char* id, const char* a, const char* a_if, const char* b, const char* b_if) {
    Link l;
    l.id = id;
    l.source_node_id = a;
    l.source_interface = a_if;
    l.target_node_id = b;
    l.target_interface = b_if;
    l.speed_mbps = 1000;
    l.last_updated = from_epoch_seconds(1'699'999'990.0);
    return l;
}

static Metrics traffic(double bps) {
    Metrics m;
    m.rx_bps = bps;
    m.tx_bps = bps / 2;
    return m;
}

int main() {
    Logger::init({LogLevel::ERROR, LogMode::Silent, ""});
    const auto t0 = from_epoch_seconds(1'700'000'000.0);

    // Structural mutations and referential integrity.
    {
        events::EventBus bus;
        TopologyStore store(bus);
        auto sub = bus.subscribe();

        assert(store.add_node(make_node("r1")));
        assert(store.add_node(make_node("r2")));
        assert(store.add_node(make_node("r1")).code() == ErrorCode::AlreadyExists);
        assert(store.add_node(Node{}).code() == ErrorCode::Validation);
        assert(store.get_node("r1")->label == "r1");

        // A link with an unknown endpoint leaves the store untouched.
        assert(store.add_link(make_link("bad", "r1", "eth9", "ghost", "eth0")).code() == ErrorCode::Validation);
        assert(store.get_links().empty());
        assert(!store.find_link_by_interface("eth9"));

        Link initial = make_link("link1", "r1", "eth1", "r2", "eth2");
        initial.state = LinkState::Active;
        initial.metrics = traffic(5000);
        assert(store.add_link(initial));
        assert(store.add_link(initial).code() == ErrorCode::AlreadyExists);

        auto link = store.get_link("link1");
        assert(link && link->state == LinkState::Idle);
        assert(!link->metrics.has_traffic());
        assert(store.find_link_by_interface("eth1") == "link1");
        assert(store.find_link_by_interface("r2:eth2") == "link1");

        assert(store.remove_node("r1").code() == ErrorCode::FailedPrecondition);
        assert(store.get_node("r1"));
        assert(store.remove_node("nope").code() == ErrorCode::NotFound);

        assert(store.remove_link("link1"));
        assert(store.remove_link("link1").code() == ErrorCode::NotFound);
        assert(!store.find_link_by_interface("eth1"));
        assert(store.upsert_metrics("link1", traffic(1), t0).code() == ErrorCode::NotFound);
        assert(store.remove_node("r1"));

        auto events = sub->drain();
        std::vector<EventType> types;
        for (const auto& e : events) types.push_back(e.type);
        const std::vector<EventType> expected{EventType::NodeAdded, EventType::NodeAdded,
                                              EventType::LinkAdded, EventType::LinkRemoved,
                                              EventType::NodeRemoved};
        assert(types == expected);
        assert(events[2].link && events[2].link->state == LinkState::Idle);
        for (std::size_t i = 1; i < events.size(); ++i) {
            assert(events[i].sequence > events[i - 1].sequence);
        }

        auto snap = store.get_topology();
        assert(snap.nodes.size() == 1 && snap.nodes[0].id == "r2");
        assert(snap.links.empty());
    }

    // Traffic promotes with metrics_update first, then exactly one state change.
    {
        events::EventBus bus;
        TopologyStore store(bus);
        store.add_node(make_node("r1"));
        store.add_node(make_node("r2"));
        store.add_link(make_link("link1", "r1", "eth1", "r2", "eth2"));
        auto sub = bus.subscribe();

        assert(store.upsert_metrics("link1", traffic(1e6), t0, "sysfs"));
        auto events = sub->drain();
        assert(events.size() == 2);
        assert(events[0].type == EventType::MetricsUpdate);
        assert(events[0].metrics && events[0].metrics->rx_bps == 1e6);
        assert(events[0].source == "sysfs");
        assert(events[1].type == EventType::LinkStateChange);
        assert(events[1].old_state == LinkState::Idle);
        assert(events[1].new_state == LinkState::Active);
        assert(events[1].sequence == events[0].sequence + 1);

        // Same observation again: metrics only.
        assert(store.upsert_metrics("link1", traffic(1e6), t0 + 1s, "sysfs"));
        events = sub->drain();
        assert(events.size() == 1 && events[0].type == EventType::MetricsUpdate);

        auto link = store.get_link("link1");
        assert(link->state == LinkState::Active);
        assert(link->last_updated == t0 + 1s);

        // Out-of-order observation never moves last_updated backwards.
        assert(store.upsert_metrics("link1", traffic(2e6), t0, "sysfs"));
        assert(store.get_link("link1")->last_updated == t0 + 1s);

        // Invalid metrics are rejected before anything is stored.
        Metrics bad = traffic(1);
        bad.utilization = 1.5;
        assert(store.upsert_metrics("link1", bad, t0 + 2s).code() == ErrorCode::Validation);
        bad = traffic(1);
        bad.tx_bps = -1;
        assert(store.upsert_metrics("link1", bad, t0 + 2s).code() == ErrorCode::Validation);
        sub->drain();
        assert(sub->buffered() == 0);
    }

    // A shared interface name falls back to the newest remaining link using it.
    {
        events::EventBus bus;
        TopologyStore store(bus);
        store.add_node(make_node("r1"));
        store.add_node(make_node("r2"));
        store.add_node(make_node("r3"));
        store.add_link(make_link("link1", "r1", "eth1", "r2", "eth2"));
        store.add_link(make_link("link2", "r3", "eth1", "r2", "eth3"));
        store.add_link(make_link("link3", "r2", "eth1", "r3", "eth4"));
        assert(store.find_link_by_interface("eth1") == "link3");

        assert(store.remove_link("link3"));
        assert(store.find_link_by_interface("eth1") == "link2");
        assert(store.find_link_by_interface("r1:eth1") == "link1");
        assert(!store.find_link_by_interface("r2:eth1"));

        // Removing an older holder leaves the current owner in place.
        assert(store.remove_link("link1"));
        assert(store.find_link_by_interface("eth1") == "link2");
        assert(!store.find_link_by_interface("r1:eth1"));
        assert(store.find_link_by_interface("eth2") == std::nullopt);

        assert(store.remove_link("link2"));
        assert(!store.find_link_by_interface("eth1"));
    }

    // Down, up to idle, traffic to active. Traffic without an up signal does not revive.
    {
        events::EventBus bus;
        TopologyStore store(bus);
        store.add_node(make_node("r1"));
        store.add_node(make_node("r2"));
        store.add_link(make_link("link1", "r1", "eth1", "r2", "eth2"));
        store.upsert_metrics("link1", traffic(100), t0);
        auto sub = bus.subscribe({EventType::LinkStateChange});

        assert(store.apply_link_status("link1", false, t0 + 2s, "netlink"));
        assert(store.upsert_metrics("link1", traffic(100), t0 + 1s, "sysfs"));
        assert(store.get_link("link1")->state == LinkState::Down);
        assert(store.upsert_metrics("link1", traffic(100), t0 + 2500ms, "sysfs"));
        auto down_link = store.get_link("link1");
        assert(down_link->state == LinkState::Down);
        assert(down_link->metrics.rx_bps == 100);

        assert(store.apply_link_status("link1", true, t0 + 3s, "netlink"));
        assert(store.get_link("link1")->state == LinkState::Idle);
        assert(store.upsert_metrics("link1", traffic(100), t0 + 4s, "sysfs"));
        assert(store.get_link("link1")->state == LinkState::Active);

        assert(store.apply_link_status("link1", false, t0 + 5s, "hubble", true));

        auto events = sub->drain();
        assert(events.size() == 4);
        assert(events[0].old_state == LinkState::Active && events[0].new_state == LinkState::Down);
        assert(events[0].source == "netlink");
        assert(events[1].new_state == LinkState::Idle);
        assert(events[2].new_state == LinkState::Active);
        assert(events[3].new_state == LinkState::Down && events[3].source == "hubble");
    }

    // Explicit overrides: older requests conflict, repeating the current state is silent.
    {
        events::EventBus bus;
        TopologyStore store(bus);
        store.add_node(make_node("r1"));
        store.add_node(make_node("r2"));
        store.add_link(make_link("link1", "r1", "eth1", "r2", "eth2"));
        auto sub = bus.subscribe();

        assert(store.set_state("link1", LinkState::Down, t0 + 5s));
        assert(store.set_state("link1", LinkState::Active, t0 + 4s).code() == ErrorCode::Conflict);
        assert(store.get_link("link1")->state == LinkState::Down);
        assert(store.set_state("link1", LinkState::Down, t0 + 6s));
        assert(store.set_state("nope", LinkState::Down, t0).code() == ErrorCode::NotFound);

        auto events = sub->drain();
        assert(events.size() == 1);
        assert(events[0].type == EventType::LinkStateChange);
        assert(events[0].new_state == LinkState::Down);

        auto stats = store.stats();
        assert(stats.node_count == 2 && stats.link_count == 1);
        assert(stats.down_links == 1 && stats.active_links == 0 && stats.idle_links == 0);
    }

    // Concurrent writers: each link's state changes form an unbroken chain.
    {
        events::EventBus bus;
        TopologyStore store(bus);
        store.add_node(make_node("r1"));
        store.add_node(make_node("r2"));
        store.add_link(make_link("link1", "r1", "eth1", "r2", "eth2"));
        store.add_link(make_link("link2", "r1", "eth3", "r2", "eth4"));
        auto sub = bus.subscribe({}, 10'000);

        std::thread flapper([&] {
            for (int i = 1; i <= 200; ++i) {
                const auto state = (i % 2) ? LinkState::Down : LinkState::Active;
                store.set_state("link1", state, t0 + std::chrono::milliseconds(i));
            }
        });
        std::thread feeder([&] {
            for (int i = 1; i <= 200; ++i) {
                const auto ts = t0 + std::chrono::milliseconds(i);
                if (i % 50 == 0) {
                    store.apply_link_status("link2", false, ts, "netlink");
                    store.apply_link_status("link2", true, ts, "netlink");
                } else {
                    store.upsert_metrics("link2", traffic(10.0 * i), ts, "sysfs");
                }
            }
        });
        flapper.join();
        feeder.join();

        auto events = sub->drain();
        assert(sub->dropped() == 0);
        std::map<std::string, LinkState> last{{"link1", LinkState::Idle}, {"link2", LinkState::Idle}};
        std::uint64_t prev_seq = 0;
        std::size_t changes = 0;
        for (const auto& e : events) {
            assert(e.sequence > prev_seq);
            prev_seq = e.sequence;
            if (e.type != EventType::LinkStateChange) continue;
            assert(e.old_state == last[e.link_id]);
            last[e.link_id] = *e.new_state;
            ++changes;
        }
        assert(last["link1"] == store.get_link("link1")->state);
        assert(last["link2"] == store.get_link("link2")->state);
        assert(store.get_link("link1")->state == LinkState::Active);
        assert(changes >= 200);
    }

    // Demo topology.
    {
        events::EventBus bus;
        TopologyStore store(bus);
        assert(load_demo_topology(store));
        auto snap = store.get_topology();
        assert(snap.nodes.size() == 4);
        assert(snap.links.size() == 4);
        assert(store.get_link("link1")->state == LinkState::Active);
        assert(store.get_link("link2")->state == LinkState::Idle);
        assert(store.get_link("link3")->state == LinkState::Active);
        assert(store.get_link("link4")->state == LinkState::Down);
        assert(store.get_node("switch1")->type == NodeType::Switch);
        assert(store.find_link_by_interface("router1:e1-2") == "link4");
        // Polled traffic on the down demo link leaves it down.
        assert(store.upsert_metrics("link4", traffic(1e6), Clock::now() + 1s, "sysfs"));
        assert(store.get_link("link4")->state == LinkState::Down);
        assert(load_demo_topology(store).code() == ErrorCode::AlreadyExists);
        for (std::size_t i = 1; i < snap.links.size(); ++i) {
            assert(snap.links[i - 1].id < snap.links[i].id);
        }
    }

    return 0;
}
