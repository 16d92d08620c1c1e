// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/topology/DemoTopology.h"

#include "linkwatch/log/Log.h"
#include "linkwatch/topology/TopologyStore.h"

#include <cstdint>
#include <iterator>

namespace linkwatch {
namespace {

struct DemoNode {
    const char* id;
    const char* label;
    NodeType type;
    const char* platform;
    const char* ip;
};

struct DemoLink {
    const char* id;
    const char* source;
    const char* target;
    const char* source_iface;
    const char* target_iface;
    std::uint32_t speed_mbps;
    LinkState initial;
};

constexpr DemoNode kNodes[] = {
    {"router1", "Router 1", NodeType::Router, "srlinux", "172.20.20.11"},
    {"router2", "Router 2", NodeType::Router, "ceos", "172.20.20.12"},
    {"router3", "Router 3", NodeType::Router, "frr", "172.20.20.13"},
    {"switch1", "Switch 1", NodeType::Switch, "linux", "172.20.20.21"},
};

constexpr DemoLink kLinks[] = {
    {"link1", "router1", "router2", "e1-1", "eth1", 10000, LinkState::Active},
    {"link2", "router2", "router3", "eth2", "eth1", 1000, LinkState::Idle},
    {"link3", "router3", "switch1", "eth2", "eth1", 1000, LinkState::Active},
    {"link4", "switch1", "router1", "eth2", "e1-2", 10000, LinkState::Down},
};

} // namespace

Status load_demo_topology(TopologyStore& store) {
    for (const auto& n : kNodes) {
        Node node;
        node.id = n.id;
        node.label = n.label;
        node.type = n.type;
        node.status = NodeStatus::Up;
        node.platform = n.platform;
        node.ip_address = n.ip;
        if (auto st = store.add_node(std::move(node), "demo"); !st) return st;
    }

    const auto now = Clock::now();
    for (const auto& l : kLinks) {
        Link link;
        link.id = l.id;
        link.source_node_id = l.source;
        link.target_node_id = l.target;
        link.source_interface = l.source_iface;
        link.target_interface = l.target_iface;
        link.speed_mbps = l.speed_mbps;
        link.last_updated = now;
        if (auto st = store.add_link(std::move(link), "demo"); !st) return st;
        if (l.initial != LinkState::Idle) {
            if (auto st = store.set_state(l.id, l.initial, now, "demo"); !st) return st;
        }
    }

    LWLOG_INFO("[demo] loaded %zu nodes and %zu links",
               std::size(kNodes), std::size(kLinks));
    return Status::ok();
}

} // namespace linkwatch
