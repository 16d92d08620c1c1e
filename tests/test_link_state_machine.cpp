// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/state/LinkStateMachine.h"

#include <cassert>
#include <chrono>

using namespace std::chrono_literals;
using linkwatch::LinkState;
using linkwatch::Metrics;
using linkwatch::state::LinkStateMachine;
using linkwatch::state::Trigger;
using linkwatch::state::next_state;

int main() {
    // Transition table.
    {
        assert(next_state(LinkState::Idle, Trigger::TrafficObserved) == LinkState::Active);
        assert(!next_state(LinkState::Down, Trigger::TrafficObserved));
        assert(!next_state(LinkState::Active, Trigger::TrafficObserved));

        assert(next_state(LinkState::Active, Trigger::IdleTimeout) == LinkState::Idle);
        assert(!next_state(LinkState::Idle, Trigger::IdleTimeout));
        assert(!next_state(LinkState::Down, Trigger::IdleTimeout));

        assert(next_state(LinkState::Active, Trigger::InterfaceDown) == LinkState::Down);
        assert(next_state(LinkState::Idle, Trigger::InterfaceDown) == LinkState::Down);
        assert(!next_state(LinkState::Down, Trigger::InterfaceDown));
        assert(next_state(LinkState::Active, Trigger::EndpointDeleted) == LinkState::Down);

        // Interface up only lifts a down link, it never claims traffic.
        assert(next_state(LinkState::Down, Trigger::InterfaceUp) == LinkState::Idle);
        assert(!next_state(LinkState::Idle, Trigger::InterfaceUp));
        assert(!next_state(LinkState::Active, Trigger::InterfaceUp));

        assert(next_state(LinkState::Idle, Trigger::Override, LinkState::Down) == LinkState::Down);
        assert(next_state(LinkState::Down, Trigger::Override, LinkState::Active) == LinkState::Active);
        assert(!next_state(LinkState::Idle, Trigger::Override, LinkState::Idle));
        assert(!next_state(LinkState::Idle, Trigger::Override));
    }

    const auto t0 = linkwatch::from_epoch_seconds(1'700'000'000.0);
    Metrics busy;
    busy.rx_bps = 1000.0;
    Metrics quiet;

    // Traffic promotes, the idle timeout demotes exactly once.
    {
        LinkStateMachine m;
        assert(m.state() == LinkState::Idle);
        assert(!m.on_metrics(quiet, t0));
        assert(m.state() == LinkState::Idle);

        auto t = m.on_metrics(busy, t0);
        assert(t && t->from == LinkState::Idle && t->to == LinkState::Active);
        assert(t->trigger == Trigger::TrafficObserved);
        assert(!m.on_metrics(busy, t0 + 1s));
        assert(m.last_traffic() == t0 + 1s);

        assert(!m.on_idle_check(t0 + 5s, 5000ms));
        auto idle = m.on_idle_check(t0 + 6s, 5000ms);
        assert(idle && idle->from == LinkState::Active && idle->to == LinkState::Idle);
        assert(idle->trigger == Trigger::IdleTimeout);
        assert(!m.on_idle_check(t0 + 60s, 5000ms));
        assert(m.state() == LinkState::Idle);
    }

    // A delayed but recent observation keeps the link active.
    {
        LinkStateMachine m;
        assert(m.on_metrics(busy, t0 + 10s));
        assert(!m.on_metrics(busy, t0 + 2s));
        assert(m.last_traffic() == t0 + 10s);
        assert(!m.on_idle_check(t0 + 14s, 5000ms));
        assert(m.on_idle_check(t0 + 15s, 5000ms));
    }

    // Down, then up to idle, then traffic to active. Traffic alone never revives.
    {
        LinkStateMachine m(LinkState::Active);
        auto down = m.on_link_status(false, t0 + 10s);
        assert(down && down->to == LinkState::Down && down->trigger == Trigger::InterfaceDown);
        assert(!m.on_link_status(false, t0 + 11s));

        assert(!m.on_metrics(busy, t0 + 9s));
        assert(!m.on_metrics(busy, t0 + 11s));
        assert(!m.on_metrics(busy, t0 + 60s));
        assert(m.state() == LinkState::Down);
        assert(m.last_traffic() == t0 + 60s);

        auto up = m.on_link_status(true, t0 + 12s);
        assert(up && up->from == LinkState::Down && up->to == LinkState::Idle);
        // A sample from before the down signal arriving late stays stale.
        assert(!m.on_metrics(busy, t0 + 10s));
        assert(m.state() == LinkState::Idle);

        auto active = m.on_metrics(busy, t0 + 13s);
        assert(active && active->to == LinkState::Active);

        auto gone = m.on_endpoint_deleted(t0 + 14s);
        assert(gone && gone->to == LinkState::Down && gone->trigger == Trigger::EndpointDeleted);
        assert(!m.on_idle_check(t0 + 100s, 5000ms));
    }

    // Overrides: last write by timestamp wins, an Active override starts the idle clock.
    {
        LinkStateMachine m;
        assert(m.accepts_override(t0));
        auto t = m.on_override(LinkState::Active, t0 + 20s);
        assert(t && t->to == LinkState::Active && t->trigger == Trigger::Override);
        assert(!m.accepts_override(t0 + 19s));
        assert(m.accepts_override(t0 + 20s));

        assert(!m.on_idle_check(t0 + 24s, 5000ms));
        assert(m.on_idle_check(t0 + 25s, 5000ms));

        auto down = m.on_override(LinkState::Down, t0 + 30s);
        assert(down && down->to == LinkState::Down);
        assert(!m.on_metrics(busy, t0 + 30s));
        assert(!m.on_metrics(busy, t0 + 31s));
        assert(m.state() == LinkState::Down);
        auto back = m.on_override(LinkState::Active, t0 + 32s);
        assert(back && back->from == LinkState::Down && back->to == LinkState::Active);
        assert(!m.on_override(LinkState::Active, t0 + 33s));
    }

    return 0;
}
