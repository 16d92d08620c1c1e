// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/events/EventBus.h"
#include "linkwatch/log/Log.h"

#include <cassert>
#include <chrono>
#include <optional>
#include <thread>

using namespace std::chrono_literals;
using namespace linkwatch;

static Event metrics_event(int i) {
    Event e;
    e.type = EventType::MetricsUpdate;
    e.link_id = "l" + std::to_string(i);
    e.metrics = Metrics{};
    return e;
}

int main() {
    Logger::init({LogLevel::ERROR, LogMode::Silent, ""});

    // A slow subscriber loses its oldest events while others see everything.
    {
        events::EventBus bus({5, 3});
        auto slow = bus.subscribe();
        auto fast = bus.subscribe({}, 100);
        auto changes = bus.subscribe({EventType::LinkStateChange});
        assert(bus.subscriber_count() == 3);

        for (int i = 0; i < 10; ++i) {
            assert(bus.publish(metrics_event(i)) == static_cast<std::uint64_t>(i + 1));
        }
        assert(bus.published() == 10);

        assert(slow->dropped() == 7);
        auto kept = slow->drain();
        assert(kept.size() == 3);
        assert(kept[0].link_id == "l7" && kept[1].link_id == "l8" && kept[2].link_id == "l9");
        assert(kept[0].sequence == 8 && kept[2].sequence == 10);
        assert(kept[0].timestamp != Timestamp{});

        auto all = fast->drain();
        assert(all.size() == 10 && fast->dropped() == 0);
        for (int i = 0; i < 10; ++i) assert(all[i].link_id == "l" + std::to_string(i));

        assert(changes->buffered() == 0);
        assert(!changes->next(10ms));

        // The history ring is independent of subscribers.
        auto hist = bus.history();
        assert(hist.size() == 5);
        assert(hist.front().link_id == "l5" && hist.back().link_id == "l9");
        auto tail = bus.history(std::nullopt, 2);
        assert(tail.size() == 2 && tail[0].link_id == "l8" && tail[1].link_id == "l9");
        assert(bus.history(EventType::LinkStateChange).empty());

        bus.unsubscribe(slow);
        assert(slow->closed());
        assert(bus.subscriber_count() == 2);
    }

    // Explicit timestamps survive publish, JSON shape of an event.
    {
        events::EventBus bus;
        Event e;
        e.type = EventType::LinkStateChange;
        e.link_id = "link1";
        e.old_state = LinkState::Idle;
        e.new_state = LinkState::Active;
        e.timestamp = from_epoch_seconds(1'705'314'600.0);
        e.source = "sysfs";
        bus.publish(e);

        auto hist = bus.history(EventType::LinkStateChange);
        assert(hist.size() == 1);
        const auto json = to_json(hist[0]);
        assert(json["type"] == "link_state_change");
        assert(json["sequence"] == 1);
        assert(json["source"] == "sysfs");
        assert(json["timestamp"] == "2024-01-15T10:30:00.000Z");
        assert(json["data"]["link_id"] == "link1");
        assert(json["data"]["old_state"] == "idle");
        assert(json["data"]["new_state"] == "active");
    }

    // A blocked consumer wakes on publish.
    {
        events::EventBus bus;
        auto sub = bus.subscribe();
        std::optional<Event> got;
        std::thread consumer([&] { got = sub->next(2000ms); });
        std::this_thread::sleep_for(20ms);
        bus.publish(metrics_event(42));
        consumer.join();
        assert(got && got->link_id == "l42");
        assert(sub->delivered() == 1);
    }

    // Shutdown closes subscriptions, wakes waiters and rejects new work.
    {
        events::EventBus bus;
        auto sub = bus.subscribe();
        bus.publish(metrics_event(1));

        std::thread waiter([&] {
            // Buffered events are still handed out after close.
            auto first = sub->next(2000ms);
            assert(first && first->link_id == "l1");
            const auto before = std::chrono::steady_clock::now();
            assert(!sub->next(5000ms));
            assert(std::chrono::steady_clock::now() - before < 2s);
        });
        std::this_thread::sleep_for(20ms);
        bus.shutdown();
        waiter.join();

        assert(sub->closed());
        assert(bus.subscriber_count() == 0);
        assert(bus.subscribe() == nullptr);
        assert(bus.publish(metrics_event(2)) == 0);
        bus.shutdown();
    }

    return 0;
}
