// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/discovery/ObservationQueue.h"
#include "linkwatch/log/Log.h"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace linkwatch;
using discovery::ObservationQueue;
using discovery::RawCounterSample;
using discovery::RawLinkStatus;
using discovery::RawObservation;

static RawLinkStatus link_status(const char* key, bool up) {
    RawLinkStatus s;
    s.key = key;
    s.up = up;
    return s;
}

static RawCounterSample sample(const char* key, std::uint64_t rx_bytes) {
    RawCounterSample s;
    s.key = key;
    s.rx_bytes = rx_bytes;
    return s;
}

static std::vector<RawObservation> drain_all(ObservationQueue& q) {
    std::vector<RawObservation> out;
    q.drain([&](const RawObservation& o) { out.push_back(o); }, 0ms);
    return out;
}

int main() {
    Logger::init({LogLevel::ERROR, LogMode::Silent, ""});

    // Overflow evicts the oldest counter sample and keeps status signals.
    {
        ObservationQueue q(3);
        assert(q.push(sample("eth1", 1)));
        assert(q.push(link_status("eth1", false)));
        assert(q.push(sample("eth1", 2)));
        assert(q.push(sample("eth1", 3)));
        assert(q.size() == 3);
        assert(q.dropped() == 1);

        auto got = drain_all(q);
        assert(got.size() == 3);
        assert(std::holds_alternative<RawLinkStatus>(got[0]));
        assert(!std::get<RawLinkStatus>(got[0]).up);
        assert(std::get<RawCounterSample>(got[1]).rx_bytes == 2);
        assert(std::get<RawCounterSample>(got[2]).rx_bytes == 3);

        // A status arriving at a full queue of samples still gets in.
        for (std::uint64_t i = 0; i < 3; ++i) q.push(sample("eth2", i));
        assert(q.push(link_status("eth2", true)));
        got = drain_all(q);
        assert(got.size() == 3);
        assert(std::get<RawCounterSample>(got[0]).rx_bytes == 1);
        assert(std::holds_alternative<RawLinkStatus>(got[2]));
        assert(q.dropped() == 2);
    }

    // With only status signals queued, a new sample is the one discarded.
    {
        ObservationQueue q(2);
        q.push(link_status("eth1", false));
        q.push(link_status("eth2", false));
        assert(q.push(sample("eth1", 9)));
        assert(q.dropped() == 1);
        assert(q.size() == 2);

        // A further status evicts the oldest status.
        q.push(link_status("eth3", true));
        auto got = drain_all(q);
        assert(got.size() == 2);
        assert(std::get<RawLinkStatus>(got[0]).key == "eth2");
        assert(std::get<RawLinkStatus>(got[1]).key == "eth3");
        assert(q.dropped() == 2);
    }

    // Close wakes a waiting consumer and rejects pushes until reopened.
    {
        ObservationQueue q(4);
        std::thread closer([&] {
            std::this_thread::sleep_for(20ms);
            q.close();
        });
        const auto start = std::chrono::steady_clock::now();
        assert(q.drain([](const RawObservation&) {}, 5s) == 0);
        assert(std::chrono::steady_clock::now() - start < 2s);
        closer.join();

        assert(!q.push(sample("eth1", 1)));
        q.reopen();
        assert(q.push(sample("eth1", 1)));
        assert(q.size() == 1);
    }

    return 0;
}
