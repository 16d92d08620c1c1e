// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/log/Log.h"
#include "linkwatch/sources/sysfs/SysfsNetlinkSource.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
using linkwatch::SysfsNetlinkSource;
using linkwatch::discovery::RawCounterSample;
using linkwatch::discovery::RawLinkStatus;
using linkwatch::discovery::RawObservation;

static void write_file(const fs::path& path, const std::string& value) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << value << '\n';
}

static void make_iface(const fs::path& root, const char* name, const char* operstate,
                       std::uint64_t rx_bytes, std::uint64_t tx_bytes, bool with_stats = true) {
    const auto dir = root / name;
    write_file(dir / "operstate", operstate);
    write_file(dir / "type", "1");
    if (!with_stats) return;
    write_file(dir / "statistics" / "rx_bytes", std::to_string(rx_bytes));
    write_file(dir / "statistics" / "tx_bytes", std::to_string(tx_bytes));
    write_file(dir / "statistics" / "rx_packets", std::to_string(rx_bytes / 100));
    write_file(dir / "statistics" / "tx_packets", std::to_string(tx_bytes / 100));
}

struct Collected {
    std::vector<RawLinkStatus> statuses;
    std::vector<RawCounterSample> samples;
};

static Collected drain(SysfsNetlinkSource& src) {
    Collected c;
    src.poll([&c](const RawObservation& obs) {
        if (auto* s = std::get_if<RawLinkStatus>(&obs)) c.statuses.push_back(*s);
        if (auto* s = std::get_if<RawCounterSample>(&obs)) c.samples.push_back(*s);
    }, 10ms);
    return c;
}

int main() {
    linkwatch::Logger::init({linkwatch::LogLevel::ERROR, linkwatch::LogMode::Silent, ""});

    const fs::path root = fs::temp_directory_path() / ("linkwatch_sysfs_" + std::to_string(::getpid()));
    fs::remove_all(root);
    make_iface(root, "eth1", "up", 1000, 2000);
    make_iface(root, "eth2", "down", 0, 0);
    make_iface(root, "eth3", "up", 0, 0, /*with_stats=*/false);
    make_iface(root, "lo", "unknown", 5, 5);
    make_iface(root, "loop7", "unknown", 5, 5);
    write_file(root / "loop7" / "type", "772");

    const auto t0 = linkwatch::from_epoch_seconds(1'700'000'000.0);

    // Static helpers.
    {
        auto all = SysfsNetlinkSource::list_interfaces(root.string(), {});
        assert((all == std::vector<std::string>{"eth1", "eth2", "eth3"}));
        auto some = SysfsNetlinkSource::list_interfaces(root.string(), {"eth2", "lo"});
        assert((some == std::vector<std::string>{"eth2"}));
        assert(SysfsNetlinkSource::list_interfaces((root / "missing").string(), {}).empty());

        auto sample = SysfsNetlinkSource::read_counters(root.string(), "eth1", t0);
        assert(sample);
        assert(sample->key == "eth1");
        assert(sample->key_kind == linkwatch::discovery::KeyKind::Interface);
        assert(sample->rx_bytes == 1000 && sample->tx_bytes == 2000);
        assert(sample->rx_packets == 10 && sample->tx_packets == 20);
        assert(sample->timestamp == t0);
        assert(!SysfsNetlinkSource::read_counters(root.string(), "eth3", t0));

        assert(SysfsNetlinkSource::read_operstate(root.string(), "eth1") == true);
        assert(SysfsNetlinkSource::read_operstate(root.string(), "eth2") == false);
        assert(SysfsNetlinkSource::read_operstate(root.string(), "lo") == true);
        assert(!SysfsNetlinkSource::read_operstate(root.string(), "eth9"));
    }

    // Scans report counters every time and status only on change.
    {
        SysfsNetlinkSource src;
        src.configure({root.string(), {}, /*netlink=*/false, 1000ms});

        assert(src.scan_once(t0) == 2);
        auto first = drain(src);
        assert(first.samples.size() == 2);
        assert(first.statuses.size() == 1);
        assert(first.statuses[0].key == "eth2" && !first.statuses[0].up);

        make_iface(root, "eth1", "up", 5000, 9000);
        make_iface(root, "eth2", "up", 10, 10);
        assert(src.scan_once(t0 + 1s) == 2);
        auto second = drain(src);
        assert(second.statuses.size() == 1);
        assert(second.statuses[0].key == "eth2" && second.statuses[0].up);
        assert(second.statuses[0].timestamp == t0 + 1s);
        bool saw_eth1 = false;
        for (const auto& s : second.samples) {
            if (s.key == "eth1") {
                saw_eth1 = true;
                assert(s.rx_bytes == 5000 && s.tx_bytes == 9000);
            }
        }
        assert(saw_eth1);

        assert(src.scan_once(t0 + 2s) == 2);
        assert(drain(src).statuses.empty());

        auto stats = src.stats();
        assert(stats.decode_errors == 3);
        assert(stats.observations == 8);
        assert(!stats.connected);
    }

    // The allow-list narrows the scan.
    {
        SysfsNetlinkSource src;
        src.configure({root.string(), {"eth1"}, false, 1000ms});
        assert(src.scan_once(t0) == 1);
        auto c = drain(src);
        assert(c.samples.size() == 1 && c.samples[0].key == "eth1");
        assert(src.stats().decode_errors == 0);
    }

    // Lifecycle with the background poller.
    {
        SysfsNetlinkSource missing;
        missing.configure({(root / "nope").string(), {}, false, 10ms});
        assert(!missing.open());

        SysfsNetlinkSource src;
        src.configure({root.string(), {"eth1"}, false, 10ms});
        assert(src.open());
        assert(src.stats().connected);

        std::size_t samples = 0;
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (samples < 3 && std::chrono::steady_clock::now() < deadline) {
            samples += drain(src).samples.size();
        }
        assert(samples >= 3);

        const auto before = std::chrono::steady_clock::now();
        src.close();
        assert(std::chrono::steady_clock::now() - before < 1s);
        assert(!src.stats().connected);
        src.close();
    }

    fs::remove_all(root);
    return 0;
}
