// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/sources/sysfs/SysfsNetlinkSource.h"

#include "linkwatch/log/Log.h"

#include <linux/if_link.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <net/if.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace linkwatch {
namespace {

namespace fs = std::filesystem;

constexpr int kArphrdLoopback = 772;

std::optional<std::uint64_t> read_u64(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::uint64_t value = 0;
    if (!(in >> value)) return std::nullopt;
    return value;
}

bool is_loopback(const std::string& root, const std::string& iface) {
    if (iface == "lo") return true;
    auto type = read_u64(fs::path(root) / iface / "type");
    return type && *type == kArphrdLoopback;
}

bool allowed(const std::vector<std::string>& allow, const std::string& iface) {
    return allow.empty() || std::find(allow.begin(), allow.end(), iface) != allow.end();
}

} // namespace

SysfsNetlinkSource::~SysfsNetlinkSource() {
    close();
}

void SysfsNetlinkSource::configure(const Options& opts) {
    opts_ = opts;
    if (opts_.poll_interval.count() <= 0) opts_.poll_interval = std::chrono::milliseconds(100);
}

void SysfsNetlinkSource::configure_from_config(const Config& cfg) {
    Options opts;
    opts.root = cfg.sysfs.root;
    opts.interfaces = cfg.sysfs.interfaces;
    opts.netlink = cfg.sysfs.netlink;
    opts.poll_interval = std::chrono::milliseconds(cfg.sysfs.poll_interval_ms);
    configure(opts);
}

// -----------------------------------------------------------------------------
// sysfs helpers
// -----------------------------------------------------------------------------

std::vector<std::string> SysfsNetlinkSource::list_interfaces(const std::string& root,
                                                             const std::vector<std::string>& allow) {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string iface = it->path().filename().string();
        if (!allowed(allow, iface) || is_loopback(root, iface)) continue;
        out.push_back(iface);
    }
    if (ec) {
        LWLOG_WARN("[sysfs] cannot list %s: %s", root.c_str(), ec.message().c_str());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<discovery::RawCounterSample> SysfsNetlinkSource::read_counters(const std::string& root,
                                                                              const std::string& iface,
                                                                              Timestamp ts) {
    const fs::path stats = fs::path(root) / iface / "statistics";
    auto rx_bytes = read_u64(stats / "rx_bytes");
    auto tx_bytes = read_u64(stats / "tx_bytes");
    auto rx_packets = read_u64(stats / "rx_packets");
    auto tx_packets = read_u64(stats / "tx_packets");
    if (!rx_bytes || !tx_bytes || !rx_packets || !tx_packets) return std::nullopt;

    discovery::RawCounterSample sample;
    sample.key = iface;
    sample.key_kind = discovery::KeyKind::Interface;
    sample.rx_bytes = *rx_bytes;
    sample.tx_bytes = *tx_bytes;
    sample.rx_packets = *rx_packets;
    sample.tx_packets = *tx_packets;
    sample.timestamp = ts;
    return sample;
}

std::optional<bool> SysfsNetlinkSource::read_operstate(const std::string& root, const std::string& iface) {
    std::ifstream in(fs::path(root) / iface / "operstate");
    std::string state;
    if (!in || !(in >> state)) return std::nullopt;
    return state == "up" || state == "unknown";
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

bool SysfsNetlinkSource::open() {
    if (running_.load()) return true;

    std::error_code ec;
    if (!fs::is_directory(opts_.root, ec)) {
        LWLOG_ERROR("[sysfs] root %s is not a directory", opts_.root.c_str());
        return false;
    }

    queue_.reopen();
    running_.store(true);

    if (opts_.netlink) {
        if (open_netlink()) {
            netlink_thread_ = std::thread(&SysfsNetlinkSource::netlink_loop, this);
        } else {
            LWLOG_WARN("[sysfs] netlink unavailable, relying on operstate polling");
        }
    }
    poller_thread_ = std::thread(&SysfsNetlinkSource::poller_loop, this);

    LWLOG_INFO("[sysfs] polling %s every %lld ms (netlink %s)",
               opts_.root.c_str(),
               static_cast<long long>(opts_.poll_interval.count()),
               netlink_fd_ >= 0 ? "on" : "off");
    return true;
}

void SysfsNetlinkSource::close() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    if (wake_fd_ >= 0) {
        const std::uint64_t one = 1;
        if (::write(wake_fd_, &one, sizeof(one)) < 0) {
            LWLOG_WARN("[sysfs] eventfd wake failed: %s", std::strerror(errno));
        }
    }

    if (poller_thread_.joinable()) poller_thread_.join();
    if (netlink_thread_.joinable()) netlink_thread_.join();
    close_netlink();
    queue_.close();
    LWLOG_INFO("[sysfs] closed");
}

bool SysfsNetlinkSource::poll(const discovery::ObservationHandler& handler,
                              std::chrono::milliseconds max_wait) {
    queue_.drain(handler, max_wait);
    return running_.load();
}

discovery::SourceStats SysfsNetlinkSource::stats() const {
    discovery::SourceStats s;
    s.observations = observations_.load();
    s.decode_errors = decode_errors_.load();
    s.connected = running_.load();
    return s;
}

// -----------------------------------------------------------------------------
// Poller
// -----------------------------------------------------------------------------

void SysfsNetlinkSource::report_status(const std::string& iface, bool up, Timestamp ts) {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        auto it = last_up_.find(iface);
        if (it == last_up_.end()) {
            last_up_.emplace(iface, up);
            // First sighting only matters when the interface is already down.
            if (up) return;
        } else {
            if (it->second == up) return;
            it->second = up;
        }
    }

    discovery::RawLinkStatus status;
    status.key = iface;
    status.key_kind = discovery::KeyKind::Interface;
    status.up = up;
    status.timestamp = ts;
    if (queue_.push(status)) observations_.fetch_add(1);
    LWLOG_DEBUG("[sysfs] %s is %s", iface.c_str(), up ? "up" : "down");
}

std::size_t SysfsNetlinkSource::scan_once(Timestamp now) {
    std::size_t samples = 0;
    for (const auto& iface : list_interfaces(opts_.root, opts_.interfaces)) {
        if (auto up = read_operstate(opts_.root, iface)) {
            report_status(iface, *up, now);
        }
        auto sample = read_counters(opts_.root, iface, now);
        if (!sample) {
            decode_errors_.fetch_add(1);
            LWLOG_TRACE("[sysfs] incomplete statistics for %s", iface.c_str());
            continue;
        }
        if (queue_.push(std::move(*sample))) {
            observations_.fetch_add(1);
            ++samples;
        }
    }
    return samples;
}

void SysfsNetlinkSource::poller_loop() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (running_.load()) {
        lock.unlock();
        scan_once(Clock::now());
        lock.lock();
        wait_cv_.wait_for(lock, opts_.poll_interval, [this] { return !running_.load(); });
    }
}

// -----------------------------------------------------------------------------
// rtnetlink listener
// -----------------------------------------------------------------------------

bool SysfsNetlinkSource::open_netlink() {
    netlink_fd_ = ::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_ROUTE);
    if (netlink_fd_ < 0) {
        LWLOG_WARN("[netlink] socket failed: %s", std::strerror(errno));
        return false;
    }

    sockaddr_nl addr{};
    addr.nl_family = AF_NETLINK;
    addr.nl_groups = RTMGRP_LINK;
    if (::bind(netlink_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LWLOG_WARN("[netlink] bind failed: %s", std::strerror(errno));
        close_netlink();
        return false;
    }

    wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd_ < 0) {
        LWLOG_WARN("[netlink] eventfd failed: %s", std::strerror(errno));
        close_netlink();
        return false;
    }
    return true;
}

void SysfsNetlinkSource::close_netlink() {
    if (netlink_fd_ >= 0) {
        ::close(netlink_fd_);
        netlink_fd_ = -1;
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
}

void SysfsNetlinkSource::netlink_loop() {
    std::vector<char> buf(16384);
    pollfd fds[2] = {
        {netlink_fd_, POLLIN, 0},
        {wake_fd_, POLLIN, 0},
    };

    while (running_.load()) {
        const int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LWLOG_ERROR("[netlink] poll failed: %s", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        const ssize_t n = ::recv(netlink_fd_, buf.data(), buf.size(), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            if (errno == ENOBUFS) {
                // Kernel dropped notifications; the operstate poll catches up.
                LWLOG_WARN("[netlink] receive buffer overrun");
                decode_errors_.fetch_add(1);
                continue;
            }
            LWLOG_ERROR("[netlink] recv failed: %s", std::strerror(errno));
            break;
        }
        handle_netlink_buffer(buf.data(), static_cast<std::size_t>(n), Clock::now());
    }
}

void SysfsNetlinkSource::handle_netlink_buffer(const char* data, std::size_t len, Timestamp ts) {
    int remaining = static_cast<int>(len);
    for (auto* nh = reinterpret_cast<const nlmsghdr*>(data); NLMSG_OK(nh, remaining);
         nh = NLMSG_NEXT(nh, remaining)) {
        if (nh->nlmsg_type == NLMSG_DONE) break;
        if (nh->nlmsg_type != RTM_NEWLINK && nh->nlmsg_type != RTM_DELLINK) continue;
        if (nh->nlmsg_len < NLMSG_LENGTH(sizeof(ifinfomsg))) {
            decode_errors_.fetch_add(1);
            continue;
        }

        const auto* ifi = reinterpret_cast<const ifinfomsg*>(NLMSG_DATA(nh));
        std::string iface;
        int attr_len = static_cast<int>(IFLA_PAYLOAD(nh));
        for (auto* rta = IFLA_RTA(ifi); RTA_OK(rta, attr_len); rta = RTA_NEXT(rta, attr_len)) {
            if (rta->rta_type == IFLA_IFNAME) {
                iface.assign(static_cast<const char*>(RTA_DATA(rta)));
                break;
            }
        }
        if (iface.empty()) {
            char name[IF_NAMESIZE] = {};
            if (!::if_indextoname(static_cast<unsigned>(ifi->ifi_index), name)) {
                decode_errors_.fetch_add(1);
                continue;
            }
            iface = name;
        }
        if (iface == "lo" || !allowed(opts_.interfaces, iface)) continue;

        const bool up = nh->nlmsg_type == RTM_NEWLINK && (ifi->ifi_flags & IFF_RUNNING);
        report_status(iface, up, ts);
    }
}

} // namespace linkwatch
