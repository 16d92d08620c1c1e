// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Observation.h
 * @brief Backend-agnostic raw observations and the ObservationSource interface.
 */

#include "linkwatch/topology/Types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace linkwatch::discovery {

/**
 * @brief How RawLinkStatus::key / RawCounterSample::key should be resolved.
 *
 * Local sources report kernel interface names; the relay source has already
 * mapped its endpoints to topology link ids.
 */
enum class KeyKind {
    Interface,
    LinkId
};

/**
 * @brief Interface (or link) up/down signal.
 */
struct RawLinkStatus {
    std::string key;
    KeyKind key_kind{KeyKind::Interface};
    bool up{false};
    bool endpoint_deleted{false};  ///< Down because an upstream endpoint disappeared.
    Timestamp timestamp{};
};

/**
 * @brief Cumulative counter sample for an interface (or link).
 */
struct RawCounterSample {
    std::string key;
    KeyKind key_kind{KeyKind::Interface};
    std::uint64_t rx_bytes{0};
    std::uint64_t tx_bytes{0};
    std::uint64_t rx_packets{0};
    std::uint64_t tx_packets{0};
    Timestamp timestamp{};
};

using RawObservation = std::variant<RawLinkStatus, RawCounterSample>;

/**
 * @brief Handler invoked for each observation a source delivers.
 */
using ObservationHandler = std::function<void(const RawObservation&)>;

/**
 * @brief Counters exposed by every source for health reporting.
 */
struct SourceStats {
    std::uint64_t observations{0};
    std::uint64_t decode_errors{0};
    std::uint64_t reconnects{0};
    bool connected{false};
};

/**
 * @brief Strategy interface over the discovery backends.
 *
 * Contract:
 *  - open() starts the backend (threads, sockets, streams).
 *  - poll() delivers queued observations to @p handler and returns after at
 *    most @p max_wait when nothing is available; it never blocks forever.
 *  - close() cancels every upstream wait and joins internal threads; calling
 *    it twice is harmless.
 */
class ObservationSource {
public:
    virtual ~ObservationSource() = default;

    virtual const char* name() const noexcept = 0;
    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool poll(const ObservationHandler& handler, std::chrono::milliseconds max_wait) = 0;
    virtual SourceStats stats() const = 0;
};

using ObservationSourcePtr = std::unique_ptr<ObservationSource>;

} // namespace linkwatch::discovery
