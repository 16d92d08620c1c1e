// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file LinkStateMachine.h
 * @brief Per-link active/idle/down state machine.
 *
 * Transition table:
 *
 *   from         trigger                         to
 *   -----------  ------------------------------  ------
 *   idle         traffic observed                active
 *   active       idle timeout elapsed            idle
 *   any          interface down / endpoint gone  down
 *   down         interface up                    idle
 *   any          explicit override               requested
 *
 * Traffic never lifts a down link: it records the traffic time and waits
 * for an interface-up signal or an override. A trigger whose target equals
 * the current state is a no-op and yields no transition. The machine is not thread-safe: the owning link record
 * serialises every call under its own lock.
 */

#include "linkwatch/topology/Types.h"

#include <chrono>
#include <optional>

namespace linkwatch::state {

enum class Trigger {
    TrafficObserved,
    IdleTimeout,
    InterfaceDown,
    InterfaceUp,
    EndpointDeleted,
    Override
};

const char* to_string(Trigger trigger) noexcept;

/**
 * @brief Pure transition function over the table above.
 *
 * @param requested Target state, only consulted for Trigger::Override.
 * @return The new state, or std::nullopt when the trigger does not apply or
 *         the machine is already in the target state.
 */
std::optional<LinkState> next_state(LinkState current,
                                    Trigger trigger,
                                    std::optional<LinkState> requested = std::nullopt) noexcept;

struct Transition {
    LinkState from;
    LinkState to;
    Trigger trigger;
};

/**
 * @brief Stateful wrapper tracking the timestamps the triggers depend on.
 */
class LinkStateMachine {
public:
    explicit LinkStateMachine(LinkState initial = LinkState::Idle) noexcept : state_(initial) {}

    LinkState state() const noexcept { return state_; }

    /// Timestamp of the newest observation that carried traffic.
    std::optional<Timestamp> last_traffic() const noexcept { return last_traffic_; }

    /**
     * @brief Feed a metrics observation taken at @p ts.
     *
     * Traffic on a down link is recorded but causes no transition. Traffic
     * stamped at or before the latest down signal never promotes the link.
     */
    std::optional<Transition> on_metrics(const Metrics& metrics, Timestamp ts) noexcept;

    /// Explicit interface up/down signal from discovery.
    std::optional<Transition> on_link_status(bool up, Timestamp ts) noexcept;

    /// Upstream endpoint deletion (the link lost one of its ends).
    std::optional<Transition> on_endpoint_deleted(Timestamp ts) noexcept;

    /**
     * @brief Demote an active link once @p timeout elapsed since its last traffic.
     *
     * Uses observation timestamps, never arrival order, so a delayed but
     * recent observation keeps the link active.
     */
    std::optional<Transition> on_idle_check(Timestamp now, std::chrono::milliseconds timeout) noexcept;

    /// True when an override stamped @p ts is not older than the last one accepted.
    bool accepts_override(Timestamp ts) const noexcept;

    /**
     * @brief Apply an explicit override. Callers check accepts_override() first.
     */
    std::optional<Transition> on_override(LinkState requested, Timestamp ts) noexcept;

private:
    std::optional<Transition> apply(Trigger trigger, std::optional<LinkState> requested = std::nullopt) noexcept;

    LinkState state_;
    std::optional<Timestamp> last_traffic_{};
    std::optional<Timestamp> down_since_{};
    std::optional<Timestamp> last_override_{};
};

} // namespace linkwatch::state
