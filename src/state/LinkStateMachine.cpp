// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/state/LinkStateMachine.h"

namespace linkwatch::state {

const char* to_string(Trigger trigger) noexcept {
    switch (trigger) {
        case Trigger::TrafficObserved: return "traffic";
        case Trigger::IdleTimeout:     return "idle_timeout";
        case Trigger::InterfaceDown:   return "interface_down";
        case Trigger::InterfaceUp:     return "interface_up";
        case Trigger::EndpointDeleted: return "endpoint_deleted";
        case Trigger::Override:        return "override";
    }
    return "unknown";
}

std::optional<LinkState> next_state(LinkState current,
                                    Trigger trigger,
                                    std::optional<LinkState> requested) noexcept {
    std::optional<LinkState> target;
    switch (trigger) {
        case Trigger::TrafficObserved:
            // A down link leaves only on an explicit up signal or an override.
            if (current != LinkState::Down) target = LinkState::Active;
            break;
        case Trigger::IdleTimeout:
            if (current == LinkState::Active) target = LinkState::Idle;
            break;
        case Trigger::InterfaceDown:
        case Trigger::EndpointDeleted:
            target = LinkState::Down;
            break;
        case Trigger::InterfaceUp:
            // An up signal only matters for a down link; traffic promotes it further.
            if (current == LinkState::Down) target = LinkState::Idle;
            break;
        case Trigger::Override:
            target = requested;
            break;
    }
    if (!target || *target == current) return std::nullopt;
    return target;
}

std::optional<Transition> LinkStateMachine::apply(Trigger trigger,
                                                  std::optional<LinkState> requested) noexcept {
    const auto target = next_state(state_, trigger, requested);
    if (!target) return std::nullopt;
    Transition t{state_, *target, trigger};
    state_ = *target;
    return t;
}

std::optional<Transition> LinkStateMachine::on_metrics(const Metrics& metrics, Timestamp ts) noexcept {
    if (!metrics.has_traffic()) return std::nullopt;
    if (!last_traffic_ || ts > *last_traffic_) last_traffic_ = ts;
    if (state_ == LinkState::Down) return std::nullopt;
    // Samples taken before the last down signal are stale even once the link is back up.
    if (down_since_ && ts <= *down_since_) return std::nullopt;
    return apply(Trigger::TrafficObserved);
}

std::optional<Transition> LinkStateMachine::on_link_status(bool up, Timestamp ts) noexcept {
    if (up) {
        return apply(Trigger::InterfaceUp);
    }
    if (!down_since_ || ts > *down_since_) down_since_ = ts;
    return apply(Trigger::InterfaceDown);
}

std::optional<Transition> LinkStateMachine::on_endpoint_deleted(Timestamp ts) noexcept {
    if (!down_since_ || ts > *down_since_) down_since_ = ts;
    return apply(Trigger::EndpointDeleted);
}

std::optional<Transition> LinkStateMachine::on_idle_check(Timestamp now,
                                                          std::chrono::milliseconds timeout) noexcept {
    if (state_ != LinkState::Active) return std::nullopt;
    // An active link without any traffic timestamp was promoted by override
    // before any observation; its override time is the reference.
    const auto reference = last_traffic_ ? last_traffic_ : last_override_;
    if (reference && now - *reference < timeout) return std::nullopt;
    return apply(Trigger::IdleTimeout);
}

bool LinkStateMachine::accepts_override(Timestamp ts) const noexcept {
    return !last_override_ || ts >= *last_override_;
}

std::optional<Transition> LinkStateMachine::on_override(LinkState requested, Timestamp ts) noexcept {
    last_override_ = ts;
    if (requested == LinkState::Active && (!last_traffic_ || ts > *last_traffic_)) {
        // The idle timeout counts from the moment the link was declared active.
        last_traffic_ = ts;
    }
    if (requested == LinkState::Down && (!down_since_ || ts > *down_since_)) {
        down_since_ = ts;
    }
    return apply(Trigger::Override, requested);
}

} // namespace linkwatch::state
