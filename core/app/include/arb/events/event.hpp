#pragma once

#include "arb/events/event_types.hpp"

#include <variant>

namespace arb {

// Envelope carried by EventBus and EventLoopThread. Dispatch with
// std::get_if or the typed EventBus::subscribe<T>().
using Event = std::variant<ReserveUpdateEvent,
                           TradeCandidateEvent,
                           TradeExecutedEvent,
                           RiskEventNotice,
                           HeartbeatEvent>;

}  // namespace arb
