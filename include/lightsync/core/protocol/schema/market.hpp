#pragma once

#include <optional>
#include <string>

#include "lightsync/core/protocol/enums.hpp"


namespace lightsync::core::protocol::schema {

// Market lifecycle notification
struct MarketEvent {
    MarketEventType type{MarketEventType::Unknown};
    std::string event_type;     // raw tag, kept for unknown types
    std::string market_pubkey;
    std::optional<std::string> orderbook_id;
    std::string timestamp;
};

} // namespace lightsync::core::protocol::schema
