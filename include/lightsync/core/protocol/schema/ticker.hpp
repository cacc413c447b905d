#pragma once

#include <optional>
#include <string>

#include "lightsync/core/decimal.hpp"


namespace lightsync::core::protocol::schema {

// Best bid / ask / mid summary for one orderbook. Any side may be absent.
struct Ticker {
    std::string orderbook_id;
    std::optional<Decimal> best_bid;
    std::optional<Decimal> best_ask;
    std::optional<Decimal> mid;
    std::string timestamp;
};

} // namespace lightsync::core::protocol::schema
