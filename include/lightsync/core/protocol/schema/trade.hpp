#pragma once

#include <cstdint>
#include <string>

#include "lightsync/core/decimal.hpp"


namespace lightsync::core::protocol::schema {

// ===============================================
// trades payload (stateless, forwarded as-is)
// ===============================================
struct Trade {
    std::string orderbook_id;
    Decimal price;
    Decimal size;
    std::string side;
    std::string timestamp;
    std::string trade_id;
    std::uint64_t sequence{0};
};

} // namespace lightsync::core::protocol::schema
