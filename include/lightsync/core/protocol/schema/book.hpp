#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lightsync/core/decimal.hpp"


namespace lightsync::core::protocol::schema {

// One price level as delivered on the wire. A zero size means "remove".
struct Level {
    Decimal price;
    Decimal size;
};

// ===============================================
// book_update payload
// ===============================================
//
// Either a full snapshot (is_snapshot == true) or a delta that must carry
// the next expected sequence number. A frame with resync == true carries no
// levels: the server asks the client to drop the book and resubscribe.
//
struct BookUpdate {
    std::string orderbook_id;
    std::string timestamp;
    std::uint64_t seq{0};
    std::vector<Level> bids;
    std::vector<Level> asks;
    bool is_snapshot{false};
    bool resync{false};
    std::optional<std::string> message;
};

} // namespace lightsync::core::protocol::schema
