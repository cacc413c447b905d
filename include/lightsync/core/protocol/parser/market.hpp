#pragma once

#include "lightsync/core/protocol/enums.hpp"
#include "lightsync/core/protocol/schema/market.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

struct market {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::MarketEvent& out) noexcept {
        out = schema::MarketEvent{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in market message -> ignore message.");
            return r;
        }

        r = helper::parse_string_required(data, "event_type", out.event_type);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'event_type' missing in market message -> ignore message.");
            return r;
        }
        // Unrecognized lifecycle events are forwarded as Unknown
        out.type = market_event_type_from_string(out.event_type);

        r = helper::parse_string_required(data, "market_pubkey", out.market_pubkey);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'market_pubkey' missing in market message -> ignore message.");
            return r;
        }

        if ((r = helper::parse_string_optional(data, "orderbook_id", out.orderbook_id)) != Result::Parsed ||
            (r = helper::parse_text_or(data, "timestamp", out.timestamp)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid field in market message -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
