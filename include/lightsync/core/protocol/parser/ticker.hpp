#pragma once

#include "lightsync/core/protocol/schema/ticker.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

struct ticker {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::Ticker& out) noexcept {
        out = schema::Ticker{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in ticker message -> ignore message.");
            return r;
        }

        r = helper::parse_string_required(data, "orderbook_id", out.orderbook_id);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'orderbook_id' missing in ticker message -> ignore message.");
            return r;
        }

        if ((r = helper::parse_decimal_optional(data, "best_bid", out.best_bid)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(data, "best_ask", out.best_ask)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(data, "mid", out.mid)) != Result::Parsed ||
            (r = helper::parse_text_or(data, "timestamp", out.timestamp)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid field in ticker message -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
