#pragma once

#include "lightsync/core/protocol/schema/trade.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

struct trades {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::Trade& out) noexcept {
        out = schema::Trade{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in trades message -> ignore message.");
            return r;
        }

        r = helper::parse_string_required(data, "orderbook_id", out.orderbook_id);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'orderbook_id' missing or invalid in trades message -> ignore message.");
            return r;
        }

        r = helper::parse_decimal_required(data, "price", out.price);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'price' missing or invalid in trades message -> ignore message.");
            return r;
        }

        r = helper::parse_decimal_required(data, "size", out.size);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'size' missing or invalid in trades message -> ignore message.");
            return r;
        }

        r = helper::parse_text_required(data, "side", out.side);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'side' missing or invalid in trades message -> ignore message.");
            return r;
        }

        r = helper::parse_text_or(data, "timestamp", out.timestamp);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'timestamp' invalid in trades message -> ignore message.");
            return r;
        }

        r = helper::parse_text_or(data, "trade_id", out.trade_id);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'trade_id' invalid in trades message -> ignore message.");
            return r;
        }

        std::optional<std::uint64_t> sequence;
        r = helper::parse_uint64_optional(data, "sequence", sequence);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'sequence' invalid in trades message -> ignore message.");
            return r;
        }
        out.sequence = sequence.value_or(0);

        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
