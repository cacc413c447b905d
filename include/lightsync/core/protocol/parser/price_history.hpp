#pragma once

#include "lightsync/core/protocol/schema/price_history.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

struct price_history {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::PriceHistoryEvent& out) noexcept {
        out = schema::PriceHistoryEvent{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in price_history message -> ignore message.");
            return r;
        }

        std::string event_type;
        r = helper::parse_string_required(data, "event_type", event_type);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'event_type' missing in price_history message -> ignore message.");
            return r;
        }
        if (!schema::price_history_event_type_from_string(event_type, out.type)) {
            LS_DEBUG("[PARSER] Unknown price_history event_type '" << event_type << "' -> ignore message.");
            return Result::InvalidValue;
        }

        if ((r = helper::parse_string_optional(data, "orderbook_id", out.orderbook_id)) != Result::Parsed ||
            (r = helper::parse_text_or(data, "resolution", out.resolution)) != Result::Parsed ||
            (r = helper::parse_bool_optional(data, "include_ohlcv", out.include_ohlcv)) != Result::Parsed ||
            (r = helper::parse_int64_optional(data, "last_timestamp", out.last_timestamp)) != Result::Parsed ||
            (r = helper::parse_int64_optional(data, "server_time", out.server_time)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid field in price_history message -> ignore message.");
            return r;
        }

        try {
            // prices (snapshot)
            simdjson::dom::array prices;
            bool present = false;
            r = helper::parse_array_optional(data, "prices", prices, present);
            if (r != Result::Parsed) {
                LS_DEBUG("[PARSER] Field 'prices' is not an array in price_history message -> ignore message.");
                return r;
            }
            if (present) {
                out.prices.reserve(prices.size());
                for (simdjson::dom::element el : prices) {
                    schema::Candle c;
                    r = parse_candle_(el, c);
                    if (r != Result::Parsed) {
                        LS_DEBUG("[PARSER] Invalid candle in price_history snapshot -> ignore message.");
                        return r;
                    }
                    out.prices.push_back(std::move(c));
                }
            }

            // inline candle (update)
            simdjson::dom::element t;
            if (helper::find(data, "t", t)) {
                schema::Candle c;
                r = parse_candle_(data, c);
                if (r != Result::Parsed) {
                    LS_DEBUG("[PARSER] Invalid inline candle in price_history update -> ignore message.");
                    return r;
                }
                out.candle = std::move(c);
            }
        } catch (const std::exception&) {
            return Result::InvalidValue;
        }

        if (out.type == schema::PriceHistoryEventType::Update && !out.candle) {
            LS_DEBUG("[PARSER] price_history update without candle -> ignore message.");
            return Result::InvalidSchema;
        }
        if (out.type != schema::PriceHistoryEventType::Heartbeat && !out.orderbook_id) {
            LS_DEBUG("[PARSER] Field 'orderbook_id' missing in price_history message -> ignore message.");
            return Result::InvalidSchema;
        }
        return Result::Parsed;
    }

private:
    [[nodiscard]]
    static inline Result parse_candle_(const simdjson::dom::element& el, schema::Candle& c) noexcept {
        Result r;
        if ((r = helper::require_object(el)) != Result::Parsed ||
            (r = helper::parse_int64_required(el, "t", c.t)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "o", c.o)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "h", c.h)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "l", c.l)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "c", c.c)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "v", c.v)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "m", c.m)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "bb", c.bb)) != Result::Parsed ||
            (r = helper::parse_decimal_optional(el, "ba", c.ba)) != Result::Parsed) {
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
