#pragma once

#include <vector>

#include "lightsync/core/protocol/schema/book.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

struct book_update {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::BookUpdate& out) noexcept {
        out = schema::BookUpdate{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in book_update message -> ignore message.");
            return r;
        }

        // orderbook_id (required)
        r = helper::parse_string_required(data, "orderbook_id", out.orderbook_id);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'orderbook_id' missing or invalid in book_update message -> ignore message.");
            return r;
        }

        // resync (optional) carries no levels
        r = helper::parse_bool_or(data, "resync", out.resync);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'resync' invalid in book_update message -> ignore message.");
            return r;
        }
        r = helper::parse_string_optional(data, "message", out.message);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'message' invalid in book_update message -> ignore message.");
            return r;
        }
        if (out.resync) {
            return Result::Parsed;
        }

        // seq (the venue also sends it as 'sequence')
        std::optional<std::uint64_t> seq;
        r = helper::parse_uint64_optional(data, "seq", seq);
        if (r == Result::Parsed && !seq) {
            r = helper::parse_uint64_optional(data, "sequence", seq);
        }
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'seq' invalid in book_update message -> ignore message.");
            return r;
        }
        out.seq = seq.value_or(0);

        r = helper::parse_bool_or(data, "is_snapshot", out.is_snapshot);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'is_snapshot' invalid in book_update message -> ignore message.");
            return r;
        }

        r = helper::parse_text_or(data, "timestamp", out.timestamp);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'timestamp' invalid in book_update message -> ignore message.");
            return r;
        }

        r = parse_side_(data, "bids", out.bids);
        if (r != Result::Parsed) {
            return r;
        }
        return parse_side_(data, "asks", out.asks);
    }

private:
    // [{side?, price, size}, ...]; an absent side is an empty side
    [[nodiscard]]
    static inline Result parse_side_(const simdjson::dom::element& data, const char* key, std::vector<schema::Level>& out) noexcept {
        simdjson::dom::array levels;
        bool present = false;
        auto r = helper::parse_array_optional(data, key, levels, present);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field '" << key << "' is not an array in book_update message -> ignore message.");
            return r;
        }
        if (!present) {
            return Result::Parsed;
        }
        try {
            out.reserve(levels.size());
            for (simdjson::dom::element lvl : levels) {
                schema::Level level;
                r = helper::parse_decimal_required(lvl, "price", level.price);
                if (r != Result::Parsed) {
                    LS_DEBUG("[PARSER] Invalid price in '" << key << "' level of book_update message -> ignore message.");
                    return r;
                }
                r = helper::parse_decimal_required(lvl, "size", level.size);
                if (r != Result::Parsed) {
                    LS_DEBUG("[PARSER] Invalid size in '" << key << "' level of book_update message -> ignore message.");
                    return r;
                }
                out.push_back(std::move(level));
            }
        } catch (const std::exception&) {
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
