#pragma once

#include "lightsync/core/protocol/schema/error.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

struct error {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::ErrorData& out) noexcept {
        out = schema::ErrorData{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in error message -> ignore message.");
            return r;
        }

        // error (required), some deployments name it 'message'
        r = helper::parse_string_required(data, "error", out.error);
        if (r != Result::Parsed) {
            r = helper::parse_string_required(data, "message", out.error);
        }
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'error' missing in error message -> ignore message.");
            return r;
        }

        out.code = "UNKNOWN";
        if ((r = helper::parse_text_or(data, "code", out.code)) != Result::Parsed ||
            (r = helper::parse_string_optional(data, "orderbook_id", out.orderbook_id)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid field in error message -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
