#pragma once

#include "lightsync/core/protocol/schema/auth.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

struct auth {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::Auth& out) noexcept {
        out = schema::Auth{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in auth message -> ignore message.");
            return r;
        }

        r = helper::parse_string_required(data, "status", out.status);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'status' missing in auth message -> ignore message.");
            return r;
        }

        if ((r = helper::parse_string_optional(data, "wallet", out.wallet)) != Result::Parsed ||
            (r = helper::parse_string_optional(data, "message", out.message)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid field in auth message -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
