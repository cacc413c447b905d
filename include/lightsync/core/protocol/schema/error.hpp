#pragma once

#include <optional>
#include <string>

#include "lightsync/core/error.hpp"


namespace lightsync::core::protocol::schema {

// In-band server error frame. Never touches connection or book state.
struct ErrorData {
    std::string error;
    std::string code;
    std::optional<std::string> orderbook_id;

    [[nodiscard]]
    inline ServerErrorCode server_code() const noexcept {
        return server_error_code_from_string(code);
    }
};

} // namespace lightsync::core::protocol::schema
