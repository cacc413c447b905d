#pragma once

#include <optional>
#include <string>


namespace lightsync::core::protocol::schema {

// Result of the cookie-based authentication performed on upgrade
struct Auth {
    std::string status;
    std::optional<std::string> wallet;
    std::optional<std::string> message;

    [[nodiscard]]
    inline bool authenticated() const noexcept {
        return status == "authenticated";
    }
};

} // namespace lightsync::core::protocol::schema
