#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace lightsync::examples {

    inline void set_log_level(const std::string& log_level) {
        lcr::log::Logger::instance().set_level(lcr::log::level_from_string(log_level));
    }

} // namespace lightsync::examples
