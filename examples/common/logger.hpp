#pragma once

#include <iostream>
#include <string>

#include "lcr/log/logger.hpp"


namespace telemux::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Level level = Level::Info;
        if (!parse_level(log_level, level)) {
            std::cerr << "Unknown log level '" << log_level << "', using info\n";
        }
        Logger::instance().set_level(level);
    }

} // namespace telemux::examples
