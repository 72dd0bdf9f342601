//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_LOGGING_HPP
#define JANITOR_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Access to the shared "janitor" spdlog logger.
 */

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace janitor::log {

    /**
     * Returns the process-wide logger, creating a stderr sink on first use.
     */
    std::shared_ptr<spdlog::logger> logger();

    void set_level(spdlog::level::level_enum level);

    /**
     * Accepts spdlog level names ("trace", "debug", "info", "warn", ...).
     * Unknown names leave the level unchanged and return false.
     */
    bool set_level(std::string_view name);

}  // namespace janitor::log

#endif //JANITOR_LOGGING_HPP
