//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/logging.hpp"
#include "janitor/version.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace janitor::log {

    std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(PROJECT_SHORT_NAME)) {
                return existing;
            }
            auto created = spdlog::stderr_color_mt(PROJECT_SHORT_NAME);
            created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            created->set_level(spdlog::level::info);
            return created;
        }();
        return instance;
    }

    void set_level(const spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

    bool set_level(const std::string_view name) {
        const std::string text(name);
        const auto level = spdlog::level::from_str(text);
        // from_str falls back to "off" for names it does not recognise
        if (level == spdlog::level::off && text != "off") {
            return false;
        }
        set_level(level);
        return true;
    }

}  // namespace janitor::log
