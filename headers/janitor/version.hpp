//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_VERSION_HPP
#define JANITOR_VERSION_HPP

/**
 * @file version.hpp
 * @brief Janitor version information.
 */

namespace janitor {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 4;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "0.4.0";

    constexpr auto PROJECT_NAME = "Janitor Dead Code Analyzer";

    /**
     * Short name used for the CLI binary and the logger.
     */
    constexpr auto PROJECT_SHORT_NAME = "janitor";

}  // namespace janitor

#endif //JANITOR_VERSION_HPP
