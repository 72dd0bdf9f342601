//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_JANITOR_HPP
#define JANITOR_JANITOR_HPP

/**
 * @file janitor.hpp
 * @brief Main header for the Janitor analysis library.
 *
 * Pulls in the core types and the workspace orchestrator. Include the
 * specific headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "config.hpp"
#include "workspace/orchestrator.hpp"

#endif //JANITOR_JANITOR_HPP
