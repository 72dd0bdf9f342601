//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_ALL_DETECTORS_HPP
#define JANITOR_ALL_DETECTORS_HPP

/**
 * @file all_detectors.hpp
 * @brief Includes every built-in detector.
 */

#include "janitor/detectors/unused_imports_detector.hpp"
#include "janitor/detectors/unused_variables_detector.hpp"
#include "janitor/detectors/dead_functions_detector.hpp"
#include "janitor/detectors/dead_exports_detector.hpp"
#include "janitor/detectors/circular_dependency_detector.hpp"
#include "janitor/detectors/complexity_detector.hpp"

#endif //JANITOR_ALL_DETECTORS_HPP
