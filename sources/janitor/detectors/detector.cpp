//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/detector.hpp"
#include "janitor/detectors/all_detectors.hpp"

#include <algorithm>
#include <string>

namespace janitor::detectors {

    DetectorRegistry DetectorRegistry::with_defaults() {
        DetectorRegistry registry;
        registry.register_detector(std::make_unique<UnusedImportsDetector>());
        registry.register_detector(std::make_unique<UnusedVariablesDetector>());
        registry.register_detector(std::make_unique<DeadFunctionsDetector>());
        registry.register_detector(std::make_unique<DeadExportsDetector>());
        registry.register_detector(std::make_unique<CircularDependencyDetector>());
        registry.register_detector(std::make_unique<ComplexityDetector>());
        return registry;
    }

    void DetectorRegistry::register_detector(std::unique_ptr<IDetector> detector) {
        const auto it = std::ranges::find_if(detectors_, [&detector](const auto& existing) {
            return existing->name() == detector->name();
        });
        if (it != detectors_.end()) {
            *it = std::move(detector);
            return;
        }
        detectors_.push_back(std::move(detector));
    }

    bool DetectorRegistry::unregister_detector(const std::string_view name) {
        return std::erase_if(detectors_, [name](const auto& detector) { return detector->name() == name; }) > 0;
    }

    const IDetector* DetectorRegistry::get(const std::string_view name) const {
        const auto it = std::ranges::find_if(detectors_, [name](const auto& detector) {
            return detector->name() == name;
        });
        return it == detectors_.end() ? nullptr : it->get();
    }

    std::vector<const IDetector*> DetectorRegistry::list() const {
        std::vector<const IDetector*> result;
        result.reserve(detectors_.size());
        for (const auto& detector : detectors_) {
            result.push_back(detector.get());
        }
        return result;
    }

    std::vector<std::string> DetectorRegistry::names() const {
        std::vector<std::string> result;
        result.reserve(detectors_.size());
        for (const auto& detector : detectors_) {
            result.emplace_back(detector->name());
        }
        return result;
    }

}  // namespace janitor::detectors
