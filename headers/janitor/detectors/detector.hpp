//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_DETECTOR_HPP
#define JANITOR_DETECTOR_HPP

/**
 * @file detector.hpp
 * @brief Detector interface and registry.
 *
 * Each detector handles one concern and owns its finding kind. Adding a
 * concern means registering another implementation; nothing else in the
 * engine switches on finding kinds.
 *
 * Detectors:
 * - unused-imports: import bindings never referenced
 * - unused-variables: variables and parameters never read
 * - dead-functions: functions and methods never referenced
 * - dead-exports: exported non-function symbols no other file uses
 * - circular-dependencies: cycles in the module graph
 * - complexity: functions over the configured complexity thresholds
 *
 * Detectors may throw; the file analyzer isolates the failure to the
 * detector and file concerned.
 */

#include "janitor/analysis/candidate.hpp"
#include "janitor/analysis/context.hpp"
#include "janitor/syntax/syntax_tree.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace janitor::detectors {

    class IDetector {
    public:
        virtual ~IDetector() = default;

        /**
         * Registry key, also the name used by the enable flags.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual FindingKind kind() const noexcept = 0;

        /**
         * Emits raw candidates for one file, in AST traversal order.
         */
        [[nodiscard]] virtual std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree,
            const analysis::AnalysisContext& context
        ) const = 0;
    };

    /**
     * Ordered set of detectors. Owned by whoever runs analysis; there is no
     * process-wide instance.
     */
    class DetectorRegistry {
    public:
        DetectorRegistry() = default;
        DetectorRegistry(DetectorRegistry&&) noexcept = default;
        DetectorRegistry& operator=(DetectorRegistry&&) noexcept = default;
        DetectorRegistry(const DetectorRegistry&) = delete;
        DetectorRegistry& operator=(const DetectorRegistry&) = delete;

        /**
         * The six built-in detectors in their execution order.
         */
        static DetectorRegistry with_defaults();

        /**
         * Appends a detector. A detector with the same name is replaced in
         * place.
         */
        void register_detector(std::unique_ptr<IDetector> detector);

        bool unregister_detector(std::string_view name);

        [[nodiscard]] const IDetector* get(std::string_view name) const;
        [[nodiscard]] std::vector<const IDetector*> list() const;
        [[nodiscard]] std::vector<std::string> names() const;
        [[nodiscard]] std::size_t size() const noexcept { return detectors_.size(); }

    private:
        std::vector<std::unique_ptr<IDetector>> detectors_;
    };

}  // namespace janitor::detectors

#endif //JANITOR_DETECTOR_HPP
