//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_FILE_ANALYZER_HPP
#define JANITOR_FILE_ANALYZER_HPP

/**
 * @file file_analyzer.hpp
 * @brief Runs the enabled detectors over one file and classifies the output.
 *
 * This is the body of a worker task. Detectors run sequentially in
 * registry order; a detector that throws is recorded as the file's error
 * while the remaining detectors still run.
 */

#include "janitor/analysis/certainty_classifier.hpp"
#include "janitor/analysis/context.hpp"
#include "janitor/detectors/detector.hpp"
#include "janitor/types.hpp"

#include <string>
#include <vector>

namespace janitor::engine {

    class FileAnalyzer {
    public:
        FileAnalyzer(const detectors::DetectorRegistry& registry,
                     const analysis::CertaintyClassifier& classifier)
            : registry_(registry), classifier_(classifier) {}

        /**
         * @param file     Workspace-relative path.
         * @param context  Snapshot to analyse against.
         * @param selected Detector names to run; empty runs every detector
         *                 the configuration enables.
         */
        [[nodiscard]] FileAnalysisResult analyze(const std::string& file,
                                                 const analysis::AnalysisContext& context,
                                                 const std::vector<std::string>& selected = {}) const;

    private:
        [[nodiscard]] bool should_run(const detectors::IDetector& detector,
                                      const AnalyzerConfig& config,
                                      const std::vector<std::string>& selected) const;

        const detectors::DetectorRegistry& registry_;
        const analysis::CertaintyClassifier& classifier_;
    };

}  // namespace janitor::engine

#endif //JANITOR_FILE_ANALYZER_HPP
