//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/engine/file_analyzer.hpp"
#include "janitor/logging.hpp"
#include "janitor/syntax/ignore_directives.hpp"

#include <algorithm>
#include <exception>
#include <memory>

namespace janitor::engine {

    bool FileAnalyzer::should_run(const detectors::IDetector& detector,
                                  const AnalyzerConfig& config,
                                  const std::vector<std::string>& selected) const {
        if (!config.is_detector_enabled(detector.name())) {
            return false;
        }
        return selected.empty() || std::ranges::find(selected, detector.name()) != selected.end();
    }

    FileAnalysisResult FileAnalyzer::analyze(const std::string& file,
                                             const analysis::AnalysisContext& context,
                                             const std::vector<std::string>& selected) const {
        const auto start = Clock::now();

        auto tree = context.tree(file);
        if (!tree) {
            auto parsed = context.provider().parse(file);
            if (parsed.is_err()) {
                auto result = FileAnalysisResult::failed(file, parsed.error());
                result.duration = std::chrono::duration_cast<Duration>(Clock::now() - start);
                return result;
            }
            tree = std::make_shared<const syntax::SyntaxTree>(std::move(parsed).value());
        }

        const auto directives = syntax::IgnoreDirectives::parse(tree->lines);
        const analysis::ClassificationScope scope{
            .workspace = context.references(),
            .directives = &directives,
            .respect_underscore_convention = context.config().respect_underscore_convention,
        };

        FileAnalysisResult result;
        result.file = file;

        for (const auto* detector : registry_.list()) {
            if (!should_run(*detector, context.config(), selected)) {
                continue;
            }

            std::vector<analysis::Candidate> candidates;
            try {
                candidates = detector->analyze(*tree, context);
            } catch (const std::exception& e) {
                log::logger()->warn("[analyze] detector {} failed on {}: {}", detector->name(), file, e.what());
                if (!result.error) {
                    result.success = false;
                    result.error = Error::detector_error(e.what(), std::string(detector->name()));
                }
                continue;
            }

            for (const auto& candidate : candidates) {
                if (auto finding = classifier_.classify(candidate, scope)) {
                    result.findings.push_back(std::move(*finding));
                }
            }
        }

        result.duration = std::chrono::duration_cast<Duration>(Clock::now() - start);
        return result;
    }

}  // namespace janitor::engine
