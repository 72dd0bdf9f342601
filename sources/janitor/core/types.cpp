//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/types.hpp"

namespace janitor {

    std::string_view to_string(const Certainty certainty) noexcept {
        switch (certainty) {
            case Certainty::High:   return "high";
            case Certainty::Medium: return "medium";
            case Certainty::Low:    return "low";
        }
        return "unknown";
    }

    std::string_view to_string(const FindingKind kind) noexcept {
        switch (kind) {
            case FindingKind::UnusedImport:       return "unused-import";
            case FindingKind::UnusedVariable:     return "unused-variable";
            case FindingKind::DeadFunction:       return "dead-function";
            case FindingKind::DeadExport:         return "dead-export";
            case FindingKind::CircularDependency: return "circular-dependency";
            case FindingKind::HighComplexity:     return "high-complexity";
        }
        return "unknown";
    }

    std::optional<Certainty> certainty_from_string(const std::string_view text) noexcept {
        if (text == "high") return Certainty::High;
        if (text == "medium") return Certainty::Medium;
        if (text == "low") return Certainty::Low;
        return std::nullopt;
    }

    std::optional<FindingKind> finding_kind_from_string(const std::string_view text) noexcept {
        if (text == "unused-import") return FindingKind::UnusedImport;
        if (text == "unused-variable") return FindingKind::UnusedVariable;
        if (text == "dead-function") return FindingKind::DeadFunction;
        if (text == "dead-export") return FindingKind::DeadExport;
        if (text == "circular-dependency") return FindingKind::CircularDependency;
        if (text == "high-complexity") return FindingKind::HighComplexity;
        return std::nullopt;
    }

    std::string make_finding_id(const FindingKind kind,
                                const std::string_view file,
                                const std::string_view symbol,
                                const int line) {
        std::string id(to_string(kind));
        id += ':';
        id += file;
        id += ':';
        id += symbol;
        id += ':';
        id += std::to_string(line);
        return id;
    }

    AnalysisSummary summarize(const std::vector<FileAnalysisResult>& results) {
        AnalysisSummary summary;
        summary.total_files = results.size();

        for (const auto& result : results) {
            if (!result.success) {
                ++summary.failed_files;
            }
            if (result.from_cache) {
                ++summary.cached_files;
            }
            summary.total_issues += result.findings.size();
            summary.duration += result.duration;

            for (const auto& finding : result.findings) {
                ++summary.issues_by_type[std::string(to_string(finding.kind))];
                ++summary.issues_by_certainty[std::string(to_string(finding.certainty))];
            }
        }

        return summary;
    }

}  // namespace janitor
