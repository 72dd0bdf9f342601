//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_TYPES_HPP
#define JANITOR_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core value types shared by every stage of the analysis engine.
 *
 * Findings, per-file results, aggregate summaries and change batches.
 * All types here are plain values: copyable, comparable where useful,
 * and free of references into engine state so they can cross thread
 * boundaries and be stored in the result cache.
 */

#include "janitor/error.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace janitor {

    namespace fs = std::filesystem;

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;
    using Duration = std::chrono::milliseconds;

    /**
     * Confidence tier of a finding. Only High findings may carry a safe fix.
     */
    enum class Certainty {
        High,
        Medium,
        Low
    };

    /**
     * Kind tag owned by each detector.
     */
    enum class FindingKind {
        UnusedImport,
        UnusedVariable,
        DeadFunction,
        DeadExport,
        CircularDependency,
        HighComplexity
    };

    [[nodiscard]] std::string_view to_string(Certainty certainty) noexcept;
    [[nodiscard]] std::string_view to_string(FindingKind kind) noexcept;

    [[nodiscard]] std::optional<Certainty> certainty_from_string(std::string_view text) noexcept;
    [[nodiscard]] std::optional<FindingKind> finding_kind_from_string(std::string_view text) noexcept;

    struct SourceLocation {
        std::string file;
        int line = 0;
        int column = 0;
        int end_line = 0;
        int end_column = 0;

        bool operator==(const SourceLocation&) const = default;
    };

    /**
     * A single classified issue.
     *
     * The id is derived from kind, file, symbol and line only, so analysing
     * unchanged input twice reproduces it exactly.
     */
    struct Finding {
        std::string id;
        FindingKind kind = FindingKind::UnusedImport;
        Certainty certainty = Certainty::High;
        std::vector<SourceLocation> locations;
        std::string symbol_name;
        std::string message;
        bool safe_fix_available = false;
        std::vector<std::string> tags;

        [[nodiscard]] const SourceLocation* primary_location() const noexcept {
            return locations.empty() ? nullptr : &locations.front();
        }

        bool operator==(const Finding&) const = default;
    };

    /**
     * Builds "kind:file:symbol:line".
     */
    [[nodiscard]] std::string make_finding_id(FindingKind kind,
                                              std::string_view file,
                                              std::string_view symbol,
                                              int line);

    /**
     * Outcome of analysing one file.
     *
     * A failed file keeps whatever findings the detectors that did succeed
     * produced; @ref error holds the first failure.
     */
    struct FileAnalysisResult {
        std::string file;
        bool success = true;
        std::optional<Error> error;
        std::vector<Finding> findings;
        Duration duration = Duration::zero();
        bool from_cache = false;

        static FileAnalysisResult failed(std::string file, Error error) {
            FileAnalysisResult result;
            result.file = std::move(file);
            result.success = false;
            result.error = std::move(error);
            return result;
        }
    };

    /**
     * Order-independent counts folded over per-file results.
     */
    struct AnalysisSummary {
        std::size_t total_files = 0;
        std::size_t failed_files = 0;
        std::size_t cached_files = 0;
        std::size_t total_issues = 0;
        std::map<std::string, std::size_t> issues_by_type;
        std::map<std::string, std::size_t> issues_by_certainty;
        Duration duration = Duration::zero();

        bool operator==(const AnalysisSummary&) const = default;
    };

    /**
     * Folds per-file results into an AnalysisSummary. The fold only uses
     * sums and keyed counters, so any permutation of @p results gives the
     * same summary.
     */
    [[nodiscard]] AnalysisSummary summarize(const std::vector<FileAnalysisResult>& results);

    struct WorkspaceAnalysisResult {
        std::vector<FileAnalysisResult> file_results;
        AnalysisSummary summary;
    };

    /**
     * Opaque batch of file edits.
     */
    struct ChangeSet {
        std::vector<std::string> files;
        std::string change_id;
        Timestamp timestamp = Clock::now();
    };

    /**
     * A commit as seen by a CI integration: the repository it belongs to
     * and the files it touches.
     */
    struct CommitInfo {
        std::string repository;
        std::string sha;
        std::string branch;
        std::vector<std::string> changed_files;
    };

}  // namespace janitor

#endif //JANITOR_TYPES_HPP
