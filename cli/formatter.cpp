//
// Created by gregorian-rayne on 02/03/26.
//

#include "formatter.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace janitor::cli {

    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
#ifdef _WIN32
        return _isatty(_fileno(stdout)) != 0;
#else
        return isatty(fileno(stdout)) != 0;
#endif
    }

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    namespace {

        int rank(const Certainty certainty) {
            switch (certainty) {
                case Certainty::High:   return 2;
                case Certainty::Medium: return 1;
                case Certainty::Low:    return 0;
            }
            return 0;
        }

        std::string paint(const std::string& text, const char* color) {
            if (!colors::enabled()) {
                return text;
            }
            return std::string(color) + text + colors::RESET;
        }

    }  // namespace

    std::string colorize_certainty(const Certainty certainty) {
        const std::string text(to_string(certainty));
        switch (certainty) {
            case Certainty::High:   return paint(text, colors::RED);
            case Certainty::Medium: return paint(text, colors::YELLOW);
            case Certainty::Low:    return paint(text, colors::DIM);
        }
        return text;
    }

    std::string format_finding(const Finding& finding) {
        std::ostringstream ss;
        if (const auto* location = finding.primary_location()) {
            ss << location->file << ":" << location->line << ":" << location->column;
        }
        ss << "  " << colorize_certainty(finding.certainty)
           << "  " << paint(std::string(to_string(finding.kind)), colors::CYAN)
           << "  " << finding.message;
        if (finding.safe_fix_available) {
            ss << " " << paint("[fixable]", colors::GREEN);
        }
        return ss.str();
    }

    std::string format_duration(const Duration d) {
        const auto ms = d.count();
        std::ostringstream ss;
        if (ms < 1000) {
            ss << ms << " ms";
        } else {
            ss << std::fixed << std::setprecision(2) << static_cast<double>(ms) / 1000.0 << " s";
        }
        return ss.str();
    }

    void print_file_results(std::ostream& out, const std::vector<FileAnalysisResult>& results,
                            const Certainty min_certainty) {
        for (const auto& result : results) {
            if (!result.success) {
                out << paint(result.file + ": analysis failed", colors::RED);
                if (result.error) {
                    out << " " << result.error->to_string();
                }
                out << "\n";
            }
            for (const auto& finding : result.findings) {
                if (rank(finding.certainty) >= rank(min_certainty)) {
                    out << format_finding(finding) << "\n";
                }
            }
        }
    }

    void print_summary(std::ostream& out, const AnalysisSummary& summary) {
        out << "\n" << paint("Summary", colors::BOLD) << "\n";
        out << "  Files:    " << summary.total_files;
        if (summary.cached_files > 0) {
            out << " (" << summary.cached_files << " from cache)";
        }
        out << "\n";
        if (summary.failed_files > 0) {
            out << "  Failed:   " << paint(std::to_string(summary.failed_files), colors::RED) << "\n";
        }
        out << "  Issues:   " << summary.total_issues << "\n";
        for (const auto& [kind, count] : summary.issues_by_type) {
            out << "    " << std::left << std::setw(22) << kind << count << "\n";
        }
        for (const auto& [certainty, count] : summary.issues_by_certainty) {
            out << "    " << std::left << std::setw(22) << certainty << count << "\n";
        }
        out << "  Duration: " << format_duration(summary.duration) << "\n";
    }

    void print_affected(std::ostream& out, const scope::AffectedSet& affected) {
        out << paint("Affected modules", colors::BOLD) << " (" << affected.all_affected.size() << ")\n";
        for (const auto& module : affected.directly_affected) {
            out << "  * " << module << "\n";
        }
        for (const auto& module : affected.indirectly_affected) {
            out << "    " << module;
            if (const auto it = affected.chains.find(module); it != affected.chains.end()) {
                out << paint("  via ", colors::DIM);
                for (std::size_t i = 0; i < it->second.size(); ++i) {
                    out << (i == 0 ? "" : " -> ") << it->second[i];
                }
            }
            out << "\n";
        }
        for (const auto& file : affected.unowned_files) {
            out << paint("  ? " + file + " (no owning module)", colors::YELLOW) << "\n";
        }
    }

}  // namespace janitor::cli
