//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/utils/path_utils.hpp"

#include <vector>

namespace janitor::path_utils {

    namespace {

        std::vector<std::string_view> split_segments(const std::string_view path) {
            std::vector<std::string_view> segments;
            std::size_t start = 0;
            while (start <= path.size()) {
                const auto slash = path.find('/', start);
                const auto end = slash == std::string_view::npos ? path.size() : slash;
                if (end > start) {
                    segments.push_back(path.substr(start, end - start));
                }
                if (slash == std::string_view::npos) {
                    break;
                }
                start = slash + 1;
            }
            return segments;
        }

        bool match_segment(const std::string_view text, const std::string_view pattern) {
            std::size_t t = 0;
            std::size_t p = 0;
            std::size_t star = std::string_view::npos;
            std::size_t resume = 0;

            while (t < text.size()) {
                if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
                    ++t;
                    ++p;
                } else if (p < pattern.size() && pattern[p] == '*') {
                    star = p++;
                    resume = t;
                } else if (star != std::string_view::npos) {
                    p = star + 1;
                    t = ++resume;
                } else {
                    return false;
                }
            }
            while (p < pattern.size() && pattern[p] == '*') {
                ++p;
            }
            return p == pattern.size();
        }

        bool match_segments(const std::vector<std::string_view>& path, std::size_t pi,
                            const std::vector<std::string_view>& pattern, std::size_t gi) {
            while (gi < pattern.size()) {
                if (pattern[gi] == "**") {
                    // collapse runs of "**"
                    while (gi + 1 < pattern.size() && pattern[gi + 1] == "**") {
                        ++gi;
                    }
                    if (gi + 1 == pattern.size()) {
                        return true;
                    }
                    for (std::size_t skip = pi; skip <= path.size(); ++skip) {
                        if (match_segments(path, skip, pattern, gi + 1)) {
                            return true;
                        }
                    }
                    return false;
                }
                if (pi >= path.size() || !match_segment(path[pi], pattern[gi])) {
                    return false;
                }
                ++pi;
                ++gi;
            }
            return pi == path.size();
        }

    }  // namespace

    std::string normalize(const std::string_view path) {
        std::vector<std::string_view> out;
        for (const auto segment : split_segments(path)) {
            if (segment == ".") {
                continue;
            }
            if (segment == "..") {
                if (!out.empty() && out.back() != "..") {
                    out.pop_back();
                } else {
                    out.push_back(segment);
                }
                continue;
            }
            out.push_back(segment);
        }

        std::string result;
        for (const auto segment : out) {
            if (!result.empty()) {
                result += '/';
            }
            result += segment;
        }
        return result;
    }

    std::string dirname(const std::string_view path) {
        const auto slash = path.rfind('/');
        if (slash == std::string_view::npos) {
            return {};
        }
        return std::string(path.substr(0, slash));
    }

    std::string stem(const std::string_view path) {
        const auto slash = path.rfind('/');
        auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
        if (const auto dot = name.rfind('.'); dot != std::string_view::npos && dot > 0) {
            name = name.substr(0, dot);
        }
        return std::string(name);
    }

    std::string join(const std::string_view base, const std::string_view relative) {
        if (base.empty()) {
            return normalize(relative);
        }
        std::string combined(base);
        combined += '/';
        combined += relative;
        return normalize(combined);
    }

    bool has_path_prefix(const std::string_view path, const std::string_view prefix) {
        if (prefix.empty() || prefix == ".") {
            return true;
        }
        std::string_view trimmed = prefix;
        while (!trimmed.empty() && trimmed.back() == '/') {
            trimmed.remove_suffix(1);
        }
        if (!path.starts_with(trimmed)) {
            return false;
        }
        return path.size() == trimmed.size() || path[trimmed.size()] == '/';
    }

    bool matches_glob(const std::string_view path, const std::string_view pattern) {
        return match_segments(split_segments(path), 0, split_segments(pattern), 0);
    }

    bool is_relative_specifier(const std::string_view specifier) {
        return specifier.starts_with("./") || specifier.starts_with("../") ||
               specifier == "." || specifier == "..";
    }

    std::optional<std::string> resolve_relative_specifier(
        const std::string_view from_file,
        const std::string_view specifier,
        const std::vector<std::string>& extensions,
        const std::function<bool(const std::string&)>& exists
    ) {
        if (!is_relative_specifier(specifier)) {
            return std::nullopt;
        }

        const std::string base = join(dirname(from_file), specifier);
        if (base.empty() || base.starts_with("..")) {
            return std::nullopt;
        }

        if (exists(base)) {
            return base;
        }
        for (const auto& ext : extensions) {
            if (auto candidate = base + ext; exists(candidate)) {
                return candidate;
            }
        }
        for (const auto& ext : extensions) {
            if (auto candidate = base + "/index" + ext; exists(candidate)) {
                return candidate;
            }
        }
        return std::nullopt;
    }

}  // namespace janitor::path_utils
