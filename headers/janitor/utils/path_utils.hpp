//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_PATH_UTILS_HPP
#define JANITOR_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Workspace path helpers.
 *
 * Workspace files are identified by forward-slash paths relative to the
 * workspace root ("src/app/main.ts"). These helpers work on that string
 * form and never touch the file system.
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace janitor::path_utils {

    /**
     * Collapses "." and ".." segments and duplicate separators. Leading ".."
     * segments that cannot be collapsed are kept.
     */
    std::string normalize(std::string_view path);

    /**
     * Everything before the last '/', or "" for a bare file name.
     */
    std::string dirname(std::string_view path);

    /**
     * File name without directory and without its last extension.
     */
    std::string stem(std::string_view path);

    std::string join(std::string_view base, std::string_view relative);

    /**
     * True when @p path equals @p prefix or continues it at a '/' boundary.
     * An empty prefix, or ".", contains every path.
     */
    bool has_path_prefix(std::string_view path, std::string_view prefix);

    /**
     * Glob match supporting '*' (within one segment), '**' (any number of
     * segments) and '?'. A pattern starting with "**\/" also matches at
     * the root.
     */
    bool matches_glob(std::string_view path, std::string_view pattern);

    /**
     * Module specifiers starting with "./" or "../" are workspace relative;
     * everything else names an external package.
     */
    bool is_relative_specifier(std::string_view specifier);

    /**
     * Resolves a relative specifier from @p from_file. Tries the specifier
     * as written, then with each of @p extensions appended, then as a
     * directory index ("<specifier>/index<ext>"). Returns the first candidate
     * @p exists accepts.
     */
    std::optional<std::string> resolve_relative_specifier(
        std::string_view from_file,
        std::string_view specifier,
        const std::vector<std::string>& extensions,
        const std::function<bool(const std::string&)>& exists
    );

}  // namespace janitor::path_utils

#endif //JANITOR_PATH_UTILS_HPP
