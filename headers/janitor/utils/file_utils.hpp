//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_FILE_UTILS_HPP
#define JANITOR_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief Reading source files and walking a workspace tree.
 */

#include "janitor/result.hpp"
#include "janitor/error.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

namespace janitor::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Splits text on '\n', dropping a trailing '\r' from each line.
     */
    inline std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }
        return lines;
    }

    /**
     * Recursively lists regular files under @p root whose path relative to
     * @p root (with forward slashes) satisfies @p accept. Unreadable
     * directories are skipped.
     */
    inline Result<std::vector<std::string>, Error> list_files(
        const fs::path& root,
        const std::function<bool(const std::string&)>& accept
    ) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::not_found("Workspace root is not a directory", root.string())
            );
        }

        std::vector<std::string> files;
        auto it = fs::recursive_directory_iterator(
            root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to walk workspace: " + ec.message(), root.string())
            );
        }

        for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                ec.clear();
                continue;
            }
            if (!it->is_regular_file(ec)) {
                continue;
            }
            std::string relative = fs::relative(it->path(), root, ec).generic_string();
            if (ec || relative.empty()) {
                ec.clear();
                continue;
            }
            if (accept(relative)) {
                files.push_back(std::move(relative));
            }
        }

        std::ranges::sort(files);
        return Result<std::vector<std::string>, Error>::success(std::move(files));
    }

}  // namespace janitor::file_utils

#endif //JANITOR_FILE_UTILS_HPP
