//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_SOURCE_REGISTRY_HPP
#define JANITOR_SOURCE_REGISTRY_HPP

/**
 * @file source_registry.hpp
 * @brief The set of source units of a workspace and their content hashes.
 */

#include "janitor/config.hpp"
#include "janitor/error.hpp"
#include "janitor/result.hpp"
#include "janitor/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace janitor::workspace {

    struct SourceUnit {
        std::string path;
        std::string content_hash;
    };

    class SourceRegistry {
    public:
        /**
         * Replaces the registry with every source file under @p root that
         * @p config does not ignore.
         *
         * @return The discovered paths, sorted.
         */
        Result<std::vector<std::string>, Error> scan(const fs::path& root, const AnalyzerConfig& config);

        /**
         * Registers or updates a unit.
         *
         * @return true if the unit is new or its hash changed.
         */
        bool upsert(const std::string& path, std::string content_hash);

        bool remove(const std::string& path);

        /**
         * Re-hashes @p path from disk. A file that no longer exists is
         * removed.
         *
         * @return true if the unit changed (including removal).
         */
        Result<bool, Error> refresh(const std::string& path);

        [[nodiscard]] std::optional<std::string> current_hash(const std::string& path) const;
        [[nodiscard]] bool contains(const std::string& path) const;
        [[nodiscard]] std::vector<std::string> files() const;
        [[nodiscard]] std::vector<SourceUnit> units() const;
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] std::optional<fs::path> root() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::string> hashes_;
        std::optional<fs::path> root_;
    };

}  // namespace janitor::workspace

#endif //JANITOR_SOURCE_REGISTRY_HPP
