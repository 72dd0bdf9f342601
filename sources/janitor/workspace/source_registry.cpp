//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/workspace/source_registry.hpp"
#include "janitor/logging.hpp"
#include "janitor/utils/file_utils.hpp"
#include "janitor/utils/hash_utils.hpp"

namespace janitor::workspace {

    Result<std::vector<std::string>, Error> SourceRegistry::scan(const fs::path& root, const AnalyzerConfig& config) {
        auto listed = file_utils::list_files(root, [&config](const std::string& relative) {
            return config.is_source_file(relative) && !config.is_ignored(relative);
        });
        if (listed.is_err()) {
            return Result<std::vector<std::string>, Error>::failure(listed.error());
        }

        std::map<std::string, std::string> hashes;
        std::vector<std::string> files;
        for (const auto& relative : listed.value()) {
            auto hash = hash_utils::sha256_file(root / relative);
            if (hash.is_err()) {
                log::logger()->warn("[scan] skipping {}: {}", relative, hash.error().to_string());
                continue;
            }
            hashes.emplace(relative, std::move(hash).value());
            files.push_back(relative);
        }

        std::lock_guard lock(mutex_);
        hashes_ = std::move(hashes);
        root_ = root;
        return Result<std::vector<std::string>, Error>::success(std::move(files));
    }

    bool SourceRegistry::upsert(const std::string& path, std::string content_hash) {
        std::lock_guard lock(mutex_);
        const auto it = hashes_.find(path);
        if (it != hashes_.end() && it->second == content_hash) {
            return false;
        }
        hashes_.insert_or_assign(path, std::move(content_hash));
        return true;
    }

    bool SourceRegistry::remove(const std::string& path) {
        std::lock_guard lock(mutex_);
        return hashes_.erase(path) > 0;
    }

    Result<bool, Error> SourceRegistry::refresh(const std::string& path) {
        const auto base = root();
        if (!base) {
            return Result<bool, Error>::failure(
                Error::invalid_argument("Registry has no workspace root to read from", path));
        }

        std::error_code ec;
        if (!fs::exists(*base / path, ec)) {
            return Result<bool, Error>::success(remove(path));
        }

        auto hash = hash_utils::sha256_file(*base / path);
        if (hash.is_err()) {
            return Result<bool, Error>::failure(hash.error());
        }
        return Result<bool, Error>::success(upsert(path, std::move(hash).value()));
    }

    std::optional<std::string> SourceRegistry::current_hash(const std::string& path) const {
        std::lock_guard lock(mutex_);
        const auto it = hashes_.find(path);
        if (it == hashes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool SourceRegistry::contains(const std::string& path) const {
        std::lock_guard lock(mutex_);
        return hashes_.contains(path);
    }

    std::vector<std::string> SourceRegistry::files() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(hashes_.size());
        for (const auto& [path, hash] : hashes_) {
            result.push_back(path);
        }
        return result;
    }

    std::vector<SourceUnit> SourceRegistry::units() const {
        std::lock_guard lock(mutex_);
        std::vector<SourceUnit> result;
        result.reserve(hashes_.size());
        for (const auto& [path, hash] : hashes_) {
            result.push_back(SourceUnit{.path = path, .content_hash = hash});
        }
        return result;
    }

    std::size_t SourceRegistry::size() const {
        std::lock_guard lock(mutex_);
        return hashes_.size();
    }

    std::optional<fs::path> SourceRegistry::root() const {
        std::lock_guard lock(mutex_);
        return root_;
    }

}  // namespace janitor::workspace
