//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/cache/result_cache.hpp"
#include "janitor/logging.hpp"
#include "janitor/utils/hash_utils.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>

namespace janitor::cache {

    std::optional<CacheEntry> InMemoryCacheStore::load(const std::string& key) const {
        std::lock_guard lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void InMemoryCacheStore::store(CacheEntry entry) {
        std::lock_guard lock(mutex_);
        auto key = entry.key;
        entries_.insert_or_assign(std::move(key), std::move(entry));
    }

    bool InMemoryCacheStore::erase(const std::string& key) {
        std::lock_guard lock(mutex_);
        return entries_.erase(key) > 0;
    }

    std::vector<std::string> InMemoryCacheStore::keys() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& key : entries_ | std::views::keys) {
            result.push_back(key);
        }
        return result;
    }

    void InMemoryCacheStore::clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

    std::size_t InMemoryCacheStore::size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    ResultCache::ResultCache(HashLookup current_hash, const Duration ttl, std::unique_ptr<CacheStore> store)
        : current_hash_(std::move(current_hash)), ttl_(ttl), store_(std::move(store)) {
        if (!current_hash_) {
            throw std::invalid_argument("ResultCache requires a hash lookup");
        }
        if (!store_) {
            store_ = std::make_unique<InMemoryCacheStore>();
        }
    }

    std::string ResultCache::make_key(const std::string_view scope, const FileHashes& file_hashes) {
        // FileHashes is ordered, so the pairs are already sorted by path
        std::string material(scope);
        material.push_back('\n');
        for (const auto& [file, hash] : file_hashes) {
            material += file;
            material.push_back(':');
            material += hash;
            material.push_back('\n');
        }
        return hash_utils::sha256(material);
    }

    bool ResultCache::is_fresh(const CacheEntry& entry, const Timestamp now) const {
        if (!(now < entry.expires_at)) {
            return false;
        }
        return std::ranges::all_of(entry.file_hashes, [this](const auto& pair) {
            const auto current = current_hash_(pair.first);
            return current.has_value() && *current == pair.second;
        });
    }

    std::optional<std::vector<FileAnalysisResult>> ResultCache::get(const std::string& key) {
        auto entry = store_->load(key);
        const bool fresh = entry.has_value() && is_fresh(*entry, Clock::now());

        std::lock_guard lock(mutex_);
        if (!fresh) {
            if (entry) {
                store_->erase(key);
                log::logger()->debug("[cache] evicted stale entry {}", key.substr(0, 12));
            }
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        return std::move(entry->results);
    }

    void ResultCache::set(const std::string& key, std::vector<FileAnalysisResult> results, FileHashes file_hashes) {
        const auto now = Clock::now();
        store_->store(CacheEntry{
            .key = key,
            .results = std::move(results),
            .file_hashes = std::move(file_hashes),
            .created_at = now,
            .expires_at = now + ttl_,
        });
    }

    void ResultCache::set(const std::string& key, std::vector<FileAnalysisResult> results,
                          const std::vector<std::string>& files) {
        FileHashes hashes;
        for (const auto& file : files) {
            hashes[file] = current_hash_(file).value_or(std::string{});
        }
        set(key, std::move(results), std::move(hashes));
    }

    std::size_t ResultCache::invalidate(const std::vector<std::string>& paths) {
        std::size_t removed = 0;
        for (const auto& key : store_->keys()) {
            const auto entry = store_->load(key);
            if (!entry) {
                continue;
            }
            const bool touched = std::ranges::any_of(paths, [&entry](const std::string& path) {
                return entry->file_hashes.contains(path);
            });
            if (touched && store_->erase(key)) {
                ++removed;
            }
        }
        return removed;
    }

    CacheStats ResultCache::stats() const {
        std::lock_guard lock(mutex_);
        CacheStats stats;
        stats.hits = hits_;
        stats.misses = misses_;
        const auto lookups = hits_ + misses_;
        stats.hit_rate = lookups == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(lookups);
        stats.total_entries = store_->size();
        return stats;
    }

    void ResultCache::clear() {
        std::lock_guard lock(mutex_);
        store_->clear();
        hits_ = 0;
        misses_ = 0;
    }

}  // namespace janitor::cache
