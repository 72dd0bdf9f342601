//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_RESULT_CACHE_HPP
#define JANITOR_RESULT_CACHE_HPP

/**
 * @file result_cache.hpp
 * @brief Content-addressed cache of analysis results.
 *
 * An entry remembers the hash of every file its result depends on. It is
 * served only while it has not expired and every one of those files still
 * has the same hash; otherwise get() evicts it and reports a miss.
 * Storage is pluggable through CacheStore; the default keeps entries in
 * memory for the lifetime of the process.
 */

#include "janitor/types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace janitor::cache {

    /// file -> content hash
    using FileHashes = std::map<std::string, std::string>;

    struct CacheEntry {
        std::string key;
        std::vector<FileAnalysisResult> results;
        FileHashes file_hashes;
        Timestamp created_at;
        Timestamp expires_at;
    };

    struct CacheStats {
        std::size_t hits = 0;
        std::size_t misses = 0;
        double hit_rate = 0.0;
        std::size_t total_entries = 0;
    };

    /**
     * Backing store for cache entries. Implementations must be safe to call
     * from several threads.
     */
    class CacheStore {
    public:
        virtual ~CacheStore() = default;

        [[nodiscard]] virtual std::optional<CacheEntry> load(const std::string& key) const = 0;
        virtual void store(CacheEntry entry) = 0;
        virtual bool erase(const std::string& key) = 0;
        [[nodiscard]] virtual std::vector<std::string> keys() const = 0;
        virtual void clear() = 0;
        [[nodiscard]] virtual std::size_t size() const = 0;
    };

    class InMemoryCacheStore final : public CacheStore {
    public:
        [[nodiscard]] std::optional<CacheEntry> load(const std::string& key) const override;
        void store(CacheEntry entry) override;
        bool erase(const std::string& key) override;
        [[nodiscard]] std::vector<std::string> keys() const override;
        void clear() override;
        [[nodiscard]] std::size_t size() const override;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, CacheEntry> entries_;
    };

    class ResultCache {
    public:
        /// Current content hash of a file, or nullopt when the file is gone.
        using HashLookup = std::function<std::optional<std::string>(const std::string&)>;

        explicit ResultCache(HashLookup current_hash,
                             Duration ttl = std::chrono::hours(24),
                             std::unique_ptr<CacheStore> store = nullptr);

        /**
         * SHA-256 over the scope identifier and the sorted file:hash pairs.
         * Any content change in the file set produces a different key.
         */
        [[nodiscard]] static std::string make_key(std::string_view scope, const FileHashes& file_hashes);

        /**
         * The stored results for @p key. Expired or stale entries are
         * evicted; both count as misses.
         */
        [[nodiscard]] std::optional<std::vector<FileAnalysisResult>> get(const std::string& key);

        void set(const std::string& key, std::vector<FileAnalysisResult> results, FileHashes file_hashes);

        /**
         * Stores @p results against the current hashes of @p files.
         */
        void set(const std::string& key, std::vector<FileAnalysisResult> results,
                 const std::vector<std::string>& files);

        /**
         * Removes every entry that depends on one of @p paths.
         *
         * @return Number of entries removed.
         */
        std::size_t invalidate(const std::vector<std::string>& paths);

        [[nodiscard]] CacheStats stats() const;

        /// Drops every entry and resets the counters.
        void clear();

        [[nodiscard]] Duration ttl() const noexcept { return ttl_; }

    private:
        [[nodiscard]] bool is_fresh(const CacheEntry& entry, Timestamp now) const;

        HashLookup current_hash_;
        Duration ttl_;
        std::unique_ptr<CacheStore> store_;

        mutable std::mutex mutex_;
        std::size_t hits_ = 0;
        std::size_t misses_ = 0;
    };

}  // namespace janitor::cache

#endif //JANITOR_RESULT_CACHE_HPP
