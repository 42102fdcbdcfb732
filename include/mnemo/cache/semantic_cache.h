#pragma once

#include "mnemo/core/types.h"
#include "mnemo/core/error.h"
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mnemo {
namespace cache {

/**
 * @brief Weights for the query-to-query similarity used on fuzzy lookups
 */
struct QuerySimilarityWeights {
    double word_weight = 0.7;   // Jaccard over lower-cased whitespace tokens
    double char_weight = 0.3;   // Shared character multiset / longer length
};

/**
 * @brief Similarity between two query strings, in [0, 1]
 *
 * Symmetric. Returns 0 when either side is empty or has no tokens and
 * exactly 1.0 for identical strings.
 */
double query_similarity(const std::string& a, const std::string& b,
                        const QuerySimilarityWeights& weights = QuerySimilarityWeights());

/**
 * @brief Normalized form used for exact-match keys (trimmed, lower-cased)
 */
std::string normalize_query(const std::string& query);

/**
 * @brief Hex FNV-1a 64 of the normalized query plus its scope
 */
std::string hash_query(const std::string& query, const std::string& scope = "");

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t total_queries = 0;   // successful puts
    double hit_rate = 0.0;        // hits / max(1, hits + misses)
    size_t cache_size = 0;
    size_t max_size = 0;
};

/**
 * @brief Bounded, time-boxed LRU cache of ranked search results
 *
 * A lookup first tries the exact normalized query, then scans live entries
 * (least recently used first) for one whose query text is similar enough.
 * Entries expire ttl after their last access, or after creation when never
 * read. The owner clears the cache whenever the underlying fragment set
 * changes, so cached results are never stale relative to the index.
 *
 * Entries carry a scope string (the engine encodes search filters there);
 * lookups only ever match entries of the same scope.
 */
class SemanticCache {
public:
    using Clock = std::function<core::Timestamp()>;

    /**
     * @param max_size Maximum number of entries
     * @param ttl_hours Entry lifetime since last access
     * @throws core::InvalidArgumentError if max_size is 0 or ttl is not positive
     */
    explicit SemanticCache(size_t max_size = 1000, double ttl_hours = 24.0,
                           QuerySimilarityWeights weights = QuerySimilarityWeights(),
                           Clock clock = Clock());
    ~SemanticCache() = default;

    SemanticCache(const SemanticCache&) = delete;
    SemanticCache& operator=(const SemanticCache&) = delete;
    SemanticCache(SemanticCache&&) = delete;
    SemanticCache& operator=(SemanticCache&&) = delete;

    std::optional<core::RankedResults> get(const std::string& query,
                                           double similarity_threshold = 0.85,
                                           const std::string& scope = "");

    void put(const std::string& query, core::RankedResults results,
             const std::string& scope = "");

    /**
     * @brief Drop expired entries
     * @return Number of entries removed
     */
    size_t clear_expired();

    void clear();

    size_t size() const;
    size_t max_size() const;
    double ttl_hours() const;
    CacheStats stats() const;
    void reset_stats();

    /**
     * @brief Query text of the least recently used entry, if any
     */
    std::optional<std::string> lru_query() const;

private:
    struct CacheEntry {
        std::string query_hash;
        std::string query_text;
        std::string scope;
        core::RankedResults results;
        core::Timestamp created_at = 0;
        core::Timestamp last_access = 0;   // 0 = never read
        uint64_t access_count = 0;
    };

    // Front is most recently used
    using LRUList = std::list<CacheEntry>;
    using LRUIterator = LRUList::iterator;
    using CacheMap = std::unordered_map<std::string, LRUIterator>;

    mutable std::recursive_mutex mutex_;
    size_t max_size_;
    double ttl_hours_;
    QuerySimilarityWeights weights_;
    Clock clock_;
    LRUList lru_list_;
    CacheMap cache_map_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t total_queries_ = 0;

    // Helpers below expect mutex_ to be held
    bool is_expired(const CacheEntry& entry, core::Timestamp now) const;
    core::RankedResults touch(LRUIterator it, core::Timestamp now);
    void erase(LRUIterator it);
    void evict_lru();
};

} // namespace cache
} // namespace mnemo
