#ifndef MNEMO_RETRIEVAL_RETRIEVAL_ENGINE_H_
#define MNEMO_RETRIEVAL_RETRIEVAL_ENGINE_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "mnemo/cache/semantic_cache.h"
#include "mnemo/core/config.h"
#include "mnemo/core/result.h"
#include "mnemo/core/types.h"
#include "mnemo/embedding/embedder.h"
#include "mnemo/index/vector_index.h"
#include "mnemo/retrieval/performance.h"
#include "mnemo/retrieval/snapshot_store.h"

namespace mnemo {
namespace retrieval {

enum class ResultSource {
    CACHE,
    VECTOR_SEARCH
};

std::string to_string(ResultSource source);

struct SearchOptions {
    size_t limit = 10;
    std::optional<core::MemoryCategory> category;
    std::vector<std::string> tags;
    std::optional<double> min_similarity;   // unset: config.min_similarity_default
    bool use_cache = true;
};

struct SearchResponse {
    std::string query;
    core::RankedResults results;
    size_t total_found = 0;
    double processing_time = 0.0;   // seconds
    ResultSource source = ResultSource::VECTOR_SEARCH;
};

struct OptimizeReport {
    size_t expired_cache_entries = 0;
    bool rebuilt = false;
    size_t pruned_access_records = 0;
};

/**
 * @brief Persistent semantic memory store
 *
 * Owns the fragment store, a VectorIndex and a SemanticCache, and writes
 * both snapshot files at the end of every mutating call.
 *
 * Mutations follow validate -> mutate -> persist. Invalid input is
 * rejected before anything changes. A persistence failure is logged and
 * counted but the in-memory mutation still succeeds; rebuild() or
 * optimize_indices() repair any drift between the fragments and the index.
 *
 * Thread-safe: one recursive mutex is held for the duration of each call.
 */
class RetrievalEngine {
public:
    /**
     * @brief Validate config, load the collection and repair drift
     *
     * @param config Engine configuration
     * @param embedder Embedder to use; a FeatureEmbedder of config.dimension
     *        when null. Its dimension must equal config.dimension.
     * @param cache_clock Clock for cache TTL; wall clock when empty
     * @return The engine, or an error for an invalid configuration or an
     *         uncreatable storage directory
     */
    static core::Result<std::unique_ptr<RetrievalEngine>> open(
        const core::RetrievalConfig& config,
        std::shared_ptr<const embedding::IEmbedder> embedder = nullptr,
        cache::SemanticCache::Clock cache_clock = cache::SemanticCache::Clock());

    ~RetrievalEngine();

    RetrievalEngine(const RetrievalEngine&) = delete;
    RetrievalEngine& operator=(const RetrievalEngine&) = delete;

    /**
     * @brief Flush both snapshot files; later calls are no-ops
     */
    void close();

    core::Result<core::MemoryId> add_memory(const std::string& content,
                                            core::MemoryCategory category,
                                            double importance = 0.5,
                                            const core::Tags& tags = core::Tags());

    /**
     * @brief Same as above with the category given by name
     */
    core::Result<core::MemoryId> add_memory(const std::string& content,
                                            const std::string& category,
                                            double importance = 0.5,
                                            const core::Tags& tags = core::Tags());

    SearchResponse search_memories(const std::string& query,
                                   const SearchOptions& options = SearchOptions());

    bool remove_memory(const core::MemoryId& id);

    /**
     * @brief Most important fragments, optionally in one category
     *
     * Results carry similarity 0.
     */
    core::RankedResults get_top_memories(
        size_t limit, std::optional<core::MemoryCategory> category = std::nullopt);

    /**
     * @brief Look up a single fragment; bumps its access counter
     */
    std::optional<core::RankedResult> get_memory(const core::MemoryId& id);

    OptimizeReport optimize_indices();

    /**
     * @brief Re-embed every fragment into a fresh index
     */
    core::Result<void> rebuild();

    core::Result<BenchmarkReport> benchmark_performance(size_t num_queries = 100);

    PerformanceSummary performance_summary() const;

    index::IndexStats index_stats() const;
    cache::CacheStats cache_stats() const;
    core::RetrievalStats retrieval_stats() const;

    size_t size() const;
    uint64_t persistence_failures() const;
    const core::RetrievalConfig& config() const { return config_; }

private:
    RetrievalEngine(const core::RetrievalConfig& config,
                    std::shared_ptr<const embedding::IEmbedder> embedder,
                    cache::SemanticCache::Clock cache_clock);

    core::RetrievalConfig config_;
    std::shared_ptr<const embedding::IEmbedder> embedder_;
    std::unique_ptr<index::VectorIndex> index_;
    std::unique_ptr<cache::SemanticCache> cache_;
    std::unique_ptr<SnapshotStore> store_;   // null when not persisting

    absl::flat_hash_map<core::MemoryId, core::MemoryFragment> fragments_;
    absl::flat_hash_map<core::MemoryId, core::AccessRecord> access_records_;

    core::RetrievalStats stats_;
    uint64_t persistence_failures_ = 0;
    bool closed_ = false;

    mutable std::recursive_mutex mutex_;

    // Helpers below expect mutex_ to be held
    void load();
    size_t rebuild_locked();
    bool index_consistent() const;
    void persist();
    core::RankedResult hydrate(const core::MemoryId& id, double similarity);
    void record_retrieval(double elapsed_seconds);
    std::string cache_scope(const SearchOptions& options, double min_similarity) const;
    core::MemoryId generate_id(const std::string& content) const;
    std::vector<const core::MemoryFragment*> fragments_in_order() const;
};

} // namespace retrieval
} // namespace mnemo

#endif // MNEMO_RETRIEVAL_RETRIEVAL_ENGINE_H_
