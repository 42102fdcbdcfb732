#ifndef MNEMO_INDEX_VECTOR_INDEX_H_
#define MNEMO_INDEX_VECTOR_INDEX_H_

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "mnemo/core/types.h"
#include "mnemo/embedding/embedder.h"

namespace mnemo {
namespace index {

/**
 * @brief Snapshot of index counters
 */
struct IndexStats {
    size_t total_vectors = 0;
    size_t categories = 0;          // categories with at least one entry
    size_t tags = 0;                // distinct tags with at least one entry
    size_t dimension = 0;
    uint64_t search_count = 0;
    double avg_search_time = 0.0;   // seconds
    uint64_t index_updates = 0;
};

/**
 * @brief Optional restrictions applied before similarity scoring
 */
struct SearchFilter {
    std::optional<core::MemoryCategory> category;
    std::vector<std::string> tags;   // any-of; empty means no tag filter
};

using ScoredIds = std::vector<std::pair<core::MemoryId, double>>;

/**
 * @brief Text to embed in a batch insert
 */
struct IndexDocument {
    core::MemoryId id;
    std::string text;
    core::MemoryCategory category = core::MemoryCategory::CONTEXT;
    double importance = 0.0;
    core::Tags tags;
    core::Timestamp created_at = 0;
};

/**
 * @brief In-memory embedding index with category, tag and importance lookups
 *
 * Primary storage maps a memory id to its IndexEntry. Three secondary
 * structures are kept in step with it:
 *   - category -> ids
 *   - tag -> ids
 *   - ids ordered by importance (descending, insertion order on ties)
 *
 * Every public call holds one recursive mutex for its whole duration, so a
 * search never observes a half-applied insert or remove.
 */
class VectorIndex {
public:
    explicit VectorIndex(std::shared_ptr<const embedding::IEmbedder> embedder);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /**
     * @brief Embed text and store it under id
     *
     * Re-inserting an existing id overwrites it in place and keeps its
     * original insertion position. Returns false only if the embedder
     * throws or returns a vector of the wrong dimension.
     */
    bool insert(const core::MemoryId& id, const std::string& text,
                core::MemoryCategory category, double importance,
                const core::Tags& tags, core::Timestamp created_at = 0);

    /**
     * @brief Store a precomputed entry (snapshot restore)
     *
     * The entry's sequence is reassigned. Returns false when the vector
     * dimension does not match.
     */
    bool insert_vector(core::IndexEntry entry);

    /**
     * @brief Embed and store many documents, in order
     *
     * Equivalent to calling insert() for each document, but the importance
     * ordering is rebuilt once at the end. Returns the number of documents
     * that could not be embedded.
     */
    size_t insert_batch(const std::vector<IndexDocument>& documents);

    /**
     * @brief Store many precomputed entries, in order
     *
     * Batch form of insert_vector(). Returns the number of entries rejected
     * for a wrong dimension.
     */
    size_t restore(std::vector<core::IndexEntry> entries);

    /**
     * @brief Cosine-similarity search over the filtered candidate set
     *
     * Candidates: category ∩ (∪ tags) when both filters are set, ∪ tags
     * when only tags are set, the category bucket when only a category is
     * set, else every entry. Results have similarity >= min_similarity,
     * sorted descending with insertion order breaking ties, at most limit.
     */
    ScoredIds search(const std::string& query_text, size_t limit,
                     const SearchFilter& filter = SearchFilter(),
                     double min_similarity = 0.0);

    /**
     * @brief Ids by descending importance, optionally in one category
     */
    std::vector<core::MemoryId> top_important(
        size_t limit, std::optional<core::MemoryCategory> category = std::nullopt) const;

    bool remove(const core::MemoryId& id);
    bool contains(const core::MemoryId& id) const;
    std::optional<core::IndexEntry> entry(const core::MemoryId& id) const;

    // All entries in insertion order
    std::vector<core::IndexEntry> entries() const;

    void clear();
    size_t size() const;
    size_t dimension() const;
    IndexStats stats() const;

private:
    using IdSet = std::set<core::MemoryId>;

    std::shared_ptr<const embedding::IEmbedder> embedder_;
    size_t dimension_;

    absl::flat_hash_map<core::MemoryId, core::IndexEntry> entries_;
    std::map<core::MemoryCategory, IdSet> category_ids_;
    std::map<std::string, IdSet> tag_ids_;
    std::vector<core::MemoryId> importance_order_;

    uint64_t next_sequence_ = 0;
    uint64_t search_count_ = 0;
    double total_search_time_ = 0.0;
    uint64_t index_updates_ = 0;

    mutable std::recursive_mutex mutex_;

    // Helpers below expect mutex_ to be held
    std::optional<core::IndexEntry> embed_entry(const IndexDocument& document) const;
    void store_entry(core::IndexEntry entry, bool keep_order = true);
    void unlink_secondary(const core::IndexEntry& entry);
    void place_by_importance(const core::MemoryId& id);
    void resort_importance();
    IdSet candidate_ids(const SearchFilter& filter) const;
};

} // namespace index
} // namespace mnemo

#endif // MNEMO_INDEX_VECTOR_INDEX_H_
