#ifndef MNEMO_CORE_TYPES_H_
#define MNEMO_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mnemo {
namespace core {

using Timestamp = int64_t;     // Unix epoch milliseconds
using MemoryId = std::string;
using Vector = std::vector<float>;
using Tags = std::set<std::string>;

/**
 * @brief Kind of knowledge a memory fragment records
 */
enum class MemoryCategory {
    REQUIREMENT,
    DECISION,
    PATTERN,
    ISSUE,
    LEARNING,
    CONTEXT
};

const std::vector<MemoryCategory>& all_categories();
std::string to_string(MemoryCategory category);
std::optional<MemoryCategory> parse_category(const std::string& name);

/**
 * @brief A stored unit of text with its classification metadata
 *
 * Immutable once created; changing any field means remove + re-add.
 */
struct MemoryFragment {
    MemoryId id;
    std::string content;
    MemoryCategory category = MemoryCategory::CONTEXT;
    double importance = 0.5;
    Tags tags;
    Timestamp created_at = 0;
    std::string project_id;
};

/**
 * @brief Per-fragment access bookkeeping
 */
struct AccessRecord {
    uint64_t access_count = 0;
    Timestamp last_access = 0;   // 0 = never accessed
    Timestamp creation_time = 0;

    void record_access(Timestamp now) {
        ++access_count;
        last_access = now;
    }
};

/**
 * @brief Embedded representation of one fragment inside the vector index
 */
struct IndexEntry {
    MemoryId id;
    Vector vector;
    MemoryCategory category = MemoryCategory::CONTEXT;
    double importance = 0.0;
    Tags tags;
    Timestamp created_at = 0;
    uint64_t sequence = 0;   // insertion ordinal, breaks ranking ties
};

/**
 * @brief A hydrated search hit
 */
struct RankedResult {
    MemoryId id;
    std::string content;
    MemoryCategory category = MemoryCategory::CONTEXT;
    double importance = 0.0;
    double similarity = 0.0;
    Tags tags;
    Timestamp created_at = 0;
    uint64_t access_count = 0;

    bool operator==(const RankedResult& other) const {
        return id == other.id && content == other.content &&
               category == other.category && importance == other.importance &&
               similarity == other.similarity && tags == other.tags &&
               created_at == other.created_at && access_count == other.access_count;
    }
};

using RankedResults = std::vector<RankedResult>;

/**
 * @brief Engine-level retrieval counters, persisted with the fragments
 */
struct RetrievalStats {
    uint64_t total_retrievals = 0;
    uint64_t cache_hits = 0;
    uint64_t vector_searches = 0;
    double average_retrieval_time = 0.0;   // seconds
    uint64_t total_memories = 0;
};

// Time helpers
Timestamp now_ms();
std::string format_iso8601(Timestamp ts);
std::optional<Timestamp> parse_iso8601(const std::string& text);

// Clamp into [0, 1]; NaN maps to 0
double clamp_unit(double value);

} // namespace core
} // namespace mnemo

#endif // MNEMO_CORE_TYPES_H_
