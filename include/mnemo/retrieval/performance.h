#ifndef MNEMO_RETRIEVAL_PERFORMANCE_H_
#define MNEMO_RETRIEVAL_PERFORMANCE_H_

#include <cstddef>
#include <string>

#include "mnemo/cache/semantic_cache.h"
#include "mnemo/core/types.h"
#include "mnemo/index/vector_index.h"

namespace mnemo {
namespace retrieval {

/**
 * @brief Result of a synthetic search benchmark
 */
struct BenchmarkReport {
    double average_search_time = 0.0;   // seconds, caching disabled
    double average_cache_time = 0.0;    // seconds, caching enabled
    double queries_per_second = 0.0;
    double cache_hit_rate = 0.0;        // over the cached pass only
    double cache_speedup = 0.0;
    size_t total_memories = 0;
    size_t vector_dimension = 0;
    std::string performance_grade;
};

/**
 * @brief Component health scores, each in [0, 1]
 */
struct HealthReport {
    double vector_index_health = 0.0;
    double cache_health = 0.0;
    double search_performance_health = 0.0;
    double overall = 0.0;
    std::string status;   // "excellent", "good" or "fair"
};

struct PerformanceSummary {
    core::RetrievalStats retrieval;
    index::IndexStats index;
    cache::CacheStats cache;
    size_t memory_count = 0;
    uint64_t persistence_failures = 0;
    HealthReport health;
};

// Letter grade for an average search latency in seconds:
// < 1ms A+, < 5ms A, < 10ms B, < 50ms C, else D
std::string performance_grade(double average_seconds);

HealthReport compute_health(size_t indexed_vectors, size_t memory_count,
                            double cache_hit_rate, double avg_search_seconds);

} // namespace retrieval
} // namespace mnemo

#endif // MNEMO_RETRIEVAL_PERFORMANCE_H_
