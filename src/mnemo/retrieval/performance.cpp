#include "mnemo/retrieval/performance.h"

#include <algorithm>

namespace mnemo {
namespace retrieval {

namespace {

constexpr double kIndexHealthWeight = 0.4;
constexpr double kCacheHealthWeight = 0.3;
constexpr double kSearchHealthWeight = 0.3;

// Searches faster than this count as perfectly healthy
constexpr double kSearchTimeFloor = 0.001;

} // namespace

std::string performance_grade(double average_seconds) {
    if (average_seconds < 0.001) {
        return "A+";
    }
    if (average_seconds < 0.005) {
        return "A";
    }
    if (average_seconds < 0.010) {
        return "B";
    }
    if (average_seconds < 0.050) {
        return "C";
    }
    return "D";
}

HealthReport compute_health(size_t indexed_vectors, size_t memory_count,
                            double cache_hit_rate, double avg_search_seconds) {
    HealthReport health;
    health.vector_index_health = std::min(
        1.0, static_cast<double>(indexed_vectors) / static_cast<double>(std::max<size_t>(1, memory_count)));
    health.cache_health = core::clamp_unit(cache_hit_rate);
    health.search_performance_health = std::min(1.0, 1.0 / std::max(kSearchTimeFloor, avg_search_seconds));

    health.overall = kIndexHealthWeight * health.vector_index_health +
                     kCacheHealthWeight * health.cache_health +
                     kSearchHealthWeight * health.search_performance_health;

    if (health.overall > 0.8) {
        health.status = "excellent";
    } else if (health.overall > 0.6) {
        health.status = "good";
    } else {
        health.status = "fair";
    }
    return health;
}

} // namespace retrieval
} // namespace mnemo
