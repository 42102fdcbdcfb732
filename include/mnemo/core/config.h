#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mnemo {
namespace core {

/**
 * @brief Outcome of validating a configuration
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        is_valid = false;
        errors.push_back(error);
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    std::string getSummary() const;
};

/**
 * @brief Configuration for a retrieval engine instance
 */
struct RetrievalConfig {
    std::string storage_dir;              // Directory holding both snapshot files
    std::string project_id;               // Collection id, prefixes the file names
    size_t dimension;                     // Embedding dimension
    size_t cache_max_size;                // Semantic cache capacity (entries)
    double cache_ttl_hours;               // Cache entry lifetime since last access
    double cache_similarity_threshold;    // Minimum query similarity for a fuzzy hit
    double min_similarity_default;        // Default cosine floor for searches
    double query_word_weight;             // Jaccard weight in query similarity
    double query_char_weight;             // Character-overlap weight in query similarity
    double rank_similarity_weight;        // Cosine weight when re-ranking hits
    double rank_importance_weight;        // Importance weight when re-ranking hits
    uint32_t metadata_retention_days;     // Idle access records older than this are pruned
    bool persist;                         // Write snapshots on every mutation

    RetrievalConfig()
        : storage_dir(".mnemo/memory"),
          project_id("default"),
          dimension(384),
          cache_max_size(1000),
          cache_ttl_hours(24.0),
          cache_similarity_threshold(0.85),
          min_similarity_default(0.3),
          query_word_weight(0.7),
          query_char_weight(0.3),
          rank_similarity_weight(0.7),
          rank_importance_weight(0.3),
          metadata_retention_days(30),
          persist(true) {}

    static RetrievalConfig Default() { return RetrievalConfig(); }

    /**
     * @brief Configuration suitable for ephemeral, in-memory use
     */
    static RetrievalConfig InMemory() {
        RetrievalConfig config;
        config.persist = false;
        return config;
    }

    ValidationResult validate() const;
};

} // namespace core
} // namespace mnemo
