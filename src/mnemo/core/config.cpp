#include "mnemo/core/config.h"

#include <cmath>
#include <sstream>

namespace mnemo {
namespace core {

namespace {

bool is_unit_interval(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

bool is_valid_weight_pair(double a, double b) {
    return std::isfinite(a) && std::isfinite(b) && a >= 0.0 && b >= 0.0 && (a + b) > 0.0;
}

} // namespace

std::string ValidationResult::getSummary() const {
    std::ostringstream oss;
    oss << "Validation " << (is_valid ? "PASSED" : "FAILED");
    if (!errors.empty()) {
        oss << " (" << errors.size() << " errors";
        if (!warnings.empty()) {
            oss << ", " << warnings.size() << " warnings";
        }
        oss << ")";
        for (const auto& error : errors) {
            oss << "\n  error: " << error;
        }
    } else if (!warnings.empty()) {
        oss << " (" << warnings.size() << " warnings)";
    }
    for (const auto& warning : warnings) {
        oss << "\n  warning: " << warning;
    }
    return oss.str();
}

ValidationResult RetrievalConfig::validate() const {
    ValidationResult result;

    if (project_id.empty()) {
        result.addError("project_id must not be empty");
    } else if (project_id.find('/') != std::string::npos || project_id.find('\\') != std::string::npos) {
        result.addError("project_id must not contain path separators");
    }
    if (persist && storage_dir.empty()) {
        result.addError("storage_dir is required when persistence is enabled");
    }
    if (dimension == 0) {
        result.addError("dimension must be greater than 0");
    } else if (dimension < 38) {
        result.addWarning("dimension below 38 drops the length and keyword features");
    }
    if (cache_max_size == 0) {
        result.addError("cache_max_size must be greater than 0");
    }
    if (!std::isfinite(cache_ttl_hours) || cache_ttl_hours <= 0.0) {
        result.addError("cache_ttl_hours must be positive");
    }
    if (!is_unit_interval(cache_similarity_threshold)) {
        result.addError("cache_similarity_threshold must be within [0, 1]");
    }
    if (!is_unit_interval(min_similarity_default)) {
        result.addError("min_similarity_default must be within [0, 1]");
    }
    if (!is_valid_weight_pair(query_word_weight, query_char_weight)) {
        result.addError("query similarity weights must be non-negative and not both zero");
    }
    if (!is_valid_weight_pair(rank_similarity_weight, rank_importance_weight)) {
        result.addError("ranking weights must be non-negative and not both zero");
    }
    if (metadata_retention_days == 0) {
        result.addWarning("metadata_retention_days of 0 prunes every idle access record");
    }

    return result;
}

} // namespace core
} // namespace mnemo
