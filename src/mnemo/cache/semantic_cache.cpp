/**
 * @file semantic_cache.cpp
 * @brief LRU + TTL cache of ranked search results with fuzzy query matching
 *
 * Implementation Details:
 * - std::list keeps LRU order (front = most recent), splice on every hit
 * - std::unordered_map from query hash to list iterator for exact lookups
 * - Fuzzy lookups are a linear scan over live entries; the cache is small
 *   and cleared on every write, so the scan stays cheap
 */

#include "mnemo/cache/semantic_cache.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <set>
#include <vector>

namespace mnemo {
namespace cache {

namespace {

constexpr double kMillisPerHour = 3600.0 * 1000.0;

std::string to_lower_ascii(const std::string& s) {
    std::string out(s);
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            ch = static_cast<char>(std::tolower(c));
        }
    }
    return out;
}

std::set<std::string> tokenize(const std::string& lowered) {
    std::set<std::string> tokens;
    std::string current;
    for (char ch : lowered) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!current.empty()) {
                tokens.insert(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        tokens.insert(current);
    }
    return tokens;
}

double char_overlap(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    size_t counts_a[256] = {0};
    size_t counts_b[256] = {0};
    for (unsigned char c : a) ++counts_a[c];
    for (unsigned char c : b) ++counts_b[c];

    size_t common = 0;
    for (size_t i = 0; i < 256; ++i) {
        common += std::min(counts_a[i], counts_b[i]);
    }
    return static_cast<double>(common) / static_cast<double>(std::max(a.size(), b.size()));
}

} // namespace

double query_similarity(const std::string& a, const std::string& b,
                        const QuerySimilarityWeights& weights) {
    std::string la = to_lower_ascii(a);
    std::string lb = to_lower_ascii(b);

    auto words_a = tokenize(la);
    auto words_b = tokenize(lb);
    if (words_a.empty() || words_b.empty()) {
        return 0.0;
    }

    size_t intersection = 0;
    for (const auto& w : words_a) {
        if (words_b.count(w)) {
            ++intersection;
        }
    }
    size_t union_size = words_a.size() + words_b.size() - intersection;
    double word_similarity = static_cast<double>(intersection) / static_cast<double>(union_size);
    double char_similarity = char_overlap(la, lb);

    double total_weight = weights.word_weight + weights.char_weight;
    if (total_weight <= 0.0) {
        return 0.0;
    }
    double combined = (weights.word_weight * word_similarity +
                       weights.char_weight * char_similarity) / total_weight;
    return core::clamp_unit(combined);
}

std::string normalize_query(const std::string& query) {
    size_t begin = 0;
    size_t end = query.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(query[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(query[end - 1]))) --end;
    return to_lower_ascii(query.substr(begin, end - begin));
}

std::string hash_query(const std::string& query, const std::string& scope) {
    uint64_t hash = 1469598103934665603ULL;
    auto mix = [&hash](const std::string& s) {
        for (unsigned char c : s) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
    };
    mix(normalize_query(query));
    if (!scope.empty()) {
        mix(std::string(1, '\x1f'));
        mix(scope);
    }

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

SemanticCache::SemanticCache(size_t max_size, double ttl_hours,
                             QuerySimilarityWeights weights, Clock clock)
    : max_size_(max_size),
      ttl_hours_(ttl_hours),
      weights_(weights),
      clock_(clock ? std::move(clock) : Clock(&core::now_ms)) {
    if (max_size == 0) {
        throw core::InvalidArgumentError("Cache max size must be greater than 0");
    }
    if (!std::isfinite(ttl_hours) || ttl_hours <= 0.0) {
        throw core::InvalidArgumentError("Cache TTL must be positive");
    }
}

std::optional<core::RankedResults> SemanticCache::get(const std::string& query,
                                                      double similarity_threshold,
                                                      const std::string& scope) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    core::Timestamp now = clock_();

    auto it = cache_map_.find(hash_query(query, scope));
    if (it != cache_map_.end()) {
        if (!is_expired(*it->second, now)) {
            ++hits_;
            return touch(it->second, now);
        }
        erase(it->second);
    }

    // Fuzzy match, least recently used first
    for (auto rit = lru_list_.rbegin(); rit != lru_list_.rend(); ++rit) {
        if (rit->scope != scope || is_expired(*rit, now)) {
            continue;
        }
        if (query_similarity(query, rit->query_text, weights_) >= similarity_threshold) {
            ++hits_;
            return touch(std::prev(rit.base()), now);
        }
    }

    ++misses_;
    return std::nullopt;
}

void SemanticCache::put(const std::string& query, core::RankedResults results,
                        const std::string& scope) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    core::Timestamp now = clock_();
    std::string key = hash_query(query, scope);

    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        auto& entry = *it->second;
        entry.query_text = query;
        entry.results = std::move(results);
        entry.created_at = now;
        entry.last_access = 0;
        entry.access_count = 0;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        ++total_queries_;
        return;
    }

    if (cache_map_.size() >= max_size_) {
        evict_lru();
    }

    CacheEntry entry;
    entry.query_hash = key;
    entry.query_text = query;
    entry.scope = scope;
    entry.results = std::move(results);
    entry.created_at = now;
    lru_list_.push_front(std::move(entry));
    cache_map_[key] = lru_list_.begin();
    ++total_queries_;
}

size_t SemanticCache::clear_expired() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    core::Timestamp now = clock_();

    size_t removed = 0;
    for (auto it = lru_list_.begin(); it != lru_list_.end();) {
        auto next = std::next(it);
        if (is_expired(*it, now)) {
            erase(it);
            ++removed;
        }
        it = next;
    }
    return removed;
}

void SemanticCache::clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    lru_list_.clear();
    cache_map_.clear();
}

size_t SemanticCache::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return cache_map_.size();
}

size_t SemanticCache::max_size() const {
    return max_size_;
}

double SemanticCache::ttl_hours() const {
    return ttl_hours_;
}

CacheStats SemanticCache::stats() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    s.total_queries = total_queries_;
    uint64_t lookups = hits_ + misses_;
    s.hit_rate = static_cast<double>(hits_) / static_cast<double>(std::max<uint64_t>(1, lookups));
    s.cache_size = cache_map_.size();
    s.max_size = max_size_;
    return s;
}

void SemanticCache::reset_stats() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    total_queries_ = 0;
}

std::optional<std::string> SemanticCache::lru_query() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (lru_list_.empty()) {
        return std::nullopt;
    }
    return lru_list_.back().query_text;
}

bool SemanticCache::is_expired(const CacheEntry& entry, core::Timestamp now) const {
    core::Timestamp reference = entry.last_access != 0 ? entry.last_access : entry.created_at;
    return static_cast<double>(now - reference) > ttl_hours_ * kMillisPerHour;
}

core::RankedResults SemanticCache::touch(LRUIterator it, core::Timestamp now) {
    ++it->access_count;
    it->last_access = now;
    lru_list_.splice(lru_list_.begin(), lru_list_, it);
    return it->results;
}

void SemanticCache::erase(LRUIterator it) {
    cache_map_.erase(it->query_hash);
    lru_list_.erase(it);
}

void SemanticCache::evict_lru() {
    if (lru_list_.empty()) {
        return;
    }
    erase(std::prev(lru_list_.end()));
    ++evictions_;
}

} // namespace cache
} // namespace mnemo
