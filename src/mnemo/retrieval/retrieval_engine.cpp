#include "mnemo/retrieval/retrieval_engine.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>
#include <sstream>

#include <absl/container/flat_hash_set.h>

#include "mnemo/common/logger.h"
#include "mnemo/core/error.h"

namespace mnemo {
namespace retrieval {

namespace {

constexpr int64_t kMillisPerDay = 24LL * 3600 * 1000;

// Shared by every engine in the process so ids never collide
std::atomic<uint64_t> g_id_sequence{0};

const std::vector<std::string>& benchmark_base_queries() {
    static const std::vector<std::string> queries = {
        "project requirement analysis",
        "system architecture design",
        "database optimization",
        "user interface design",
        "performance testing",
        "deployment configuration",
        "error handling",
        "security considerations",
        "code refactoring",
        "documentation writing",
    };
    return queries;
}

uint32_t fnv1a32(const std::string& s) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

// Sequence field of a generated id (mem_<ms>_<seq>_<hash>)
std::optional<uint64_t> id_sequence(const core::MemoryId& id) {
    size_t first = id.find('_');
    size_t second = first == std::string::npos ? first : id.find('_', first + 1);
    size_t third = second == std::string::npos ? second : id.find('_', second + 1);
    if (third == std::string::npos || third == second + 1 || third - second - 1 > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (size_t i = second + 1; i < third; ++i) {
        if (id[i] < '0' || id[i] > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(id[i] - '0');
    }
    return value;
}

// Creation order: created_at, then the id sequence (ids without one last),
// then the id itself
bool created_before(const core::MemoryFragment* a, const core::MemoryFragment* b) {
    if (a->created_at != b->created_at) {
        return a->created_at < b->created_at;
    }
    auto seq_a = id_sequence(a->id);
    auto seq_b = id_sequence(b->id);
    if (seq_a.has_value() != seq_b.has_value()) {
        return seq_a.has_value();
    }
    if (seq_a && *seq_a != *seq_b) {
        return *seq_a < *seq_b;
    }
    return a->id < b->id;
}

} // namespace

std::string to_string(ResultSource source) {
    switch (source) {
        case ResultSource::CACHE: return "cache";
        case ResultSource::VECTOR_SEARCH: return "vector_search";
    }
    return "vector_search";
}

core::Result<std::unique_ptr<RetrievalEngine>> RetrievalEngine::open(
    const core::RetrievalConfig& config,
    std::shared_ptr<const embedding::IEmbedder> embedder,
    cache::SemanticCache::Clock cache_clock) {
    using EngineResult = core::Result<std::unique_ptr<RetrievalEngine>>;

    auto validation = config.validate();
    if (!validation.is_valid) {
        MNEMO_ERROR("Rejecting retrieval config: {}", validation.getSummary());
        return EngineResult::error(validation.getSummary(), core::Error::Code::INVALID_ARGUMENT);
    }
    for (const auto& warning : validation.warnings) {
        MNEMO_WARN("Retrieval config: {}", warning);
    }

    if (!embedder) {
        embedder = std::make_shared<embedding::FeatureEmbedder>(config.dimension);
    } else if (embedder->dimension() != config.dimension) {
        std::ostringstream oss;
        oss << "Embedder '" << embedder->name() << "' has dimension " << embedder->dimension()
            << " but the engine is configured for " << config.dimension;
        return EngineResult::error(oss.str(), core::Error::Code::INVALID_ARGUMENT);
    }

    std::unique_ptr<RetrievalEngine> engine(
        new RetrievalEngine(config, std::move(embedder), std::move(cache_clock)));

    if (engine->store_) {
        auto dir = engine->store_->ensure_directory();
        if (!dir.ok()) {
            MNEMO_ERROR("{}", dir.error());
            return EngineResult::error(dir.error(), dir.error_code());
        }
    }

    {
        std::lock_guard<std::recursive_mutex> lock(engine->mutex_);
        engine->load();
    }
    return EngineResult(std::move(engine));
}

RetrievalEngine::RetrievalEngine(const core::RetrievalConfig& config,
                                 std::shared_ptr<const embedding::IEmbedder> embedder,
                                 cache::SemanticCache::Clock cache_clock)
    : config_(config), embedder_(std::move(embedder)) {
    index_ = std::make_unique<index::VectorIndex>(embedder_);

    cache::QuerySimilarityWeights weights;
    weights.word_weight = config_.query_word_weight;
    weights.char_weight = config_.query_char_weight;
    cache_ = std::make_unique<cache::SemanticCache>(config_.cache_max_size, config_.cache_ttl_hours,
                                                    weights, std::move(cache_clock));

    if (config_.persist) {
        store_ = std::make_unique<SnapshotStore>(config_.storage_dir, config_.project_id);
    }
}

RetrievalEngine::~RetrievalEngine() {
    close();
}

void RetrievalEngine::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    persist();
    closed_ = true;
    MNEMO_DEBUG("Closed collection '{}' with {} memories", config_.project_id, fragments_.size());
}

void RetrievalEngine::load() {
    if (!store_) {
        return;
    }

    auto fragments = store_->load_fragments();
    if (!fragments.ok()) {
        MNEMO_ERROR("Ignoring unreadable fragments file {}: {}", store_->fragments_path(), fragments.error());
    } else {
        FragmentSnapshot& snapshot = fragments.value();
        for (auto& fragment : snapshot.fragments) {
            core::MemoryId id = fragment.id;
            fragments_[id] = std::move(fragment);
        }
        for (auto& record : snapshot.access_records) {
            access_records_[record.first] = record.second;
        }
        stats_ = snapshot.stats;
    }
    stats_.total_memories = fragments_.size();

    bool needs_rebuild = false;
    auto entries = store_->load_index();
    if (!entries.ok()) {
        MNEMO_ERROR("Ignoring unreadable index file {}: {}", store_->index_path(), entries.error());
        needs_rebuild = !fragments_.empty();
    } else {
        IndexSnapshot& snapshot = entries.value();
        if (snapshot.skipped > 0) {
            needs_rebuild = true;
        }
        std::vector<core::IndexEntry> known;
        known.reserve(snapshot.entries.size());
        for (auto& entry : snapshot.entries) {
            if (fragments_.find(entry.id) == fragments_.end()) {
                MNEMO_WARN("Dropping orphan index entry {}", entry.id);
                needs_rebuild = true;
                continue;
            }
            known.push_back(std::move(entry));
        }
        if (index_->restore(std::move(known)) > 0) {
            needs_rebuild = true;
        }
    }

    if (needs_rebuild || !index_consistent()) {
        MNEMO_WARN("Index for '{}' is out of step with its fragments ({} entries, {} fragments); rebuilding",
                   config_.project_id, index_->size(), fragments_.size());
        rebuild_locked();
        persist();
    }

    MNEMO_INFO("Loaded collection '{}': {} memories", config_.project_id, fragments_.size());
}

bool RetrievalEngine::index_consistent() const {
    if (index_->size() != fragments_.size()) {
        return false;
    }
    for (const auto& kv : fragments_) {
        if (!index_->contains(kv.first)) {
            return false;
        }
    }
    return true;
}

size_t RetrievalEngine::rebuild_locked() {
    std::vector<const core::MemoryFragment*> ordered;
    ordered.reserve(fragments_.size());
    for (const auto& kv : fragments_) {
        ordered.push_back(&kv.second);
    }
    std::sort(ordered.begin(), ordered.end(), created_before);

    std::vector<index::IndexDocument> documents;
    documents.reserve(ordered.size());
    for (const auto* fragment : ordered) {
        index::IndexDocument document;
        document.id = fragment->id;
        document.text = fragment->content;
        document.category = fragment->category;
        document.importance = fragment->importance;
        document.tags = fragment->tags;
        document.created_at = fragment->created_at;
        documents.push_back(std::move(document));
    }

    index_->clear();
    size_t failed = index_->insert_batch(documents);
    cache_->clear();

    if (failed > 0) {
        MNEMO_ERROR("Rebuild of '{}' failed to embed {} of {} fragments",
                    config_.project_id, failed, ordered.size());
    } else {
        MNEMO_INFO("Rebuilt index for '{}' with {} vectors", config_.project_id, index_->size());
    }
    return failed;
}

std::vector<const core::MemoryFragment*> RetrievalEngine::fragments_in_order() const {
    std::vector<const core::MemoryFragment*> ordered;
    ordered.reserve(fragments_.size());

    absl::flat_hash_set<core::MemoryId> seen;
    for (const auto& entry : index_->entries()) {
        auto it = fragments_.find(entry.id);
        if (it != fragments_.end()) {
            ordered.push_back(&it->second);
            seen.insert(entry.id);
        }
    }

    // Fragments the index lost (failed embed) go last, oldest first
    std::vector<const core::MemoryFragment*> rest;
    for (const auto& kv : fragments_) {
        if (seen.find(kv.first) == seen.end()) {
            rest.push_back(&kv.second);
        }
    }
    std::sort(rest.begin(), rest.end(), created_before);
    ordered.insert(ordered.end(), rest.begin(), rest.end());
    return ordered;
}

void RetrievalEngine::persist() {
    if (!store_) {
        return;
    }

    FragmentSnapshot fragments;
    auto ordered = fragments_in_order();
    fragments.fragments.reserve(ordered.size());
    for (const auto* fragment : ordered) {
        fragments.fragments.push_back(*fragment);
        auto rit = access_records_.find(fragment->id);
        if (rit != access_records_.end()) {
            fragments.access_records.emplace_back(fragment->id, rit->second);
        }
    }
    // Records without a fragment are kept until optimize_indices prunes them
    std::vector<std::pair<core::MemoryId, core::AccessRecord>> orphans;
    for (const auto& kv : access_records_) {
        if (fragments_.find(kv.first) == fragments_.end()) {
            orphans.emplace_back(kv.first, kv.second);
        }
    }
    std::sort(orphans.begin(), orphans.end(),
              [](const std::pair<core::MemoryId, core::AccessRecord>& a,
                 const std::pair<core::MemoryId, core::AccessRecord>& b) { return a.first < b.first; });
    fragments.access_records.insert(fragments.access_records.end(), orphans.begin(), orphans.end());
    fragments.stats = stats_;
    fragments.stats.total_memories = fragments_.size();

    IndexSnapshot entries;
    entries.entries = index_->entries();
    entries.stats = index_->stats();

    auto saved_fragments = store_->save_fragments(fragments);
    if (!saved_fragments.ok()) {
        ++persistence_failures_;
        MNEMO_ERROR("Failed to save fragments for '{}': {}", config_.project_id, saved_fragments.error());
    }
    auto saved_index = store_->save_index(entries);
    if (!saved_index.ok()) {
        ++persistence_failures_;
        MNEMO_ERROR("Failed to save index for '{}': {}", config_.project_id, saved_index.error());
    }
}

core::MemoryId RetrievalEngine::generate_id(const std::string& content) const {
    uint64_t seq = g_id_sequence.fetch_add(1);
    std::ostringstream oss;
    oss << "mem_" << core::now_ms() << "_" << seq << "_" << (fnv1a32(content) % 10000);
    return oss.str();
}

core::Result<core::MemoryId> RetrievalEngine::add_memory(const std::string& content,
                                                         core::MemoryCategory category,
                                                         double importance,
                                                         const core::Tags& tags) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!std::isfinite(importance) || importance < 0.0 || importance > 1.0) {
        std::ostringstream oss;
        oss << "Importance must be within [0, 1], got " << importance;
        return core::Result<core::MemoryId>::error(oss.str(), core::Error::Code::INVALID_ARGUMENT);
    }

    core::MemoryFragment fragment;
    fragment.id = generate_id(content);
    fragment.content = content;
    fragment.category = category;
    fragment.importance = importance;
    fragment.tags = tags;
    fragment.created_at = core::now_ms();
    fragment.project_id = config_.project_id;

    if (!index_->insert(fragment.id, fragment.content, fragment.category, fragment.importance,
                        fragment.tags, fragment.created_at)) {
        return core::Result<core::MemoryId>::error("Failed to index memory " + fragment.id,
                                                   core::Error::Code::INTERNAL);
    }

    core::MemoryId id = fragment.id;
    core::AccessRecord record;
    record.creation_time = fragment.created_at;
    access_records_[id] = record;
    fragments_[id] = std::move(fragment);
    stats_.total_memories = fragments_.size();

    cache_->clear();
    persist();

    MNEMO_DEBUG("Added memory {} ({})", id, core::to_string(category));
    return core::Result<core::MemoryId>(id);
}

core::Result<core::MemoryId> RetrievalEngine::add_memory(const std::string& content,
                                                         const std::string& category,
                                                         double importance,
                                                         const core::Tags& tags) {
    auto parsed = core::parse_category(category);
    if (!parsed) {
        return core::Result<core::MemoryId>::error("Unknown memory category '" + category + "'",
                                                   core::Error::Code::INVALID_ARGUMENT);
    }
    return add_memory(content, *parsed, importance, tags);
}

std::string RetrievalEngine::cache_scope(const SearchOptions& options, double min_similarity) const {
    std::vector<std::string> tags(options.tags.begin(), options.tags.end());
    std::sort(tags.begin(), tags.end());
    tags.erase(std::unique(tags.begin(), tags.end()), tags.end());

    char min_buf[32];
    std::snprintf(min_buf, sizeof(min_buf), "%.17g", min_similarity);

    std::ostringstream oss;
    oss << "limit=" << options.limit << ";min=" << min_buf;
    if (options.category) {
        oss << ";category=" << core::to_string(*options.category);
    }
    if (!tags.empty()) {
        oss << ";tags=";
        for (size_t i = 0; i < tags.size(); ++i) {
            if (i > 0) {
                oss << '\x1e';
            }
            oss << tags[i];
        }
    }
    return oss.str();
}

core::RankedResult RetrievalEngine::hydrate(const core::MemoryId& id, double similarity) {
    const core::MemoryFragment& fragment = fragments_.at(id);

    core::AccessRecord& record = access_records_[id];
    if (record.creation_time == 0) {
        record.creation_time = fragment.created_at;
    }
    record.record_access(core::now_ms());

    core::RankedResult result;
    result.id = fragment.id;
    result.content = fragment.content;
    result.category = fragment.category;
    result.importance = fragment.importance;
    result.similarity = core::clamp_unit(similarity);
    result.tags = fragment.tags;
    result.created_at = fragment.created_at;
    result.access_count = record.access_count;
    return result;
}

void RetrievalEngine::record_retrieval(double elapsed_seconds) {
    ++stats_.total_retrievals;
    stats_.average_retrieval_time +=
        (elapsed_seconds - stats_.average_retrieval_time) / static_cast<double>(stats_.total_retrievals);
}

SearchResponse RetrievalEngine::search_memories(const std::string& query, const SearchOptions& options) {
    auto start = std::chrono::steady_clock::now();
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    double min_similarity = options.min_similarity.value_or(config_.min_similarity_default);
    std::string scope = cache_scope(options, min_similarity);

    SearchResponse response;
    response.query = query;

    if (options.use_cache) {
        auto cached = cache_->get(query, config_.cache_similarity_threshold, scope);
        if (cached) {
            response.results = std::move(*cached);
            response.total_found = response.results.size();
            response.source = ResultSource::CACHE;
            response.processing_time = seconds_since(start);
            ++stats_.cache_hits;
            record_retrieval(response.processing_time);
            return response;
        }
    }

    index::SearchFilter filter;
    filter.category = options.category;
    filter.tags = options.tags;

    size_t candidates = options.limit > std::numeric_limits<size_t>::max() / 2
                            ? std::numeric_limits<size_t>::max()
                            : options.limit * 2;
    auto hits = index_->search(query, candidates, filter, min_similarity);
    ++stats_.vector_searches;

    struct Ranked {
        core::RankedResult result;
        double score;
    };
    std::vector<Ranked> ranked;
    ranked.reserve(hits.size());
    for (const auto& hit : hits) {
        if (fragments_.find(hit.first) == fragments_.end()) {
            MNEMO_WARN("Index returned {} which has no fragment", hit.first);
            continue;
        }
        core::RankedResult result = hydrate(hit.first, hit.second);
        double score = config_.rank_similarity_weight * result.similarity +
                       config_.rank_importance_weight * result.importance;
        ranked.push_back(Ranked{std::move(result), score});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Ranked& a, const Ranked& b) { return a.score > b.score; });
    if (ranked.size() > options.limit) {
        ranked.resize(options.limit);
    }

    response.results.reserve(ranked.size());
    for (auto& r : ranked) {
        response.results.push_back(std::move(r.result));
    }
    response.total_found = response.results.size();
    response.source = ResultSource::VECTOR_SEARCH;

    if (options.use_cache && !response.results.empty()) {
        cache_->put(query, response.results, scope);
    }

    response.processing_time = seconds_since(start);
    record_retrieval(response.processing_time);
    return response;
}

bool RetrievalEngine::remove_memory(const core::MemoryId& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = fragments_.find(id);
    if (it == fragments_.end()) {
        return false;
    }
    fragments_.erase(it);
    access_records_.erase(id);
    if (!index_->remove(id)) {
        MNEMO_WARN("Memory {} was missing from the index", id);
    }
    stats_.total_memories = fragments_.size();

    cache_->clear();
    persist();

    MNEMO_DEBUG("Removed memory {}", id);
    return true;
}

core::RankedResults RetrievalEngine::get_top_memories(size_t limit,
                                                      std::optional<core::MemoryCategory> category) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    core::RankedResults results;
    for (const auto& id : index_->top_important(limit, category)) {
        if (fragments_.find(id) == fragments_.end()) {
            continue;
        }
        results.push_back(hydrate(id, 0.0));
    }
    return results;
}

std::optional<core::RankedResult> RetrievalEngine::get_memory(const core::MemoryId& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (fragments_.find(id) == fragments_.end()) {
        return std::nullopt;
    }
    return hydrate(id, 0.0);
}

OptimizeReport RetrievalEngine::optimize_indices() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    OptimizeReport report;
    report.expired_cache_entries = cache_->clear_expired();

    if (!index_consistent()) {
        MNEMO_WARN("Index for '{}' has {} entries for {} fragments; rebuilding",
                   config_.project_id, index_->size(), fragments_.size());
        rebuild_locked();
        report.rebuilt = true;
    }

    core::Timestamp now = core::now_ms();
    int64_t retention = static_cast<int64_t>(config_.metadata_retention_days) * kMillisPerDay;
    for (auto it = access_records_.begin(); it != access_records_.end();) {
        bool orphan = fragments_.find(it->first) == fragments_.end();
        bool idle = it->second.access_count == 0 && now - it->second.creation_time > retention;
        if (orphan || idle) {
            access_records_.erase(it++);
            ++report.pruned_access_records;
        } else {
            ++it;
        }
    }

    if (report.rebuilt || report.pruned_access_records > 0) {
        persist();
    }

    MNEMO_INFO("Optimized '{}': {} expired cache entries, rebuilt={}, {} access records pruned",
               config_.project_id, report.expired_cache_entries, report.rebuilt,
               report.pruned_access_records);
    return report;
}

core::Result<void> RetrievalEngine::rebuild() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    size_t failed = rebuild_locked();
    persist();
    if (failed > 0) {
        std::ostringstream oss;
        oss << "Failed to embed " << failed << " fragments during rebuild";
        return core::Result<void>::error(oss.str(), core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

core::Result<BenchmarkReport> RetrievalEngine::benchmark_performance(size_t num_queries) {
    if (num_queries == 0) {
        return core::Result<BenchmarkReport>::error("Benchmark needs at least one query",
                                                    core::Error::Code::INVALID_ARGUMENT);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const auto& base = benchmark_base_queries();
    std::vector<std::string> queries;
    queries.reserve(num_queries);
    for (size_t i = 0; i < num_queries; ++i) {
        queries.push_back(base[i % base.size()] + " " + std::to_string(i));
    }

    SearchOptions cold;
    cold.limit = 5;
    cold.use_cache = false;

    double cold_total = 0.0;
    for (const auto& query : queries) {
        auto start = std::chrono::steady_clock::now();
        search_memories(query, cold);
        cold_total += seconds_since(start);
    }
    double average_search_time = cold_total / static_cast<double>(queries.size());

    SearchOptions warm;
    warm.limit = 5;
    warm.use_cache = true;

    size_t warm_count = std::max<size_t>(1, queries.size() / 2);
    for (size_t i = 0; i < warm_count; ++i) {
        search_memories(queries[i], warm);
    }

    auto before = cache_->stats();
    double warm_total = 0.0;
    for (size_t i = 0; i < warm_count; ++i) {
        auto start = std::chrono::steady_clock::now();
        search_memories(queries[i], warm);
        warm_total += seconds_since(start);
    }
    auto after = cache_->stats();
    double average_cache_time = warm_total / static_cast<double>(warm_count);

    uint64_t lookups = (after.hits + after.misses) - (before.hits + before.misses);
    uint64_t hits = after.hits - before.hits;

    BenchmarkReport report;
    report.average_search_time = average_search_time;
    report.average_cache_time = average_cache_time;
    report.queries_per_second = average_search_time > 0.0 ? 1.0 / average_search_time : 0.0;
    report.cache_hit_rate = lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    report.cache_speedup = average_search_time / std::max(0.001, average_cache_time);
    report.total_memories = fragments_.size();
    report.vector_dimension = index_->dimension();
    report.performance_grade = performance_grade(average_search_time);

    MNEMO_INFO("Benchmark '{}': {} queries, avg search {:.6f}s, avg cached {:.6f}s, grade {}",
               config_.project_id, num_queries, report.average_search_time,
               report.average_cache_time, report.performance_grade);
    return core::Result<BenchmarkReport>(report);
}

PerformanceSummary RetrievalEngine::performance_summary() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    PerformanceSummary summary;
    summary.retrieval = stats_;
    summary.retrieval.total_memories = fragments_.size();
    summary.index = index_->stats();
    summary.cache = cache_->stats();
    summary.memory_count = fragments_.size();
    summary.persistence_failures = persistence_failures_;
    summary.health = compute_health(summary.index.total_vectors, summary.memory_count,
                                    summary.cache.hit_rate, summary.index.avg_search_time);
    return summary;
}

index::IndexStats RetrievalEngine::index_stats() const {
    return index_->stats();
}

cache::CacheStats RetrievalEngine::cache_stats() const {
    return cache_->stats();
}

core::RetrievalStats RetrievalEngine::retrieval_stats() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    core::RetrievalStats stats = stats_;
    stats.total_memories = fragments_.size();
    return stats;
}

size_t RetrievalEngine::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fragments_.size();
}

uint64_t RetrievalEngine::persistence_failures() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return persistence_failures_;
}

} // namespace retrieval
} // namespace mnemo
