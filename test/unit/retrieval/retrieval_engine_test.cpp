#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mnemo/retrieval/retrieval_engine.h"
#include "test_util/fake_embedder.h"
#include "test_util/temp_dir.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace mnemo {
namespace retrieval {
namespace test {

using core::MemoryCategory;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

std::vector<core::MemoryId> result_ids(const SearchResponse& response) {
    std::vector<core::MemoryId> ids;
    for (const auto& result : response.results) {
        ids.push_back(result.id);
    }
    return ids;
}

SearchOptions uncached(size_t limit) {
    SearchOptions options;
    options.limit = limit;
    options.use_cache = false;
    return options;
}

} // namespace

class RetrievalEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("mnemo_engine");
    }

    core::RetrievalConfig persistent_config() {
        core::RetrievalConfig config;
        config.storage_dir = (dir_->path() / "store").string();
        config.project_id = "test";
        return config;
    }

    std::unique_ptr<RetrievalEngine> open_engine(
        const core::RetrievalConfig& config,
        std::shared_ptr<const embedding::IEmbedder> embedder = nullptr,
        cache::SemanticCache::Clock clock = cache::SemanticCache::Clock()) {
        auto result = RetrievalEngine::open(config, std::move(embedder), std::move(clock));
        EXPECT_TRUE(result.ok()) << result.error();
        return result.take_value();
    }

    std::unique_ptr<RetrievalEngine> open_in_memory() {
        return open_engine(core::RetrievalConfig::InMemory());
    }

    core::MemoryId add(RetrievalEngine& engine, const std::string& content, MemoryCategory category,
                       double importance, const core::Tags& tags = core::Tags()) {
        auto result = engine.add_memory(content, category, importance, tags);
        EXPECT_TRUE(result.ok()) << result.error();
        return result.ok() ? result.value() : core::MemoryId();
    }

    void seed(RetrievalEngine& engine) {
        add(engine, "Python programming basics", MemoryCategory::LEARNING, 0.9, {"python"});
        add(engine, "Web accessibility guidelines", MemoryCategory::PATTERN, 0.6, {"web"});
        add(engine, "Database index tuning for large tables", MemoryCategory::DECISION, 0.7, {"db"});
        add(engine, "Deploy the service behind a load balancer", MemoryCategory::CONTEXT, 0.4, {"ops", "web"});
        add(engine, "Issue: flaky integration test", MemoryCategory::ISSUE, 0.8, {"ci"});
    }

    std::string store_dir() {
        return (dir_->path() / "store").string();
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(RetrievalEngineTest, OpenRejectsInvalidConfig) {
    auto config = core::RetrievalConfig::InMemory();
    config.cache_max_size = 0;
    auto result = RetrievalEngine::open(config);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_NE(result.error().find("cache_max_size"), std::string::npos);
}

TEST_F(RetrievalEngineTest, OpenRejectsEmbedderDimensionMismatch) {
    auto config = core::RetrievalConfig::InMemory();
    auto result = RetrievalEngine::open(config, std::make_shared<embedding::FeatureEmbedder>(64));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(RetrievalEngineTest, OpenFailsOnUncreatableDirectory) {
    auto blocker = dir_->path() / "blocker";
    std::ofstream(blocker.string()) << "not a directory";

    auto config = persistent_config();
    config.storage_dir = (blocker / "store").string();
    auto result = RetrievalEngine::open(config);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::IO_ERROR);
}

TEST_F(RetrievalEngineTest, OpenCreatesStorageDirectory) {
    auto engine = open_engine(persistent_config());
    ASSERT_NE(engine, nullptr);
    EXPECT_TRUE(std::filesystem::is_directory(store_dir()));
    EXPECT_EQ(engine->size(), 0u);
}

TEST_F(RetrievalEngineTest, CloseIsIdempotent) {
    auto engine = open_engine(persistent_config());
    add(*engine, "Python programming basics", MemoryCategory::LEARNING, 0.9);
    engine->close();
    engine->close();
    EXPECT_EQ(engine->persistence_failures(), 0u);
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(store_dir()) / "test_memories.json"));
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(store_dir()) / "test_vector_index.json"));
}

// ============================================================================
// Adding and validation
// ============================================================================

TEST_F(RetrievalEngineTest, AddMemoryValidatesImportance) {
    auto engine = open_in_memory();
    for (double importance : {-0.1, 1.5, std::numeric_limits<double>::quiet_NaN(),
                              std::numeric_limits<double>::infinity()}) {
        auto result = engine->add_memory("text", MemoryCategory::CONTEXT, importance);
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
    }
    EXPECT_EQ(engine->size(), 0u);
    EXPECT_EQ(engine->index_stats().total_vectors, 0u);

    EXPECT_TRUE(engine->add_memory("edge low", MemoryCategory::CONTEXT, 0.0).ok());
    EXPECT_TRUE(engine->add_memory("edge high", MemoryCategory::CONTEXT, 1.0).ok());
    EXPECT_EQ(engine->size(), 2u);
}

TEST_F(RetrievalEngineTest, AddMemoryByCategoryName) {
    auto engine = open_in_memory();
    auto bad = engine->add_memory("text", std::string("todo"));
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error_code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(engine->size(), 0u);

    auto good = engine->add_memory("Choose RapidJSON for snapshots", std::string("decision"), 0.8);
    ASSERT_TRUE(good.ok());
    auto memory = engine->get_memory(good.value());
    ASSERT_TRUE(memory.has_value());
    EXPECT_EQ(memory->category, MemoryCategory::DECISION);
}

TEST_F(RetrievalEngineTest, IdsAreUnique) {
    auto engine = open_in_memory();
    std::vector<core::MemoryId> ids;
    for (int i = 0; i < 50; ++i) {
        ids.push_back(add(*engine, "same content", MemoryCategory::CONTEXT, 0.5));
    }
    for (const auto& id : ids) {
        EXPECT_EQ(id.rfind("mem_", 0), 0u);
        EXPECT_EQ(std::count(id.begin(), id.end(), '_'), 3);
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(std::unique(ids.begin(), ids.end()), ids.end());
    EXPECT_EQ(engine->size(), 50u);
}

// ============================================================================
// Search
// ============================================================================

TEST_F(RetrievalEngineTest, ExampleScenario) {
    auto engine = open_in_memory();
    auto python = add(*engine, "Python programming basics", MemoryCategory::LEARNING, 0.9, {"python"});
    add(*engine, "Web accessibility guidelines", MemoryCategory::PATTERN, 0.6, {"web"});

    SearchOptions options;
    options.limit = 1;
    auto first = engine->search_memories("Python coding", options);
    ASSERT_EQ(first.results.size(), 1u);
    EXPECT_EQ(first.results[0].id, python);
    EXPECT_GT(first.results[0].similarity, 0.0);
    EXPECT_LE(first.results[0].similarity, 1.0);
    EXPECT_EQ(first.source, ResultSource::VECTOR_SEARCH);
    EXPECT_EQ(first.total_found, 1u);
    EXPECT_EQ(first.query, "Python coding");
    EXPECT_GE(first.processing_time, 0.0);

    auto second = engine->search_memories("Python coding", options);
    EXPECT_EQ(second.source, ResultSource::CACHE);
    EXPECT_EQ(result_ids(second), result_ids(first));
    EXPECT_GE(engine->cache_stats().hits, 1u);

    EXPECT_EQ(to_string(first.source), "vector_search");
    EXPECT_EQ(to_string(second.source), "cache");
}

TEST_F(RetrievalEngineTest, MutationsInvalidateCache) {
    auto engine = open_in_memory();
    seed(*engine);

    EXPECT_EQ(engine->search_memories("Python coding").source, ResultSource::VECTOR_SEARCH);
    EXPECT_EQ(engine->search_memories("Python coding").source, ResultSource::CACHE);

    auto id = add(*engine, "Python packaging notes", MemoryCategory::LEARNING, 0.5);
    EXPECT_EQ(engine->cache_stats().cache_size, 0u);
    EXPECT_EQ(engine->search_memories("Python coding").source, ResultSource::VECTOR_SEARCH);
    EXPECT_EQ(engine->search_memories("Python coding").source, ResultSource::CACHE);

    ASSERT_TRUE(engine->remove_memory(id));
    auto after_remove = engine->search_memories("Python coding");
    EXPECT_EQ(after_remove.source, ResultSource::VECTOR_SEARCH);
    for (const auto& result : after_remove.results) {
        EXPECT_NE(result.id, id);
    }
}

TEST_F(RetrievalEngineTest, UseCacheFalseBypassesCache) {
    auto engine = open_in_memory();
    seed(*engine);

    engine->search_memories("Python coding", uncached(3));
    engine->search_memories("Python coding", uncached(3));
    auto stats = engine->cache_stats();
    EXPECT_EQ(stats.cache_size, 0u);
    EXPECT_EQ(stats.hits + stats.misses, 0u);
}

TEST_F(RetrievalEngineTest, RankingIsStable) {
    auto engine = open_in_memory();
    seed(*engine);

    auto first = engine->search_memories("web service deployment", uncached(5));
    auto second = engine->search_memories("web service deployment", uncached(5));
    EXPECT_FALSE(first.results.empty());
    EXPECT_EQ(result_ids(first), result_ids(second));
}

TEST_F(RetrievalEngineTest, CategoryFilter) {
    auto engine = open_in_memory();
    seed(*engine);
    add(*engine, "Python style guide", MemoryCategory::PATTERN, 0.3, {"python"});

    SearchOptions options;
    options.category = MemoryCategory::PATTERN;
    auto response = engine->search_memories("Python coding", options);
    ASSERT_FALSE(response.results.empty());
    for (const auto& result : response.results) {
        EXPECT_EQ(result.category, MemoryCategory::PATTERN);
    }
}

TEST_F(RetrievalEngineTest, TagFilter) {
    auto engine = open_in_memory();
    seed(*engine);

    SearchOptions options;
    options.tags = {"web"};
    auto response = engine->search_memories("load balancer", options);
    ASSERT_EQ(response.results.size(), 2u);
    for (const auto& result : response.results) {
        EXPECT_EQ(result.tags.count("web"), 1u);
    }
}

TEST_F(RetrievalEngineTest, FilteredAndUnfilteredQueriesDoNotShareCache) {
    auto engine = open_in_memory();
    seed(*engine);

    auto unfiltered = engine->search_memories("Python coding");
    EXPECT_EQ(unfiltered.source, ResultSource::VECTOR_SEARCH);

    SearchOptions filtered;
    filtered.category = MemoryCategory::ISSUE;
    auto response = engine->search_memories("Python coding", filtered);
    EXPECT_EQ(response.source, ResultSource::VECTOR_SEARCH);
    ASSERT_EQ(response.results.size(), 1u);
    EXPECT_EQ(response.results[0].category, MemoryCategory::ISSUE);

    EXPECT_EQ(engine->search_memories("Python coding", filtered).source, ResultSource::CACHE);

    SearchOptions smaller;
    smaller.limit = 2;
    EXPECT_EQ(engine->search_memories("Python coding", smaller).source, ResultSource::VECTOR_SEARCH);
}

TEST_F(RetrievalEngineTest, ResultsAreRerankedByImportance) {
    auto config = core::RetrievalConfig::InMemory();
    config.dimension = 3;
    auto embedder = std::make_shared<testutil::TableEmbedder>(3);
    embedder->set("query", {1.0f, 0.0f, 0.0f});
    embedder->set("exact but unimportant", {1.0f, 0.0f, 0.0f});
    embedder->set("close and important", {0.9f, 0.436f, 0.0f});
    embedder->set("unrelated", {0.0f, 0.0f, 1.0f});

    auto engine = open_engine(config, embedder);
    auto exact = add(*engine, "exact but unimportant", MemoryCategory::CONTEXT, 0.0);
    auto important = add(*engine, "close and important", MemoryCategory::CONTEXT, 1.0);
    add(*engine, "unrelated", MemoryCategory::CONTEXT, 1.0);

    auto response = engine->search_memories("query", uncached(10));
    // 0.7 * 0.9 + 0.3 * 1.0 beats 0.7 * 1.0 + 0.3 * 0.0; "unrelated" is under 0.3
    ASSERT_EQ(response.results.size(), 2u);
    EXPECT_EQ(response.results[0].id, important);
    EXPECT_EQ(response.results[1].id, exact);
    EXPECT_NEAR(response.results[1].similarity, 1.0, 1e-6);
}

TEST_F(RetrievalEngineTest, MinSimilarityAndLimit) {
    auto engine = open_in_memory();
    seed(*engine);

    SearchOptions strict;
    strict.min_similarity = 1.0;
    strict.use_cache = false;
    EXPECT_TRUE(engine->search_memories("Python coding", strict).results.empty());

    EXPECT_TRUE(engine->search_memories("Python coding", uncached(0)).results.empty());
    EXPECT_EQ(engine->search_memories("Python coding", uncached(3)).results.size(), 3u);
}

TEST_F(RetrievalEngineTest, EmptyQueryFindsNothing) {
    auto engine = open_in_memory();
    seed(*engine);

    auto response = engine->search_memories("");
    EXPECT_TRUE(response.results.empty());
    EXPECT_EQ(response.total_found, 0u);
    // Empty results are never cached
    EXPECT_EQ(engine->search_memories("").source, ResultSource::VECTOR_SEARCH);
}

TEST_F(RetrievalEngineTest, SearchBumpsAccessCounts) {
    auto engine = open_in_memory();
    auto id = add(*engine, "Python programming basics", MemoryCategory::LEARNING, 0.9);

    EXPECT_EQ(engine->get_memory(id)->access_count, 1u);
    auto response = engine->search_memories("Python coding", uncached(1));
    ASSERT_EQ(response.results.size(), 1u);
    EXPECT_EQ(response.results[0].access_count, 2u);
    EXPECT_EQ(engine->get_memory(id)->access_count, 3u);
}

TEST_F(RetrievalEngineTest, RetrievalStats) {
    auto engine = open_in_memory();
    seed(*engine);

    engine->search_memories("Python coding");
    engine->search_memories("Python coding");
    engine->search_memories("database", uncached(2));

    auto stats = engine->retrieval_stats();
    EXPECT_EQ(stats.total_retrievals, 3u);
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.vector_searches, 2u);
    EXPECT_EQ(stats.total_memories, 5u);
    EXPECT_GE(stats.average_retrieval_time, 0.0);
}

// ============================================================================
// Removal and lookups
// ============================================================================

TEST_F(RetrievalEngineTest, RemoveMemory) {
    auto engine = open_in_memory();
    auto id = add(*engine, "Python programming basics", MemoryCategory::LEARNING, 0.9);

    EXPECT_FALSE(engine->remove_memory("mem_missing"));
    EXPECT_TRUE(engine->remove_memory(id));
    EXPECT_FALSE(engine->remove_memory(id));
    EXPECT_EQ(engine->size(), 0u);
    EXPECT_EQ(engine->index_stats().total_vectors, 0u);
    EXPECT_FALSE(engine->get_memory(id).has_value());
    EXPECT_TRUE(engine->search_memories("Python coding").results.empty());
}

TEST_F(RetrievalEngineTest, TopMemories) {
    auto engine = open_in_memory();
    auto low = add(*engine, "low", MemoryCategory::LEARNING, 0.2);
    auto high = add(*engine, "high", MemoryCategory::DECISION, 0.9);
    auto mid = add(*engine, "mid", MemoryCategory::LEARNING, 0.5);

    auto top = engine->get_top_memories(2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].id, high);
    EXPECT_EQ(top[1].id, mid);
    EXPECT_DOUBLE_EQ(top[0].similarity, 0.0);

    auto learning = engine->get_top_memories(10, MemoryCategory::LEARNING);
    ASSERT_EQ(learning.size(), 2u);
    EXPECT_EQ(learning[0].id, mid);
    EXPECT_EQ(learning[1].id, low);

    EXPECT_TRUE(engine->get_top_memories(10, MemoryCategory::ISSUE).empty());
}

TEST_F(RetrievalEngineTest, GetMemory) {
    auto engine = open_in_memory();
    auto id = add(*engine, "Python programming basics", MemoryCategory::LEARNING, 0.9, {"python"});

    auto memory = engine->get_memory(id);
    ASSERT_TRUE(memory.has_value());
    EXPECT_EQ(memory->content, "Python programming basics");
    EXPECT_EQ(memory->tags, (core::Tags{"python"}));
    EXPECT_DOUBLE_EQ(memory->importance, 0.9);
    EXPECT_GT(memory->created_at, 0);

    EXPECT_FALSE(engine->get_memory("mem_0_0_0").has_value());
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(RetrievalEngineTest, RestartPreservesSearchResults) {
    std::vector<core::MemoryId> before;
    {
        auto engine = open_engine(persistent_config());
        seed(*engine);
        before = result_ids(engine->search_memories("web service deployment", uncached(3)));
        ASSERT_EQ(before.size(), 3u);
    }

    auto engine = open_engine(persistent_config());
    EXPECT_EQ(engine->size(), 5u);
    EXPECT_EQ(engine->index_stats().total_vectors, 5u);
    EXPECT_EQ(result_ids(engine->search_memories("web service deployment", uncached(3))), before);
    EXPECT_EQ(engine->retrieval_stats().total_retrievals, 2u);
}

TEST_F(RetrievalEngineTest, RestartPreservesFragmentsAndAccessCounts) {
    core::MemoryId id;
    {
        auto engine = open_engine(persistent_config());
        id = add(*engine, "Python programming basics", MemoryCategory::LEARNING, 0.9, {"python", "basics"});
        engine->get_memory(id);
        engine->get_memory(id);
    }

    auto engine = open_engine(persistent_config());
    auto memory = engine->get_memory(id);
    ASSERT_TRUE(memory.has_value());
    EXPECT_EQ(memory->category, MemoryCategory::LEARNING);
    EXPECT_EQ(memory->tags, (core::Tags{"python", "basics"}));
    EXPECT_EQ(memory->access_count, 3u);
}

TEST_F(RetrievalEngineTest, RemovalIsPersisted) {
    core::MemoryId removed;
    {
        auto engine = open_engine(persistent_config());
        seed(*engine);
        removed = add(*engine, "temporary note", MemoryCategory::CONTEXT, 0.1);
        ASSERT_TRUE(engine->remove_memory(removed));
    }

    auto engine = open_engine(persistent_config());
    EXPECT_EQ(engine->size(), 5u);
    EXPECT_FALSE(engine->get_memory(removed).has_value());
}

TEST_F(RetrievalEngineTest, MissingIndexFileTriggersRebuild) {
    {
        auto engine = open_engine(persistent_config());
        seed(*engine);
    }
    auto index_path = std::filesystem::path(store_dir()) / "test_vector_index.json";
    ASSERT_TRUE(std::filesystem::remove(index_path));

    auto engine = open_engine(persistent_config());
    EXPECT_EQ(engine->size(), 5u);
    EXPECT_EQ(engine->index_stats().total_vectors, 5u);
    EXPECT_TRUE(std::filesystem::exists(index_path));
    EXPECT_FALSE(engine->search_memories("Python coding").results.empty());
}

TEST_F(RetrievalEngineTest, CorruptIndexFileTriggersRebuild) {
    {
        auto engine = open_engine(persistent_config());
        seed(*engine);
    }
    std::ofstream(std::filesystem::path(store_dir()) / "test_vector_index.json", std::ios::trunc) << "{ garbage";

    auto engine = open_engine(persistent_config());
    EXPECT_EQ(engine->size(), 5u);
    EXPECT_EQ(engine->index_stats().total_vectors, 5u);
}

TEST_F(RetrievalEngineTest, OrphanIndexEntryTriggersRebuild) {
    {
        auto engine = open_engine(persistent_config());
        seed(*engine);
    }

    SnapshotStore store(store_dir(), "test");
    auto loaded = store.load_index();
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    IndexSnapshot snapshot = loaded.take_value();
    ASSERT_EQ(snapshot.entries.size(), 5u);
    core::IndexEntry ghost = snapshot.entries.front();
    ghost.id = "mem_ghost";
    snapshot.entries.push_back(ghost);
    ASSERT_TRUE(store.save_index(snapshot).ok());

    auto engine = open_engine(persistent_config());
    EXPECT_EQ(engine->size(), 5u);
    EXPECT_EQ(engine->index_stats().total_vectors, engine->size());

    // The repaired index is written back without the orphan
    auto repaired = store.load_index();
    ASSERT_TRUE(repaired.ok()) << repaired.error();
    EXPECT_EQ(repaired.value().entries.size(), 5u);
    for (const auto& entry : repaired.value().entries) {
        EXPECT_NE(entry.id, "mem_ghost");
    }
}

TEST_F(RetrievalEngineTest, RebuildOrdersSameMillisecondIdsBySequence) {
    std::filesystem::create_directories(store_dir());
    std::ofstream(std::filesystem::path(store_dir()) / "test_memories.json") << R"({
        "memories": {
            "mem_1700000000000_10_4242": {"content": "Second note", "category": "context",
                                          "importance": 0.5, "tags": [],
                                          "created_at": "2023-11-14T22:13:20.000Z", "project_id": "test"},
            "mem_1700000000000_9_1717": {"content": "First note", "category": "context",
                                         "importance": 0.5, "tags": [],
                                         "created_at": "2023-11-14T22:13:20.000Z", "project_id": "test"},
            "legacy": {"content": "Imported note", "category": "context",
                       "importance": 0.5, "tags": [],
                       "created_at": "2023-11-14T22:13:20.000Z", "project_id": "test"}
        },
        "metadata": {}
    })";

    // No index file: the engine rebuilds on open
    auto engine = open_engine(persistent_config());
    ASSERT_EQ(engine->index_stats().total_vectors, 3u);

    std::vector<core::MemoryId> ids;
    for (const auto& result : engine->get_top_memories(3)) {
        ids.push_back(result.id);
    }
    EXPECT_EQ(ids, (std::vector<core::MemoryId>{
                       "mem_1700000000000_9_1717", "mem_1700000000000_10_4242", "legacy"}));
}

TEST_F(RetrievalEngineTest, CorruptFragmentsFileStartsEmpty) {
    {
        auto engine = open_engine(persistent_config());
        seed(*engine);
    }
    std::ofstream(std::filesystem::path(store_dir()) / "test_memories.json", std::ios::trunc) << "not json";

    auto engine = open_engine(persistent_config());
    EXPECT_EQ(engine->size(), 0u);
    EXPECT_EQ(engine->index_stats().total_vectors, 0u);
}

TEST_F(RetrievalEngineTest, DimensionChangeTriggersRebuild) {
    {
        auto engine = open_engine(persistent_config());
        seed(*engine);
    }

    auto config = persistent_config();
    config.dimension = 64;
    auto engine = open_engine(config);
    EXPECT_EQ(engine->size(), 5u);
    auto stats = engine->index_stats();
    EXPECT_EQ(stats.total_vectors, 5u);
    EXPECT_EQ(stats.dimension, 64u);
}

TEST_F(RetrievalEngineTest, PersistenceFailureKeepsInMemoryMutation) {
    auto engine = open_engine(persistent_config());
    std::filesystem::remove_all(store_dir());
    std::ofstream(store_dir()) << "now a file";

    auto result = engine->add_memory("Python programming basics", MemoryCategory::LEARNING, 0.9);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(engine->size(), 1u);
    EXPECT_GE(engine->persistence_failures(), 1u);
    EXPECT_TRUE(engine->remove_memory(result.value()));
}

// ============================================================================
// Maintenance
// ============================================================================

TEST_F(RetrievalEngineTest, OptimizeOnHealthyEngineChangesNothing) {
    auto engine = open_in_memory();
    seed(*engine);

    auto report = engine->optimize_indices();
    EXPECT_EQ(report.expired_cache_entries, 0u);
    EXPECT_FALSE(report.rebuilt);
    EXPECT_EQ(report.pruned_access_records, 0u);
    EXPECT_EQ(engine->size(), 5u);
}

TEST_F(RetrievalEngineTest, OptimizeClearsExpiredCacheEntries) {
    auto now = std::make_shared<core::Timestamp>(1700000000000LL);
    auto engine = open_engine(core::RetrievalConfig::InMemory(), nullptr, [now]() { return *now; });
    seed(*engine);

    engine->search_memories("Python coding");
    engine->search_memories("database tuning");
    EXPECT_EQ(engine->cache_stats().cache_size, 2u);

    *now += 25LL * 3600 * 1000;
    auto report = engine->optimize_indices();
    EXPECT_EQ(report.expired_cache_entries, 2u);
    EXPECT_EQ(engine->cache_stats().cache_size, 0u);
}

TEST_F(RetrievalEngineTest, OptimizePrunesIdleAndOrphanAccessRecords) {
    std::filesystem::create_directories(store_dir());
    std::ofstream(std::filesystem::path(store_dir()) / "test_memories.json") << R"({
        "memories": {
            "mem_old": {"content": "Archived design decision", "category": "decision",
                        "importance": 0.5, "tags": [], "created_at": "2020-01-01T00:00:00.000Z",
                        "project_id": "test"},
            "mem_used": {"content": "Frequently read note", "category": "context",
                         "importance": 0.5, "tags": [], "created_at": "2020-01-01T00:00:00.000Z",
                         "project_id": "test"}
        },
        "metadata": {
            "mem_old": {"access_count": 0, "last_access": null, "creation_time": "2020-01-01T00:00:00.000Z"},
            "mem_used": {"access_count": 4, "last_access": "2020-02-01T00:00:00.000Z",
                         "creation_time": "2020-01-01T00:00:00.000Z"},
            "mem_ghost": {"access_count": 1, "last_access": null, "creation_time": "2020-01-01T00:00:00.000Z"}
        }
    })";

    // No index file: the engine rebuilds on open
    auto engine = open_engine(persistent_config());
    EXPECT_EQ(engine->size(), 2u);
    EXPECT_EQ(engine->index_stats().total_vectors, 2u);

    auto report = engine->optimize_indices();
    EXPECT_FALSE(report.rebuilt);
    EXPECT_EQ(report.pruned_access_records, 2u);
    EXPECT_EQ(engine->size(), 2u);
    EXPECT_EQ(engine->optimize_indices().pruned_access_records, 0u);
}

TEST_F(RetrievalEngineTest, RebuildKeepsResults) {
    auto engine = open_in_memory();
    seed(*engine);
    auto before = result_ids(engine->search_memories("Python coding", uncached(5)));

    ASSERT_TRUE(engine->rebuild().ok());
    EXPECT_EQ(engine->index_stats().total_vectors, 5u);
    EXPECT_EQ(engine->cache_stats().cache_size, 0u);
    EXPECT_EQ(result_ids(engine->search_memories("Python coding", uncached(5))), before);
}

TEST_F(RetrievalEngineTest, FailedRebuildIsRepairedByOptimize) {
    const core::Vector unit{1.0f, 0.0f, 0.0f};
    auto embedder = std::make_shared<::testing::NiceMock<testutil::MockEmbedder>>();
    ON_CALL(*embedder, dimension()).WillByDefault(Return(3));
    ON_CALL(*embedder, name()).WillByDefault(Return("mock"));
    EXPECT_CALL(*embedder, embed(_)).WillRepeatedly(Return(unit));

    auto config = core::RetrievalConfig::InMemory();
    config.dimension = 3;
    auto engine = open_engine(config, embedder);
    add(*engine, "Python programming basics", MemoryCategory::LEARNING, 0.9);
    add(*engine, "Web accessibility guidelines", MemoryCategory::PATTERN, 0.6);

    EXPECT_CALL(*embedder, embed("Web accessibility guidelines"))
        .WillOnce(Throw(std::runtime_error("model unavailable")))
        .WillRepeatedly(Return(unit));

    auto rebuilt = engine->rebuild();
    ASSERT_FALSE(rebuilt.ok());
    EXPECT_EQ(rebuilt.error_code(), core::Error::Code::INTERNAL);
    EXPECT_EQ(engine->size(), 2u);
    EXPECT_EQ(engine->index_stats().total_vectors, 1u);

    auto report = engine->optimize_indices();
    EXPECT_TRUE(report.rebuilt);
    EXPECT_EQ(engine->index_stats().total_vectors, 2u);
    EXPECT_FALSE(engine->optimize_indices().rebuilt);
}

// ============================================================================
// Benchmark and summary
// ============================================================================

TEST_F(RetrievalEngineTest, BenchmarkRejectsZeroQueries) {
    auto engine = open_in_memory();
    auto result = engine->benchmark_performance(0);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(RetrievalEngineTest, BenchmarkReport) {
    auto engine = open_in_memory();
    seed(*engine);

    auto result = engine->benchmark_performance(20);
    ASSERT_TRUE(result.ok()) << result.error();
    const auto& report = result.value();
    EXPECT_GT(report.average_search_time, 0.0);
    EXPECT_GE(report.average_cache_time, 0.0);
    EXPECT_GT(report.queries_per_second, 0.0);
    EXPECT_DOUBLE_EQ(report.cache_hit_rate, 1.0);
    EXPECT_GT(report.cache_speedup, 0.0);
    EXPECT_EQ(report.total_memories, 5u);
    EXPECT_EQ(report.vector_dimension, 384u);
    EXPECT_EQ(report.performance_grade, performance_grade(report.average_search_time));
    EXPECT_EQ(engine->size(), 5u);
}

TEST_F(RetrievalEngineTest, PerformanceSummary) {
    auto engine = open_in_memory();
    seed(*engine);
    engine->search_memories("Python coding");
    engine->search_memories("Python coding");

    auto summary = engine->performance_summary();
    EXPECT_EQ(summary.memory_count, 5u);
    EXPECT_EQ(summary.index.total_vectors, 5u);
    EXPECT_EQ(summary.retrieval.total_retrievals, 2u);
    EXPECT_EQ(summary.cache.hits, 1u);
    EXPECT_EQ(summary.persistence_failures, 0u);
    EXPECT_DOUBLE_EQ(summary.health.vector_index_health, 1.0);
    EXPECT_DOUBLE_EQ(summary.health.cache_health, 0.5);
    EXPECT_NEAR(summary.health.overall, 0.4 + 0.15 + 0.3, 1e-9);
    EXPECT_EQ(summary.health.status, "excellent");
}

// ============================================================================
// Thread safety
// ============================================================================

TEST_F(RetrievalEngineTest, ConcurrentAddAndSearch) {
    auto engine = open_in_memory();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&engine, t]() {
            for (int i = 0; i < 10; ++i) {
                auto id = engine->add_memory("note " + std::to_string(t) + " " + std::to_string(i),
                                             MemoryCategory::CONTEXT, 0.5);
                EXPECT_TRUE(id.ok());
                engine->search_memories("note " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(engine->size(), 40u);
    EXPECT_EQ(engine->index_stats().total_vectors, 40u);
    EXPECT_EQ(engine->retrieval_stats().total_retrievals, 40u);
}

} // namespace test
} // namespace retrieval
} // namespace mnemo
