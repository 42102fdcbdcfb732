#include "mnemo/index/vector_index.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>

#include "mnemo/common/logger.h"
#include "mnemo/core/error.h"

namespace mnemo {
namespace index {

namespace {

struct Scored {
    const core::IndexEntry* entry;
    double similarity;
};

// Importance descending, insertion order on ties
bool ranks_before(const core::IndexEntry& a, const core::IndexEntry& b) {
    if (a.importance != b.importance) {
        return a.importance > b.importance;
    }
    return a.sequence < b.sequence;
}

} // namespace

VectorIndex::VectorIndex(std::shared_ptr<const embedding::IEmbedder> embedder)
    : embedder_(std::move(embedder)), dimension_(0) {
    if (!embedder_) {
        throw core::InvalidArgumentError("VectorIndex requires an embedder");
    }
    dimension_ = embedder_->dimension();
}

VectorIndex::~VectorIndex() = default;

bool VectorIndex::insert(const core::MemoryId& id, const std::string& text,
                         core::MemoryCategory category, double importance,
                         const core::Tags& tags, core::Timestamp created_at) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    IndexDocument document;
    document.id = id;
    document.text = text;
    document.category = category;
    document.importance = importance;
    document.tags = tags;
    document.created_at = created_at;

    auto entry = embed_entry(document);
    if (!entry) {
        return false;
    }
    store_entry(std::move(*entry));
    return true;
}

bool VectorIndex::insert_vector(core::IndexEntry entry) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (entry.vector.size() != dimension_) {
        MNEMO_WARN("Rejecting index entry {}: {} dimensions, expected {}",
                   entry.id, entry.vector.size(), dimension_);
        return false;
    }
    entry.importance = core::clamp_unit(entry.importance);
    store_entry(std::move(entry));
    return true;
}

size_t VectorIndex::insert_batch(const std::vector<IndexDocument>& documents) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    size_t failed = 0;
    for (const auto& document : documents) {
        auto entry = embed_entry(document);
        if (!entry) {
            ++failed;
            continue;
        }
        store_entry(std::move(*entry), false);
    }
    resort_importance();
    return failed;
}

size_t VectorIndex::restore(std::vector<core::IndexEntry> entries) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    size_t rejected = 0;
    for (auto& entry : entries) {
        if (entry.vector.size() != dimension_) {
            MNEMO_WARN("Rejecting index entry {}: {} dimensions, expected {}",
                       entry.id, entry.vector.size(), dimension_);
            ++rejected;
            continue;
        }
        entry.importance = core::clamp_unit(entry.importance);
        store_entry(std::move(entry), false);
    }
    resort_importance();
    return rejected;
}

std::optional<core::IndexEntry> VectorIndex::embed_entry(const IndexDocument& document) const {
    core::IndexEntry entry;
    try {
        entry.vector = embedder_->embed(document.text);
    } catch (const std::exception& e) {
        MNEMO_ERROR("Embedding failed for {}: {}", document.id, e.what());
        return std::nullopt;
    }
    if (entry.vector.size() != dimension_) {
        MNEMO_ERROR("Embedder {} returned {} dimensions for {}, expected {}",
                    embedder_->name(), entry.vector.size(), document.id, dimension_);
        return std::nullopt;
    }

    entry.id = document.id;
    entry.category = document.category;
    entry.importance = core::clamp_unit(document.importance);
    entry.tags = document.tags;
    entry.created_at = document.created_at != 0 ? document.created_at : core::now_ms();
    return entry;
}

// keep_order == false leaves importance_order_ stale; the caller must
// finish with resort_importance()
void VectorIndex::store_entry(core::IndexEntry entry, bool keep_order) {
    core::MemoryId id = entry.id;
    auto it = entries_.find(id);
    bool overwrite = it != entries_.end();
    if (overwrite) {
        entry.sequence = it->second.sequence;
        unlink_secondary(it->second);
    } else {
        entry.sequence = next_sequence_++;
    }

    category_ids_[entry.category].insert(id);
    for (const auto& tag : entry.tags) {
        tag_ids_[tag].insert(id);
    }
    entries_[id] = std::move(entry);

    if (keep_order) {
        if (overwrite) {
            auto pos = std::find(importance_order_.begin(), importance_order_.end(), id);
            if (pos != importance_order_.end()) {
                importance_order_.erase(pos);
            }
        }
        place_by_importance(id);
    }
    ++index_updates_;
}

void VectorIndex::unlink_secondary(const core::IndexEntry& entry) {
    auto cit = category_ids_.find(entry.category);
    if (cit != category_ids_.end()) {
        cit->second.erase(entry.id);
        if (cit->second.empty()) {
            category_ids_.erase(cit);
        }
    }
    for (const auto& tag : entry.tags) {
        auto tit = tag_ids_.find(tag);
        if (tit != tag_ids_.end()) {
            tit->second.erase(entry.id);
            if (tit->second.empty()) {
                tag_ids_.erase(tit);
            }
        }
    }
}

void VectorIndex::place_by_importance(const core::MemoryId& id) {
    const core::IndexEntry& entry = entries_.at(id);
    auto pos = std::upper_bound(importance_order_.begin(), importance_order_.end(), entry,
                                [this](const core::IndexEntry& e, const core::MemoryId& other) {
                                    return ranks_before(e, entries_.at(other));
                                });
    importance_order_.insert(pos, id);
}

void VectorIndex::resort_importance() {
    std::vector<const core::IndexEntry*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& kv : entries_) {
        ordered.push_back(&kv.second);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const core::IndexEntry* a, const core::IndexEntry* b) { return ranks_before(*a, *b); });

    importance_order_.clear();
    importance_order_.reserve(ordered.size());
    for (const auto* e : ordered) {
        importance_order_.push_back(e->id);
    }
}

VectorIndex::IdSet VectorIndex::candidate_ids(const SearchFilter& filter) const {
    IdSet tag_union;
    for (const auto& tag : filter.tags) {
        auto it = tag_ids_.find(tag);
        if (it != tag_ids_.end()) {
            tag_union.insert(it->second.begin(), it->second.end());
        }
    }

    if (!filter.category) {
        return tag_union;
    }

    auto cit = category_ids_.find(*filter.category);
    if (cit == category_ids_.end()) {
        return IdSet();
    }
    if (filter.tags.empty()) {
        return cit->second;
    }

    IdSet both;
    std::set_intersection(cit->second.begin(), cit->second.end(),
                          tag_union.begin(), tag_union.end(),
                          std::inserter(both, both.begin()));
    return both;
}

ScoredIds VectorIndex::search(const std::string& query_text, size_t limit,
                              const SearchFilter& filter, double min_similarity) {
    auto start = std::chrono::steady_clock::now();

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    core::Vector query;
    try {
        query = embedder_->embed(query_text);
    } catch (const std::exception& e) {
        MNEMO_ERROR("Embedding failed for query: {}", e.what());
        return ScoredIds();
    }

    std::vector<Scored> scored;
    auto score = [&](const core::IndexEntry& entry) {
        double similarity = embedding::cosine_similarity(query, entry.vector);
        if (similarity >= min_similarity) {
            scored.push_back(Scored{&entry, similarity});
        }
    };

    bool filtered = filter.category.has_value() || !filter.tags.empty();
    if (filtered) {
        for (const auto& id : candidate_ids(filter)) {
            auto it = entries_.find(id);
            if (it != entries_.end()) {
                score(it->second);
            }
        }
    } else {
        scored.reserve(entries_.size());
        for (const auto& kv : entries_) {
            score(kv.second);
        }
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.entry->sequence < b.entry->sequence;
    });
    if (scored.size() > limit) {
        scored.resize(limit);
    }

    ScoredIds results;
    results.reserve(scored.size());
    for (const auto& s : scored) {
        results.emplace_back(s.entry->id, core::clamp_unit(s.similarity));
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    ++search_count_;
    total_search_time_ += elapsed;
    return results;
}

std::vector<core::MemoryId> VectorIndex::top_important(
    size_t limit, std::optional<core::MemoryCategory> category) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<core::MemoryId> result;
    for (const auto& id : importance_order_) {
        if (result.size() >= limit) {
            break;
        }
        if (category) {
            auto it = entries_.find(id);
            if (it == entries_.end() || it->second.category != *category) {
                continue;
            }
        }
        result.push_back(id);
    }
    return result;
}

bool VectorIndex::remove(const core::MemoryId& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }

    unlink_secondary(it->second);
    entries_.erase(it);

    auto pos = std::find(importance_order_.begin(), importance_order_.end(), id);
    if (pos != importance_order_.end()) {
        importance_order_.erase(pos);
    }
    ++index_updates_;
    return true;
}

bool VectorIndex::contains(const core::MemoryId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return entries_.find(id) != entries_.end();
}

std::optional<core::IndexEntry> VectorIndex::entry(const core::MemoryId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::IndexEntry> VectorIndex::entries() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<core::IndexEntry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) {
        out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const core::IndexEntry& a, const core::IndexEntry& b) {
        return a.sequence < b.sequence;
    });
    return out;
}

void VectorIndex::clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    entries_.clear();
    category_ids_.clear();
    tag_ids_.clear();
    importance_order_.clear();
    next_sequence_ = 0;
    ++index_updates_;
}

size_t VectorIndex::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return entries_.size();
}

size_t VectorIndex::dimension() const {
    return dimension_;
}

IndexStats VectorIndex::stats() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    IndexStats s;
    s.total_vectors = entries_.size();
    s.categories = category_ids_.size();
    s.tags = tag_ids_.size();
    s.dimension = dimension_;
    s.search_count = search_count_;
    s.avg_search_time = search_count_ == 0 ? 0.0 : total_search_time_ / static_cast<double>(search_count_);
    s.index_updates = index_updates_;
    return s;
}

} // namespace index
} // namespace mnemo
