#include "mnemo/retrieval/snapshot_store.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "mnemo/common/logger.h"

namespace mnemo {
namespace retrieval {

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value make_string(const std::string& s, Allocator& allocator) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

rapidjson::Value make_tags(const core::Tags& tags, Allocator& allocator) {
    rapidjson::Value array(rapidjson::kArrayType);
    for (const auto& tag : tags) {
        array.PushBack(make_string(tag, allocator).Move(), allocator);
    }
    return array;
}

rapidjson::Value make_time(core::Timestamp ts, Allocator& allocator) {
    if (ts == 0) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return make_string(core::format_iso8601(ts), allocator);
}

std::string get_string(const rapidjson::Value& obj, const char* key, const std::string& fallback = "") {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return fallback;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

double get_double(const rapidjson::Value& obj, const char* key, double fallback = 0.0) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsNumber()) {
        return fallback;
    }
    return it->value.GetDouble();
}

uint64_t get_uint64(const rapidjson::Value& obj, const char* key, uint64_t fallback = 0) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return fallback;
    }
    if (it->value.IsUint64()) {
        return it->value.GetUint64();
    }
    if (it->value.IsNumber() && it->value.GetDouble() >= 0.0) {
        return static_cast<uint64_t>(it->value.GetDouble());
    }
    return fallback;
}

// Accepts ISO-8601 strings and numeric epoch seconds; null or missing is 0
core::Timestamp get_time(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return 0;
    }
    if (it->value.IsString()) {
        auto parsed = core::parse_iso8601(it->value.GetString());
        return parsed ? *parsed : 0;
    }
    if (it->value.IsNumber()) {
        return static_cast<core::Timestamp>(it->value.GetDouble() * 1000.0);
    }
    return 0;
}

core::Tags get_tags(const rapidjson::Value& obj, const char* key) {
    core::Tags tags;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsArray()) {
        return tags;
    }
    for (const auto& tag : it->value.GetArray()) {
        if (tag.IsString()) {
            tags.insert(std::string(tag.GetString(), tag.GetStringLength()));
        }
    }
    return tags;
}

core::Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return core::Result<std::string>::error("Cannot open " + path, core::Error::Code::IO_ERROR);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return core::Result<std::string>::error("Read failed for " + path, core::Error::Code::IO_ERROR);
    }
    return core::Result<std::string>(oss.str());
}

core::Result<void> write_file_atomically(const std::string& path, const std::string& content) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return core::Result<void>::error("Cannot open " + tmp_path + " for writing",
                                             core::Error::Code::IO_ERROR);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            return core::Result<void>::error("Write failed for " + tmp_path, core::Error::Code::IO_ERROR);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return core::Result<void>::error("Cannot replace " + path, core::Error::Code::IO_ERROR);
    }
    return core::Result<void>();
}

core::Result<rapidjson::Document> parse_document(const std::string& path, bool& missing) {
    missing = false;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        missing = true;
        return core::Result<rapidjson::Document>(rapidjson::Document());
    }

    auto content = read_file(path);
    if (!content.ok()) {
        return core::Result<rapidjson::Document>::error(content.error(), content.error_code());
    }

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(content.value().c_str());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "Malformed JSON in " << path << " at offset " << doc.GetErrorOffset()
            << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return core::Result<rapidjson::Document>::error(oss.str(), core::Error::Code::IO_ERROR);
    }
    if (!doc.IsObject()) {
        return core::Result<rapidjson::Document>::error(path + " is not a JSON object",
                                                        core::Error::Code::IO_ERROR);
    }
    return core::Result<rapidjson::Document>(std::move(doc));
}

} // namespace

SnapshotStore::SnapshotStore(std::string storage_dir, std::string project_id)
    : storage_dir_(std::move(storage_dir)), project_id_(std::move(project_id)) {
    std::filesystem::path dir(storage_dir_);
    fragments_path_ = (dir / (project_id_ + "_memories.json")).string();
    index_path_ = (dir / (project_id_ + "_vector_index.json")).string();
}

core::Result<void> SnapshotStore::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(storage_dir_, ec);
    if (ec) {
        return core::Result<void>::error("Cannot create storage directory " + storage_dir_ + ": " + ec.message(),
                                         core::Error::Code::IO_ERROR);
    }
    return core::Result<void>();
}

core::Result<FragmentSnapshot> SnapshotStore::load_fragments() const {
    bool missing = false;
    auto parsed = parse_document(fragments_path_, missing);
    if (!parsed.ok()) {
        return core::Result<FragmentSnapshot>::error(parsed.error(), parsed.error_code());
    }

    FragmentSnapshot snapshot;
    if (missing) {
        return core::Result<FragmentSnapshot>(std::move(snapshot));
    }
    const rapidjson::Document& doc = parsed.value();

    auto memories = doc.FindMember("memories");
    if (memories != doc.MemberEnd() && memories->value.IsObject()) {
        for (const auto& m : memories->value.GetObject()) {
            if (!m.value.IsObject()) {
                continue;
            }
            std::string id(m.name.GetString(), m.name.GetStringLength());
            auto category = core::parse_category(get_string(m.value, "category"));
            if (!category) {
                MNEMO_WARN("Skipping memory {} with unknown category '{}'", id, get_string(m.value, "category"));
                continue;
            }

            core::MemoryFragment fragment;
            fragment.id = id;
            fragment.content = get_string(m.value, "content");
            fragment.category = *category;
            fragment.importance = core::clamp_unit(get_double(m.value, "importance", 0.5));
            fragment.tags = get_tags(m.value, "tags");
            fragment.created_at = get_time(m.value, "created_at");
            fragment.project_id = get_string(m.value, "project_id", project_id_);
            snapshot.fragments.push_back(std::move(fragment));
        }
    }

    auto metadata = doc.FindMember("metadata");
    if (metadata != doc.MemberEnd() && metadata->value.IsObject()) {
        for (const auto& m : metadata->value.GetObject()) {
            if (!m.value.IsObject()) {
                continue;
            }
            core::AccessRecord record;
            record.access_count = get_uint64(m.value, "access_count");
            record.last_access = get_time(m.value, "last_access");
            record.creation_time = get_time(m.value, "creation_time");
            snapshot.access_records.emplace_back(
                std::string(m.name.GetString(), m.name.GetStringLength()), record);
        }
    }

    auto stats = doc.FindMember("performance_stats");
    if (stats != doc.MemberEnd() && stats->value.IsObject()) {
        snapshot.stats.total_retrievals = get_uint64(stats->value, "total_retrievals");
        snapshot.stats.cache_hits = get_uint64(stats->value, "cache_hits");
        snapshot.stats.vector_searches = get_uint64(stats->value, "vector_searches");
        snapshot.stats.average_retrieval_time = get_double(stats->value, "average_retrieval_time");
        snapshot.stats.total_memories = get_uint64(stats->value, "total_memories");
    }

    return core::Result<FragmentSnapshot>(std::move(snapshot));
}

core::Result<IndexSnapshot> SnapshotStore::load_index() const {
    bool missing = false;
    auto parsed = parse_document(index_path_, missing);
    if (!parsed.ok()) {
        return core::Result<IndexSnapshot>::error(parsed.error(), parsed.error_code());
    }

    IndexSnapshot snapshot;
    if (missing) {
        return core::Result<IndexSnapshot>(std::move(snapshot));
    }
    const rapidjson::Document& doc = parsed.value();

    auto indices = doc.FindMember("indices");
    if (indices == doc.MemberEnd() || !indices->value.IsObject()) {
        return core::Result<IndexSnapshot>(std::move(snapshot));
    }

    for (const auto& m : indices->value.GetObject()) {
        std::string id(m.name.GetString(), m.name.GetStringLength());
        if (!m.value.IsObject()) {
            ++snapshot.skipped;
            continue;
        }
        auto category = core::parse_category(get_string(m.value, "category"));
        auto vector = m.value.FindMember("vector");
        if (!category || vector == m.value.MemberEnd() || !vector->value.IsArray()) {
            MNEMO_WARN("Skipping malformed index entry {}", id);
            ++snapshot.skipped;
            continue;
        }

        core::IndexEntry entry;
        entry.id = get_string(m.value, "memory_id", id);
        entry.category = *category;
        entry.importance = core::clamp_unit(get_double(m.value, "importance"));
        entry.tags = get_tags(m.value, "tags");
        entry.created_at = get_time(m.value, "timestamp");

        bool numeric = true;
        entry.vector.reserve(vector->value.Size());
        for (const auto& component : vector->value.GetArray()) {
            if (!component.IsNumber()) {
                numeric = false;
                break;
            }
            entry.vector.push_back(static_cast<float>(component.GetDouble()));
        }
        if (!numeric) {
            MNEMO_WARN("Skipping index entry {} with non-numeric vector", id);
            ++snapshot.skipped;
            continue;
        }
        snapshot.entries.push_back(std::move(entry));
    }

    return core::Result<IndexSnapshot>(std::move(snapshot));
}

core::Result<void> SnapshotStore::save_fragments(const FragmentSnapshot& snapshot) const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value memories(rapidjson::kObjectType);
    for (const auto& fragment : snapshot.fragments) {
        rapidjson::Value m(rapidjson::kObjectType);
        m.AddMember("content", make_string(fragment.content, allocator).Move(), allocator);
        m.AddMember("category", make_string(core::to_string(fragment.category), allocator).Move(), allocator);
        m.AddMember("importance", rapidjson::Value(fragment.importance), allocator);
        m.AddMember("tags", make_tags(fragment.tags, allocator).Move(), allocator);
        m.AddMember("created_at", make_time(fragment.created_at, allocator).Move(), allocator);
        m.AddMember("project_id", make_string(fragment.project_id, allocator).Move(), allocator);
        memories.AddMember(make_string(fragment.id, allocator).Move(), m, allocator);
    }
    doc.AddMember("memories", memories, allocator);

    rapidjson::Value metadata(rapidjson::kObjectType);
    for (const auto& kv : snapshot.access_records) {
        rapidjson::Value r(rapidjson::kObjectType);
        r.AddMember("access_count", rapidjson::Value(static_cast<uint64_t>(kv.second.access_count)), allocator);
        r.AddMember("last_access", make_time(kv.second.last_access, allocator).Move(), allocator);
        r.AddMember("creation_time", make_time(kv.second.creation_time, allocator).Move(), allocator);
        metadata.AddMember(make_string(kv.first, allocator).Move(), r, allocator);
    }
    doc.AddMember("metadata", metadata, allocator);

    rapidjson::Value stats(rapidjson::kObjectType);
    stats.AddMember("total_retrievals", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.total_retrievals)), allocator);
    stats.AddMember("cache_hits", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.cache_hits)), allocator);
    stats.AddMember("vector_searches", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.vector_searches)), allocator);
    stats.AddMember("average_retrieval_time", rapidjson::Value(snapshot.stats.average_retrieval_time), allocator);
    stats.AddMember("total_memories", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.total_memories)), allocator);
    doc.AddMember("performance_stats", stats, allocator);

    doc.AddMember("last_saved", make_string(core::format_iso8601(core::now_ms()), allocator).Move(), allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);

    return write_file_atomically(fragments_path_, std::string(buffer.GetString(), buffer.GetSize()));
}

core::Result<void> SnapshotStore::save_index(const IndexSnapshot& snapshot) const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value indices(rapidjson::kObjectType);
    for (const auto& entry : snapshot.entries) {
        rapidjson::Value e(rapidjson::kObjectType);
        e.AddMember("memory_id", make_string(entry.id, allocator).Move(), allocator);

        rapidjson::Value vector(rapidjson::kArrayType);
        vector.Reserve(static_cast<rapidjson::SizeType>(entry.vector.size()), allocator);
        for (float component : entry.vector) {
            vector.PushBack(rapidjson::Value(static_cast<double>(component)), allocator);
        }
        e.AddMember("vector", vector, allocator);
        e.AddMember("category", make_string(core::to_string(entry.category), allocator).Move(), allocator);
        e.AddMember("importance", rapidjson::Value(entry.importance), allocator);
        e.AddMember("timestamp", make_time(entry.created_at, allocator).Move(), allocator);
        e.AddMember("tags", make_tags(entry.tags, allocator).Move(), allocator);
        indices.AddMember(make_string(entry.id, allocator).Move(), e, allocator);
    }
    doc.AddMember("indices", indices, allocator);

    rapidjson::Value stats(rapidjson::kObjectType);
    stats.AddMember("total_vectors", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.total_vectors)), allocator);
    stats.AddMember("categories", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.categories)), allocator);
    stats.AddMember("tags", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.tags)), allocator);
    stats.AddMember("dimension", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.dimension)), allocator);
    stats.AddMember("search_count", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.search_count)), allocator);
    stats.AddMember("average_search_time", rapidjson::Value(snapshot.stats.avg_search_time), allocator);
    stats.AddMember("index_updates", rapidjson::Value(static_cast<uint64_t>(snapshot.stats.index_updates)), allocator);
    doc.AddMember("stats", stats, allocator);

    doc.AddMember("last_saved", make_string(core::format_iso8601(core::now_ms()), allocator).Move(), allocator);

    // Vectors dominate this file; keep it compact
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);

    return write_file_atomically(index_path_, std::string(buffer.GetString(), buffer.GetSize()));
}

} // namespace retrieval
} // namespace mnemo
