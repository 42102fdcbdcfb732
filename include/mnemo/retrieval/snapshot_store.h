#ifndef MNEMO_RETRIEVAL_SNAPSHOT_STORE_H_
#define MNEMO_RETRIEVAL_SNAPSHOT_STORE_H_

#include <string>
#include <utility>
#include <vector>

#include "mnemo/core/result.h"
#include "mnemo/core/types.h"
#include "mnemo/index/vector_index.h"

namespace mnemo {
namespace retrieval {

/**
 * @brief Contents of the fragments file
 */
struct FragmentSnapshot {
    std::vector<core::MemoryFragment> fragments;
    std::vector<std::pair<core::MemoryId, core::AccessRecord>> access_records;
    core::RetrievalStats stats;
};

/**
 * @brief Contents of the index file
 */
struct IndexSnapshot {
    std::vector<core::IndexEntry> entries;
    index::IndexStats stats;   // informational only, never restored
    size_t skipped = 0;        // malformed entries dropped while loading
};

/**
 * @brief Reads and writes the two JSON snapshot files of one collection
 *
 *   <dir>/<project>_memories.json      fragments, access records, stats
 *   <dir>/<project>_vector_index.json  embedded entries, index stats
 *
 * Every save is a full overwrite: the document is written to "<file>.tmp"
 * and renamed over the target. A missing file loads as an empty snapshot.
 */
class SnapshotStore {
public:
    SnapshotStore(std::string storage_dir, std::string project_id);

    core::Result<void> ensure_directory() const;

    core::Result<FragmentSnapshot> load_fragments() const;
    core::Result<IndexSnapshot> load_index() const;

    core::Result<void> save_fragments(const FragmentSnapshot& snapshot) const;
    core::Result<void> save_index(const IndexSnapshot& snapshot) const;

    const std::string& fragments_path() const { return fragments_path_; }
    const std::string& index_path() const { return index_path_; }

private:
    std::string storage_dir_;
    std::string project_id_;
    std::string fragments_path_;
    std::string index_path_;
};

} // namespace retrieval
} // namespace mnemo

#endif // MNEMO_RETRIEVAL_SNAPSHOT_STORE_H_
