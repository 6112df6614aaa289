#ifndef QFAB_STORAGE_FILE_STATISTICS_CACHE_H_
#define QFAB_STORAGE_FILE_STATISTICS_CACHE_H_

#include <list>
#include <memory>
#include <mutex>
#include <string>

#include <absl/container/flat_hash_map.h>

#include "qfab/storage/statistics.h"

namespace qfab {
namespace storage {

/**
 * @brief Process-wide LRU cache of footer statistics keyed by file key
 *
 * The key is the session-independent file key, so every session listing the
 * same segment shares one entry. An entry is only returned when the recorded
 * object size matches the size the caller listed, so a rewritten object is
 * never served stale statistics. The bound is re-applied from configuration
 * whenever a runtime env is created.
 */
class FileStatisticsCache {
public:
    static FileStatisticsCache& Instance();

    std::shared_ptr<const Statistics> Get(const std::string& file_key, int64_t size);
    void Put(const std::string& file_key, int64_t size, std::shared_ptr<const Statistics> stats);
    void Evict(const std::string& file_key);
    void Clear();

    // Shrinks to the new bound immediately
    void SetMaxEntries(size_t max_entries);
    size_t max_entries() const;
    size_t size() const;

    uint64_t hits() const;
    uint64_t misses() const;

private:
    FileStatisticsCache();

    void EvictLocked();

    struct Entry {
        int64_t size;
        std::shared_ptr<const Statistics> stats;
        std::list<std::string>::iterator lru_pos;
    };

    mutable std::mutex mutex_;
    size_t max_entries_;
    std::list<std::string> lru_;
    absl::flat_hash_map<std::string, Entry> entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace storage
} // namespace qfab

#endif // QFAB_STORAGE_FILE_STATISTICS_CACHE_H_
