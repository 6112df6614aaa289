#ifndef QFAB_STORAGE_FILE_DATA_CACHE_H_
#define QFAB_STORAGE_FILE_DATA_CACHE_H_

#include <list>
#include <memory>
#include <mutex>
#include <string>

#include <absl/container/flat_hash_map.h>
#include <arrow/buffer.h>

namespace qfab {
namespace storage {

/**
 * @brief Process-wide byte cache of segment files (the ephemeral tier)
 *
 * LRU bounded by total bytes. A single object larger than the capacity is not
 * cached.
 */
class FileDataCache {
public:
    static FileDataCache& Instance();

    std::shared_ptr<arrow::Buffer> Get(const std::string& file_key);
    void Put(const std::string& file_key, std::shared_ptr<arrow::Buffer> data);
    bool Remove(const std::string& file_key);
    bool Contains(const std::string& file_key) const;
    void Clear();

    void SetCapacity(size_t max_bytes);
    size_t capacity() const;
    size_t used_bytes() const;
    size_t size() const;

private:
    FileDataCache();

    void EvictLocked();

    struct Entry {
        std::shared_ptr<arrow::Buffer> data;
        std::list<std::string>::iterator lru_pos;
    };

    mutable std::mutex mutex_;
    size_t capacity_;
    size_t used_bytes_ = 0;
    std::list<std::string> lru_;  // front = most recently used
    absl::flat_hash_map<std::string, Entry> entries_;
};

} // namespace storage
} // namespace qfab

#endif // QFAB_STORAGE_FILE_DATA_CACHE_H_
