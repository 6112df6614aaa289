#include "qfab/storage/file_statistics_cache.h"

#include "qfab/common/logger.h"
#include "qfab/core/config.h"

namespace qfab {
namespace storage {

FileStatisticsCache& FileStatisticsCache::Instance() {
    static FileStatisticsCache inst;
    return inst;
}

FileStatisticsCache::FileStatisticsCache()
    : max_entries_(core::GetConfig()->limit.file_stat_cache_max_entries) {}

std::shared_ptr<const Statistics> FileStatisticsCache::Get(const std::string& file_key, int64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file_key);
    if (it == entries_.end() || it->second.size != size) {
        misses_++;
        return nullptr;
    }
    hits_++;
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return it->second.stats;
}

void FileStatisticsCache::Put(const std::string& file_key, int64_t size,
                              std::shared_ptr<const Statistics> stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_entries_ == 0) return;
    auto it = entries_.find(file_key);
    if (it != entries_.end()) {
        it->second.size = size;
        it->second.stats = std::move(stats);
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
        return;
    }
    lru_.push_front(file_key);
    entries_.emplace(file_key, Entry{size, std::move(stats), lru_.begin()});
    EvictLocked();
}

void FileStatisticsCache::Evict(const std::string& file_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file_key);
    if (it == entries_.end()) return;
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
}

void FileStatisticsCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    hits_ = 0;
    misses_ = 0;
}

void FileStatisticsCache::SetMaxEntries(size_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_entries_ = max_entries;
    EvictLocked();
}

size_t FileStatisticsCache::max_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_entries_;
}

size_t FileStatisticsCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t FileStatisticsCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t FileStatisticsCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

void FileStatisticsCache::EvictLocked() {
    while (entries_.size() > max_entries_ && !lru_.empty()) {
        entries_.erase(lru_.back());
        lru_.pop_back();
    }
}

} // namespace storage
} // namespace qfab
