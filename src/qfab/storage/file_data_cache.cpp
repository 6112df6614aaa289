#include "qfab/storage/file_data_cache.h"

#include "qfab/common/logger.h"
#include "qfab/core/config.h"

namespace qfab {
namespace storage {

FileDataCache& FileDataCache::Instance() {
    static FileDataCache instance;
    return instance;
}

FileDataCache::FileDataCache()
    : capacity_(core::GetConfig()->memory_cache.data_cache_max_size) {}

std::shared_ptr<arrow::Buffer> FileDataCache::Get(const std::string& file_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file_key);
    if (it == entries_.end()) {
        return nullptr;
    }
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return it->second.data;
}

void FileDataCache::Put(const std::string& file_key, std::shared_ptr<arrow::Buffer> data) {
    if (!data) return;
    size_t bytes = static_cast<size_t>(data->size());
    std::lock_guard<std::mutex> lock(mutex_);
    if (bytes > capacity_) {
        QFAB_DEBUG("[file_cache] {} ({} bytes) exceeds capacity {}, not cached", file_key, bytes, capacity_);
        return;
    }
    auto it = entries_.find(file_key);
    if (it != entries_.end()) {
        used_bytes_ -= static_cast<size_t>(it->second.data->size());
        it->second.data = std::move(data);
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    } else {
        lru_.push_front(file_key);
        entries_.emplace(file_key, Entry{std::move(data), lru_.begin()});
    }
    used_bytes_ += bytes;
    EvictLocked();
}

bool FileDataCache::Remove(const std::string& file_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file_key);
    if (it == entries_.end()) return false;
    used_bytes_ -= static_cast<size_t>(it->second.data->size());
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
    return true;
}

bool FileDataCache::Contains(const std::string& file_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(file_key);
}

void FileDataCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    used_bytes_ = 0;
}

void FileDataCache::SetCapacity(size_t max_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = max_bytes;
    EvictLocked();
}

size_t FileDataCache::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

size_t FileDataCache::used_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_bytes_;
}

size_t FileDataCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void FileDataCache::EvictLocked() {
    while (used_bytes_ > capacity_ && !lru_.empty()) {
        const std::string& victim = lru_.back();
        auto it = entries_.find(victim);
        used_bytes_ -= static_cast<size_t>(it->second.data->size());
        entries_.erase(it);
        lru_.pop_back();
    }
}

} // namespace storage
} // namespace qfab
