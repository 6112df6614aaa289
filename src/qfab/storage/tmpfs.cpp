#include "qfab/storage/tmpfs.h"

namespace qfab {
namespace storage {

Tmpfs& Tmpfs::Instance() {
    static Tmpfs instance;
    return instance;
}

void Tmpfs::Put(const std::string& path, std::shared_ptr<arrow::Buffer> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = std::move(data);
}

std::shared_ptr<arrow::Buffer> Tmpfs::Get(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    return it == files_.end() ? nullptr : it->second;
}

bool Tmpfs::Delete(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.erase(path) > 0;
}

size_t Tmpfs::DeletePrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    auto it = files_.lower_bound(prefix);
    while (it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = files_.erase(it);
        removed++;
    }
    return removed;
}

std::vector<std::pair<std::string, int64_t>> Tmpfs::List(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, int64_t>> out;
    for (auto it = files_.lower_bound(prefix);
         it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        out.emplace_back(it->first, it->second ? it->second->size() : 0);
    }
    return out;
}

size_t Tmpfs::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

void Tmpfs::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.clear();
}

} // namespace storage
} // namespace qfab
