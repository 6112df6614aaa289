#include "qfab/storage/file_list.h"

#include "qfab/common/logger.h"

namespace qfab {
namespace storage {

FileListLease::~FileListLease() {
    Release();
}

FileListLease::FileListLease(FileListLease&& other) noexcept
    : registry_(other.registry_), key_(std::move(other.key_)) {
    other.registry_ = nullptr;
}

FileListLease& FileListLease::operator=(FileListLease&& other) noexcept {
    if (this != &other) {
        Release();
        registry_ = other.registry_;
        key_ = std::move(other.key_);
        other.registry_ = nullptr;
    }
    return *this;
}

void FileListLease::Release() {
    if (registry_) {
        registry_->Release(key_);
        registry_ = nullptr;
    }
}

FileListRegistry& FileListRegistry::Instance() {
    static FileListRegistry instance;
    return instance;
}

std::string FileListRegistry::MakeKey(const std::string& session_id, const std::string& schema_key) {
    return session_id + "/schema=" + schema_key + "/";
}

core::Result<FileListLease> FileListRegistry::Set(const std::string& session_id,
                                                  const std::string& schema_key,
                                                  std::vector<core::SegmentFileKey> files) {
    if (session_id.empty() || schema_key.empty()) {
        return core::Result<FileListLease>::error("Cannot stage a file list without session id and schema key",
                                                  core::Error::Code::INVALID_ARGUMENT);
    }
    if (session_id.find('/') != std::string::npos) {
        return core::Result<FileListLease>::error("Session id must not contain '/': " + session_id,
                                                  core::Error::Code::INVALID_ARGUMENT);
    }
    std::string key = MakeKey(session_id, schema_key);
    size_t count = files.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_[key];
        entry.files = std::make_shared<const std::vector<core::SegmentFileKey>>(std::move(files));
        entry.leases++;
    }
    QFAB_DEBUG("[file_list] staged {} files under {}", count, key);
    return core::Result<FileListLease>(FileListLease(this, key));
}

std::optional<std::vector<core::SegmentFileKey>> FileListRegistry::Get(const std::string& session_id,
                                                                       const std::string& schema_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(MakeKey(session_id, schema_key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it->second.files;
}

bool FileListRegistry::Contains(const std::string& session_id, const std::string& schema_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(MakeKey(session_id, schema_key));
}

size_t FileListRegistry::CountForSession(const std::string& session_id) const {
    std::string prefix = session_id + "/";
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [key, entry] : entries_) {
        if (key.compare(0, prefix.size(), prefix) == 0) n++;
    }
    return n;
}

size_t FileListRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void FileListRegistry::Release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;
    if (--it->second.leases == 0) {
        entries_.erase(it);
        QFAB_DEBUG("[file_list] released {}", key);
    }
}

} // namespace storage
} // namespace qfab
