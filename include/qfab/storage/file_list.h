#ifndef QFAB_STORAGE_FILE_LIST_H_
#define QFAB_STORAGE_FILE_LIST_H_

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "qfab/core/result.h"
#include "qfab/core/types.h"

namespace qfab {
namespace storage {

class FileListRegistry;

/**
 * @brief Keeps one staged file list alive
 *
 * Move-only. The staged entry disappears when its last lease is released.
 */
class FileListLease {
public:
    FileListLease() = default;
    ~FileListLease();

    FileListLease(FileListLease&& other) noexcept;
    FileListLease& operator=(FileListLease&& other) noexcept;
    FileListLease(const FileListLease&) = delete;
    FileListLease& operator=(const FileListLease&) = delete;

    bool valid() const { return registry_ != nullptr; }
    const std::string& key() const { return key_; }
    void Release();

private:
    friend class FileListRegistry;
    FileListLease(FileListRegistry* registry, std::string key)
        : registry_(registry), key_(std::move(key)) {}

    FileListRegistry* registry_ = nullptr;
    std::string key_;
};

/**
 * @brief Process-wide staging area for per-session file lists
 *
 * The memory and wal routers list exactly what was staged here, keyed by
 * "{session_id}/schema={schema_key}/".
 */
class FileListRegistry {
public:
    static FileListRegistry& Instance();

    // Stages files under (session_id, schema_key). Staging the same key again
    // replaces the list and adds a lease.
    core::Result<FileListLease> Set(const std::string& session_id,
                                    const std::string& schema_key,
                                    std::vector<core::SegmentFileKey> files);

    std::optional<std::vector<core::SegmentFileKey>> Get(const std::string& session_id,
                                                         const std::string& schema_key) const;

    bool Contains(const std::string& session_id, const std::string& schema_key) const;

    // Number of staged entries whose key starts with "{session_id}/"
    size_t CountForSession(const std::string& session_id) const;
    size_t Size() const;

    static std::string MakeKey(const std::string& session_id, const std::string& schema_key);

private:
    friend class FileListLease;
    FileListRegistry() = default;

    void Release(const std::string& key);

    struct Entry {
        std::shared_ptr<const std::vector<core::SegmentFileKey>> files;
        size_t leases = 0;
    };

    mutable std::mutex mutex_;
    absl::flat_hash_map<std::string, Entry> entries_;
};

} // namespace storage
} // namespace qfab

#endif // QFAB_STORAGE_FILE_LIST_H_
