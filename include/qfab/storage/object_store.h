#ifndef QFAB_STORAGE_OBJECT_STORE_H_
#define QFAB_STORAGE_OBJECT_STORE_H_

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <arrow/buffer.h>

#include "qfab/core/result.h"

namespace qfab {
namespace storage {

/**
 * @brief One object returned by a listing
 *
 * location is relative to the store root and never starts with '/'.
 */
struct ObjectMeta {
    std::string location;
    int64_t size = 0;

    bool operator==(const ObjectMeta& other) const {
        return location == other.location && size == other.size;
    }
};

/**
 * @brief Components of a staged object path "{session}/schema={key}/{file_key}"
 */
struct StagedPath {
    std::string session_id;
    std::string schema_key;
    std::string file_key;   // may be empty for a bare prefix
};

std::optional<StagedPath> ParseStagedPath(const std::string& path);

/**
 * @brief Durable store on local disk, rooted at a directory
 */
class LocalObjectStore {
public:
    explicit LocalObjectStore(std::string root);

    core::Result<std::shared_ptr<arrow::Buffer>> Get(const std::string& path) const;
    core::Result<std::shared_ptr<arrow::Buffer>> GetRange(const std::string& path, int64_t offset,
                                                          int64_t length) const;
    core::Result<ObjectMeta> Head(const std::string& path) const;
    core::Result<std::vector<ObjectMeta>> List(const std::string& prefix) const;
    core::Result<void> Put(const std::string& path, const std::shared_ptr<arrow::Buffer>& data);
    core::Result<void> Delete(const std::string& path);

    const std::string& root() const { return root_; }
    static const char* name() { return "file"; }

private:
    std::string FullPath(const std::string& path) const;

    std::string root_;
};

/**
 * @brief Read-only router over the ephemeral shared file cache
 *
 * Lists what FileListRegistry staged. Bytes come from FileDataCache and fall
 * back to the durable store, populating the cache on a miss. A ranged read
 * that misses the cache reads only the range and leaves the cache alone.
 */
class MemoryStore {
public:
    explicit MemoryStore(std::shared_ptr<LocalObjectStore> durable);

    core::Result<std::shared_ptr<arrow::Buffer>> Get(const std::string& path) const;
    core::Result<std::shared_ptr<arrow::Buffer>> GetRange(const std::string& path, int64_t offset,
                                                          int64_t length) const;
    core::Result<ObjectMeta> Head(const std::string& path) const;
    core::Result<std::vector<ObjectMeta>> List(const std::string& prefix) const;
    core::Result<void> Put(const std::string& path, const std::shared_ptr<arrow::Buffer>& data);
    core::Result<void> Delete(const std::string& path);

    static const char* name() { return "memory"; }

private:
    std::shared_ptr<LocalObjectStore> durable_;
};

/**
 * @brief Read-only router over write-ahead staging files in wal_dir
 */
class WalStore {
public:
    explicit WalStore(std::string wal_dir);

    core::Result<std::shared_ptr<arrow::Buffer>> Get(const std::string& path) const;
    core::Result<std::shared_ptr<arrow::Buffer>> GetRange(const std::string& path, int64_t offset,
                                                          int64_t length) const;
    core::Result<ObjectMeta> Head(const std::string& path) const;
    core::Result<std::vector<ObjectMeta>> List(const std::string& prefix) const;
    core::Result<void> Put(const std::string& path, const std::shared_ptr<arrow::Buffer>& data);
    core::Result<void> Delete(const std::string& path);

    static const char* name() { return "wal"; }

private:
    LocalObjectStore disk_;
};

/**
 * @brief Router over the process-wide Tmpfs scratch store
 */
class TmpfsStore {
public:
    core::Result<std::shared_ptr<arrow::Buffer>> Get(const std::string& path) const;
    core::Result<std::shared_ptr<arrow::Buffer>> GetRange(const std::string& path, int64_t offset,
                                                          int64_t length) const;
    core::Result<ObjectMeta> Head(const std::string& path) const;
    core::Result<std::vector<ObjectMeta>> List(const std::string& prefix) const;
    core::Result<void> Put(const std::string& path, const std::shared_ptr<arrow::Buffer>& data);
    core::Result<void> Delete(const std::string& path);

    static const char* name() { return "tmpfs"; }
};

/**
 * @brief Tagged union over the storage backends
 *
 * Every call is forwarded to the active alternative.
 */
class ObjectStore {
public:
    using Variant = std::variant<MemoryStore, WalStore, TmpfsStore, LocalObjectStore>;

    template <class T, std::enable_if_t<!std::is_same_v<std::decay_t<T>, ObjectStore>, int> = 0>
    explicit ObjectStore(T&& impl) : store_(std::forward<T>(impl)) {}

    template <class Lambda>
    auto delegate(Lambda&& l) const {
        return std::visit([&](const auto& impl) { return l(impl); }, store_);
    }

    template <class Lambda>
    auto delegate_mut(Lambda&& l) {
        return std::visit([&](auto& impl) { return l(impl); }, store_);
    }

    core::Result<std::shared_ptr<arrow::Buffer>> Get(const std::string& path) const {
        return delegate([&](const auto& impl) { return impl.Get(path); });
    }

    // Bytes [offset, offset + length), cut short at the end of the object
    core::Result<std::shared_ptr<arrow::Buffer>> GetRange(const std::string& path, int64_t offset,
                                                          int64_t length) const {
        return delegate([&](const auto& impl) { return impl.GetRange(path, offset, length); });
    }

    core::Result<ObjectMeta> Head(const std::string& path) const {
        return delegate([&](const auto& impl) { return impl.Head(path); });
    }

    core::Result<std::vector<ObjectMeta>> List(const std::string& prefix) const {
        return delegate([&](const auto& impl) { return impl.List(prefix); });
    }

    core::Result<void> Put(const std::string& path, const std::shared_ptr<arrow::Buffer>& data) {
        return delegate_mut([&](auto& impl) { return impl.Put(path, data); });
    }

    core::Result<void> Delete(const std::string& path) {
        return delegate_mut([&](auto& impl) { return impl.Delete(path); });
    }

    std::string name() const {
        return delegate([](const auto& impl) { return std::string(impl.name()); });
    }

    template <class T>
    bool is() const { return std::holds_alternative<T>(store_); }

private:
    Variant store_;
};

} // namespace storage
} // namespace qfab

#endif // QFAB_STORAGE_OBJECT_STORE_H_
