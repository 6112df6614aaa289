#ifndef QFAB_STORAGE_TMPFS_H_
#define QFAB_STORAGE_TMPFS_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <arrow/buffer.h>

namespace qfab {
namespace storage {

/**
 * @brief Process-wide in-memory scratch store
 *
 * Keys are plain paths such as "{session_id}/part-0.parquet". Sessions clean
 * up after themselves with DeletePrefix.
 */
class Tmpfs {
public:
    static Tmpfs& Instance();

    void Put(const std::string& path, std::shared_ptr<arrow::Buffer> data);
    std::shared_ptr<arrow::Buffer> Get(const std::string& path) const;
    bool Delete(const std::string& path);
    size_t DeletePrefix(const std::string& prefix);

    // (path, size) pairs under prefix, ordered by path
    std::vector<std::pair<std::string, int64_t>> List(const std::string& prefix) const;

    size_t size() const;
    void Clear();

private:
    Tmpfs() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<arrow::Buffer>> files_;
};

} // namespace storage
} // namespace qfab

#endif // QFAB_STORAGE_TMPFS_H_
