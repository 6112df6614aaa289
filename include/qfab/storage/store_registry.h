#ifndef QFAB_STORAGE_STORE_REGISTRY_H_
#define QFAB_STORAGE_STORE_REGISTRY_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "qfab/core/result.h"
#include "qfab/storage/object_store.h"

namespace qfab {
namespace storage {

/**
 * @brief Parsed "scheme://host/path" location
 */
struct StoreUrl {
    std::string scheme;
    std::string host;
    std::string path;   // without the leading '/'

    // "scheme://host"
    std::string store_key() const { return scheme + "://" + host; }
    std::string ToString() const { return scheme + "://" + host + "/" + path; }
};

core::Result<StoreUrl> ParseStoreUrl(const std::string& url);

// True for memory, wal, tmpfs and file
bool IsSupportedScheme(const std::string& scheme);

/**
 * @brief Per-context map from "scheme://host" to an object store
 */
class StoreRegistry {
public:
    StoreRegistry() = default;

    // Registering an already known scheme/host keeps the first instance and
    // returns it.
    core::Result<std::shared_ptr<ObjectStore>> Register(const std::string& url,
                                                        std::shared_ptr<ObjectStore> store);

    core::Result<std::shared_ptr<ObjectStore>> Resolve(const std::string& url) const;

    std::vector<std::string> RegisteredUrls() const;

private:
    mutable std::mutex mutex_;
    absl::flat_hash_map<std::string, std::shared_ptr<ObjectStore>> stores_;
};

/**
 * @brief Builds a registry with memory:///, wal:///, tmpfs:/// and file:///
 */
std::shared_ptr<StoreRegistry> CreateDefaultStoreRegistry(const std::string& data_dir,
                                                          const std::string& wal_dir);

} // namespace storage
} // namespace qfab

#endif // QFAB_STORAGE_STORE_REGISTRY_H_
