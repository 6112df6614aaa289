#include "qfab/storage/store_registry.h"

#include <algorithm>
#include <cctype>

#include "qfab/common/logger.h"

namespace qfab {
namespace storage {

core::Result<StoreUrl> ParseStoreUrl(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return core::Result<StoreUrl>::error("Invalid store url: " + url, core::Error::Code::INVALID_ARGUMENT);
    }
    StoreUrl out;
    out.scheme = url.substr(0, sep);
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        out.host = rest;
    } else {
        out.host = rest.substr(0, slash);
        out.path = rest.substr(slash + 1);
    }
    return core::Result<StoreUrl>(std::move(out));
}

bool IsSupportedScheme(const std::string& scheme) {
    return scheme == "memory" || scheme == "wal" || scheme == "tmpfs" || scheme == "file";
}

core::Result<std::shared_ptr<ObjectStore>> StoreRegistry::Register(const std::string& url,
                                                                   std::shared_ptr<ObjectStore> store) {
    auto parsed = ParseStoreUrl(url);
    if (!parsed.ok()) {
        return core::Result<std::shared_ptr<ObjectStore>>::error(parsed);
    }
    if (!IsSupportedScheme(parsed.value().scheme)) {
        return core::Result<std::shared_ptr<ObjectStore>>::error(
            "Unsupported storage backend: " + parsed.value().scheme,
            core::Error::Code::UNSUPPORTED_STORAGE_BACKEND);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = stores_.try_emplace(parsed.value().store_key(), std::move(store));
    if (!inserted) {
        QFAB_DEBUG("[store_registry] {} already registered, keeping first instance", parsed.value().store_key());
    }
    return core::Result<std::shared_ptr<ObjectStore>>(it->second);
}

core::Result<std::shared_ptr<ObjectStore>> StoreRegistry::Resolve(const std::string& url) const {
    auto parsed = ParseStoreUrl(url);
    if (!parsed.ok()) {
        return core::Result<std::shared_ptr<ObjectStore>>::error(parsed);
    }
    if (!IsSupportedScheme(parsed.value().scheme)) {
        return core::Result<std::shared_ptr<ObjectStore>>::error(
            "Unsupported storage backend: " + parsed.value().scheme,
            core::Error::Code::UNSUPPORTED_STORAGE_BACKEND);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(parsed.value().store_key());
    if (it == stores_.end()) {
        return core::Result<std::shared_ptr<ObjectStore>>::error(
            "No object store registered for " + parsed.value().store_key(), core::Error::Code::NOT_FOUND);
    }
    return core::Result<std::shared_ptr<ObjectStore>>(it->second);
}

std::vector<std::string> StoreRegistry::RegisteredUrls() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, store] : stores_) {
            out.push_back(key + "/");
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::shared_ptr<StoreRegistry> CreateDefaultStoreRegistry(const std::string& data_dir,
                                                          const std::string& wal_dir) {
    auto registry = std::make_shared<StoreRegistry>();
    auto durable = std::make_shared<LocalObjectStore>(data_dir);
    auto must = [](core::Result<std::shared_ptr<ObjectStore>> res) {
        if (!res.ok()) {
            throw core::InternalError("Failed to register default store: " + res.error());
        }
    };
    must(registry->Register("memory:///", std::make_shared<ObjectStore>(MemoryStore(durable))));
    must(registry->Register("wal:///", std::make_shared<ObjectStore>(WalStore(wal_dir))));
    must(registry->Register("tmpfs:///", std::make_shared<ObjectStore>(TmpfsStore())));
    must(registry->Register("file:///", std::make_shared<ObjectStore>(LocalObjectStore(data_dir))));
    return registry;
}

} // namespace storage
} // namespace qfab
