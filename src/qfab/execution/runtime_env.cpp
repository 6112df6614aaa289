#include "qfab/execution/runtime_env.h"

#include <algorithm>
#include <filesystem>

#include "qfab/common/logger.h"
#include "qfab/core/config.h"
#include "qfab/core/types.h"
#include "qfab/storage/file_data_cache.h"

namespace qfab {
namespace execution {

core::Result<std::shared_ptr<RuntimeEnv>> CreateRuntimeEnv(size_t memory_size) {
    using EnvResult = core::Result<std::shared_ptr<RuntimeEnv>>;
    auto cfg = core::GetConfig();

    auto kind = ParseMemoryPoolKind(cfg->memory_cache.query_memory_pool);
    if (!kind.ok()) {
        QFAB_ERROR("[runtime] {}", kind.error());
        return EnvResult::error(kind);
    }

    size_t pool_size = std::max(memory_size, core::kMinQueryMemory);

    auto env = std::make_shared<RuntimeEnv>();
    env->memory_pool = CreateMemoryPool(kind.value(), pool_size);
    env->object_stores = storage::CreateDefaultStoreRegistry(cfg->common.data_dir, cfg->common.wal_dir);
    // The process-wide caches follow the limits current at env creation
    storage::FileDataCache::Instance().SetCapacity(cfg->memory_cache.data_cache_max_size);
    if (cfg->limit.file_stat_cache_max_entries > 0) {
        auto& cache = storage::FileStatisticsCache::Instance();
        cache.SetMaxEntries(cfg->limit.file_stat_cache_max_entries);
        env->file_statistics_cache = &cache;
    }
    if (cfg->common.tmp_dir.empty()) {
        std::error_code ec;
        auto tmp = std::filesystem::temp_directory_path(ec);
        env->tmp_dir = ec ? "/tmp" : tmp.string();
    } else {
        env->tmp_dir = cfg->common.tmp_dir;
    }
    QFAB_DEBUG("[runtime] memory pool {} with {} bytes", MemoryPoolKindToString(kind.value()), pool_size);
    return EnvResult(std::move(env));
}

} // namespace execution
} // namespace qfab
