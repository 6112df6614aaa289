#ifndef QFAB_EXECUTION_RUNTIME_ENV_H_
#define QFAB_EXECUTION_RUNTIME_ENV_H_

#include <cstddef>
#include <memory>
#include <string>

#include "qfab/core/result.h"
#include "qfab/execution/memory_pool.h"
#include "qfab/storage/file_statistics_cache.h"
#include "qfab/storage/store_registry.h"

namespace qfab {
namespace execution {

/**
 * @brief Runtime resources of one execution context
 */
struct RuntimeEnv {
    std::shared_ptr<MemoryPool> memory_pool;
    std::shared_ptr<storage::StoreRegistry> object_stores;
    // Null when the shared statistics cache is disabled
    storage::FileStatisticsCache* file_statistics_cache = nullptr;
    std::string tmp_dir;
};

/**
 * @brief Builds the runtime for a context with the given memory ceiling
 *
 * The ceiling is raised to 256 MiB when lower. Fails with
 * INVALID_CONFIGURATION for an unknown memory pool strategy.
 */
core::Result<std::shared_ptr<RuntimeEnv>> CreateRuntimeEnv(size_t memory_size);

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_RUNTIME_ENV_H_
