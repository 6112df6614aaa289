#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "qfab/core/result.h"

namespace qfab {
namespace core {

/**
 * @brief Settings shared by every component
 */
struct CommonConfig {
    std::string column_timestamp;          // Name of the time column
    std::string data_dir;                  // Root of the durable object store
    std::string wal_dir;                   // Root of write-ahead staging files
    std::string tmp_dir;                   // Spill directory, empty = system temp
    bool bloom_filter_enabled;             // Consult bloom filters on read
    bool bloom_filter_disabled_on_search;  // Force-disable, wins over bloom_filter_enabled
    bool feature_join_match_one_enabled;   // Install the match-one join planner

    CommonConfig() : bloom_filter_enabled(false), bloom_filter_disabled_on_search(false),
                     feature_join_match_one_enabled(false) {}
};

/**
 * @brief Parallelism and sizing limits
 */
struct LimitConfig {
    size_t cpu_num;                        // Default worker parallelism
    size_t min_partition_num;              // Lower bound for requested partitions
    size_t file_stat_cache_max_entries;    // 0 disables the shared statistics cache
    bool distinct_values_hourly;           // Roll up distinct-value streams on compaction

    LimitConfig() : cpu_num(0), min_partition_num(0), file_stat_cache_max_entries(0),
                    distinct_values_hourly(false) {}
};

/**
 * @brief Query memory settings
 */
struct MemoryCacheConfig {
    std::string query_memory_pool;         // "", "greedy", "fair" or "none"
    size_t query_max_size;                 // Nominal memory ceiling per context (bytes)
    size_t data_cache_max_size;            // Capacity of the ephemeral file cache (bytes)

    MemoryCacheConfig() : query_max_size(0), data_cache_max_size(0) {}
};

/**
 * @brief Multi-tenant workgroup settings
 */
struct SearchGroupConfig {
    bool cpu_limit_enabled;
    uint32_t long_cpu_percent;
    uint32_t long_mem_percent;
    uint32_t short_cpu_percent;
    uint32_t short_mem_percent;

    SearchGroupConfig() : cpu_limit_enabled(false), long_cpu_percent(0), long_mem_percent(0),
                          short_cpu_percent(0), short_mem_percent(0) {}
};

struct LogConfig {
    std::string level;
};

/**
 * @brief Process-wide engine configuration
 */
struct EngineConfig {
    CommonConfig common;
    LimitConfig limit;
    MemoryCacheConfig memory_cache;
    SearchGroupConfig search_group;
    LogConfig log;

    static EngineConfig Default();
};

/**
 * @brief Applies QFAB_* environment variables on top of the given config
 *
 * Malformed numeric or boolean values fail with INVALID_CONFIGURATION.
 */
Result<void> ApplyEnvOverrides(EngineConfig& config);

/**
 * @brief Loads a JSON document shaped like EngineConfig on top of the defaults
 */
Result<EngineConfig> LoadConfigFromJson(const std::string& json);
Result<EngineConfig> LoadConfigFromFile(const std::string& path);

// Process-wide configuration. GetConfig() never returns null.
std::shared_ptr<const EngineConfig> GetConfig();
void SetConfig(const EngineConfig& config);

} // namespace core
} // namespace qfab
