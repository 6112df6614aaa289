#ifndef QFAB_EXECUTION_SESSION_CONFIG_H_
#define QFAB_EXECUTION_SESSION_CONFIG_H_

#include <cstddef>
#include <string>

namespace qfab {
namespace execution {

// PostgreSQL folds unquoted identifiers to lower case, Generic keeps them as
// written
enum class SqlDialect {
    POSTGRESQL,
    GENERIC
};

/**
 * @brief Per-context planner and execution options
 */
struct SessionConfig {
    size_t batch_size;
    size_t target_partitions;
    bool information_schema;
    bool listing_table_ignore_subdirectory;
    SqlDialect dialect;
    bool bloom_filter_on_read;
    bool split_file_groups_by_statistics;
    bool skip_physical_aggregate_schema_check;

    SessionConfig()
        : batch_size(8192), target_partitions(1), information_schema(false),
          listing_table_ignore_subdirectory(true), dialect(SqlDialect::POSTGRESQL),
          bloom_filter_on_read(false), split_file_groups_by_statistics(false),
          skip_physical_aggregate_schema_check(false) {}
};

/**
 * @brief Session options for a search or compaction request
 *
 * Reads the bloom filter switches from the process configuration. The
 * force-disable switch wins over the enable switch.
 */
SessionConfig CreateSessionConfig(bool sorted_by_time, size_t target_partitions);

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_SESSION_CONFIG_H_
