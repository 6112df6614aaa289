#include "qfab/execution/session_config.h"

#include "qfab/core/config.h"
#include "qfab/core/types.h"

namespace qfab {
namespace execution {

SessionConfig CreateSessionConfig(bool sorted_by_time, size_t target_partitions) {
    auto cfg = core::GetConfig();
    SessionConfig config;
    config.batch_size = core::kParquetBatchSize;
    config.target_partitions = target_partitions;
    config.information_schema = true;
    config.listing_table_ignore_subdirectory = false;
    config.dialect = SqlDialect::POSTGRESQL;
    config.bloom_filter_on_read = cfg->common.bloom_filter_enabled;
    if (cfg->common.bloom_filter_disabled_on_search) {
        config.bloom_filter_on_read = false;
    }
    config.split_file_groups_by_statistics = sorted_by_time;
    config.skip_physical_aggregate_schema_check = true;
    return config;
}

} // namespace execution
} // namespace qfab
