#ifndef QFAB_CORE_TYPES_H_
#define QFAB_CORE_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qfab {
namespace core {

/**
 * @brief Timestamp in microseconds since Unix epoch
 */
using Timestamp = int64_t;

// Rows per record batch produced by scans and written to Parquet
constexpr size_t kParquetBatchSize = 8192;

// Floor applied to every query memory ceiling (256 MiB)
constexpr size_t kMinQueryMemory = 256 * 1024 * 1024;

// Floor applied when partition resolution yields zero
constexpr size_t kMinPartitions = 2;

// Canonical extension of segment files
constexpr const char* kParquetExtension = ".parquet";

// Streams whose names carry this prefix hold hourly distinct-value observations
constexpr const char* kDistinctStreamPrefix = "distinct_values_";

enum class StreamType {
    LOGS,
    METRICS,
    TRACES,
    ENRICHMENT_TABLES,
    FILE_LIST,
    METADATA,
    INDEX
};

std::string StreamTypeToString(StreamType type);
std::optional<StreamType> ParseStreamType(const std::string& name);

/**
 * @brief Where the files of a search session live
 *
 * MEMORY, WAL and TMPFS are valid for table registration. OBJECT_STORE is the
 * durable tier, addressed directly by path and never registered as a table.
 */
enum class StorageType {
    MEMORY,
    WAL,
    TMPFS,
    OBJECT_STORE
};

std::string StorageTypeToString(StorageType type);

/**
 * @brief Summary of one segment file
 */
struct FileMeta {
    Timestamp min_ts;
    Timestamp max_ts;
    int64_t records;
    int64_t original_size;
    int64_t compressed_size;

    FileMeta() : min_ts(0), max_ts(0), records(0), original_size(0), compressed_size(0) {}

    bool operator==(const FileMeta& other) const {
        return min_ts == other.min_ts && max_ts == other.max_ts && records == other.records &&
               original_size == other.original_size && compressed_size == other.compressed_size;
    }
};

/**
 * @brief Identifies one immutable columnar segment file
 */
struct SegmentFileKey {
    std::string key;          // logical path, e.g. files/default/logs/app/2024/01/01/00/x.parquet
    FileMeta meta;
    bool deleted;             // deletion marker, used by index streams
    std::string schema_key;   // fingerprint of the schema the file was written with

    SegmentFileKey() : deleted(false) {}
    SegmentFileKey(std::string k, FileMeta m, bool d = false)
        : key(std::move(k)), meta(m), deleted(d) {}
};

/**
 * @brief Per-request search session
 */
struct SearchSession {
    std::string id;
    StorageType storage_type;
    std::optional<std::string> work_group;
    size_t target_partitions;

    SearchSession() : storage_type(StorageType::MEMORY), target_partitions(0) {}
};

// (column, descending) pairs
using SortKey = std::vector<std::pair<std::string, bool>>;

} // namespace core
} // namespace qfab

#endif // QFAB_CORE_TYPES_H_
