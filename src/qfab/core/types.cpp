#include "qfab/core/types.h"

namespace qfab {
namespace core {

std::string StreamTypeToString(StreamType type) {
    switch (type) {
        case StreamType::LOGS: return "logs";
        case StreamType::METRICS: return "metrics";
        case StreamType::TRACES: return "traces";
        case StreamType::ENRICHMENT_TABLES: return "enrichment_tables";
        case StreamType::FILE_LIST: return "file_list";
        case StreamType::METADATA: return "metadata";
        case StreamType::INDEX: return "index";
    }
    return "logs";
}

std::optional<StreamType> ParseStreamType(const std::string& name) {
    if (name == "logs") return StreamType::LOGS;
    if (name == "metrics") return StreamType::METRICS;
    if (name == "traces") return StreamType::TRACES;
    if (name == "enrichment_tables") return StreamType::ENRICHMENT_TABLES;
    if (name == "file_list") return StreamType::FILE_LIST;
    if (name == "metadata") return StreamType::METADATA;
    if (name == "index") return StreamType::INDEX;
    return std::nullopt;
}

std::string StorageTypeToString(StorageType type) {
    switch (type) {
        case StorageType::MEMORY: return "memory";
        case StorageType::WAL: return "wal";
        case StorageType::TMPFS: return "tmpfs";
        case StorageType::OBJECT_STORE: return "object_store";
    }
    return "unknown";
}

} // namespace core
} // namespace qfab
