#include "qfab/core/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <thread>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace qfab {
namespace core {

EngineConfig EngineConfig::Default() {
    EngineConfig config;
    config.common.column_timestamp = "_timestamp";
    config.common.data_dir = "./data/";
    config.common.wal_dir = "./data/wal/";
    config.common.tmp_dir = "";
    config.common.bloom_filter_enabled = true;
    config.common.bloom_filter_disabled_on_search = false;
    config.common.feature_join_match_one_enabled = false;

    config.limit.cpu_num = std::max<size_t>(1, std::thread::hardware_concurrency());
    config.limit.min_partition_num = 2;
    config.limit.file_stat_cache_max_entries = 10000;
    config.limit.distinct_values_hourly = false;

    config.memory_cache.query_memory_pool = "";
    config.memory_cache.query_max_size = 1024ULL * 1024 * 1024;        // 1GB
    config.memory_cache.data_cache_max_size = 256ULL * 1024 * 1024;    // 256MB

    config.search_group.cpu_limit_enabled = false;
    config.search_group.long_cpu_percent = 80;
    config.search_group.long_mem_percent = 80;
    config.search_group.short_cpu_percent = 20;
    config.search_group.short_mem_percent = 20;

    config.log.level = "info";
    return config;
}

namespace {

bool ParseBool(const std::string& raw, bool* out) {
    std::string value = raw;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        *out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool ParseSize(const std::string& raw, size_t* out) {
    if (raw.empty()) return false;
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    try {
        *out = static_cast<size_t>(std::stoull(raw));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

Result<void> EnvString(const char* name, std::string* out) {
    if (const char* v = std::getenv(name)) {
        *out = v;
    }
    return Result<void>();
}

Result<void> EnvBool(const char* name, bool* out) {
    if (const char* v = std::getenv(name)) {
        if (!ParseBool(v, out)) {
            return Result<void>::error(std::string("Invalid boolean for ") + name + ": " + v,
                                       Error::Code::INVALID_CONFIGURATION);
        }
    }
    return Result<void>();
}

Result<void> EnvSize(const char* name, size_t* out) {
    if (const char* v = std::getenv(name)) {
        if (!ParseSize(v, out)) {
            return Result<void>::error(std::string("Invalid number for ") + name + ": " + v,
                                       Error::Code::INVALID_CONFIGURATION);
        }
    }
    return Result<void>();
}

Result<void> EnvPercent(const char* name, uint32_t* out) {
    size_t value = *out;
    auto res = EnvSize(name, &value);
    if (!res.ok()) return res;
    if (value == 0 || value > 100) {
        return Result<void>::error(std::string(name) + " must be in (0, 100]",
                                   Error::Code::INVALID_CONFIGURATION);
    }
    *out = static_cast<uint32_t>(value);
    return Result<void>();
}

// JSON helpers. A missing member keeps the current value; a member of the
// wrong type is a configuration error.
Result<void> JsonString(const rapidjson::Value& obj, const char* name, std::string* out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsString()) {
        return Result<void>::error(std::string("Expected string for ") + name,
                                   Error::Code::INVALID_CONFIGURATION);
    }
    *out = it->value.GetString();
    return Result<void>();
}

Result<void> JsonBool(const rapidjson::Value& obj, const char* name, bool* out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsBool()) {
        return Result<void>::error(std::string("Expected boolean for ") + name,
                                   Error::Code::INVALID_CONFIGURATION);
    }
    *out = it->value.GetBool();
    return Result<void>();
}

Result<void> JsonSize(const rapidjson::Value& obj, const char* name, size_t* out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) return Result<void>();
    if (!it->value.IsUint64()) {
        return Result<void>::error(std::string("Expected unsigned integer for ") + name,
                                   Error::Code::INVALID_CONFIGURATION);
    }
    *out = static_cast<size_t>(it->value.GetUint64());
    return Result<void>();
}

Result<void> JsonPercent(const rapidjson::Value& obj, const char* name, uint32_t* out) {
    size_t value = *out;
    auto res = JsonSize(obj, name, &value);
    if (!res.ok()) return res;
    if (value == 0 || value > 100) {
        return Result<void>::error(std::string(name) + " must be in (0, 100]",
                                   Error::Code::INVALID_CONFIGURATION);
    }
    *out = static_cast<uint32_t>(value);
    return Result<void>();
}

Result<void> RunAll(std::initializer_list<std::function<Result<void>()>> steps) {
    for (const auto& step : steps) {
        auto res = step();
        if (!res.ok()) return res;
    }
    return Result<void>();
}

std::mutex g_config_mutex;
std::shared_ptr<const EngineConfig> g_config;

} // namespace

Result<void> ApplyEnvOverrides(EngineConfig& c) {
    return RunAll({
        [&] { return EnvString("QFAB_COLUMN_TIMESTAMP", &c.common.column_timestamp); },
        [&] { return EnvString("QFAB_DATA_DIR", &c.common.data_dir); },
        [&] { return EnvString("QFAB_WAL_DIR", &c.common.wal_dir); },
        [&] { return EnvString("QFAB_TMP_DIR", &c.common.tmp_dir); },
        [&] { return EnvBool("QFAB_BLOOM_FILTER_ENABLED", &c.common.bloom_filter_enabled); },
        [&] { return EnvBool("QFAB_BLOOM_FILTER_DISABLED_ON_SEARCH", &c.common.bloom_filter_disabled_on_search); },
        [&] { return EnvBool("QFAB_FEATURE_JOIN_MATCH_ONE_ENABLED", &c.common.feature_join_match_one_enabled); },
        [&] { return EnvSize("QFAB_CPU_NUM", &c.limit.cpu_num); },
        [&] { return EnvSize("QFAB_MIN_PARTITION_NUM", &c.limit.min_partition_num); },
        [&] { return EnvSize("QFAB_FILE_STAT_CACHE_MAX_ENTRIES", &c.limit.file_stat_cache_max_entries); },
        [&] { return EnvBool("QFAB_DISTINCT_VALUES_HOURLY", &c.limit.distinct_values_hourly); },
        [&] { return EnvString("QFAB_QUERY_MEMORY_POOL", &c.memory_cache.query_memory_pool); },
        [&] { return EnvSize("QFAB_QUERY_MAX_SIZE", &c.memory_cache.query_max_size); },
        [&] { return EnvSize("QFAB_DATA_CACHE_MAX_SIZE", &c.memory_cache.data_cache_max_size); },
        [&] { return EnvBool("QFAB_SEARCH_GROUP_CPU_LIMIT_ENABLED", &c.search_group.cpu_limit_enabled); },
        [&] { return EnvPercent("QFAB_SEARCH_GROUP_LONG_CPU_PERCENT", &c.search_group.long_cpu_percent); },
        [&] { return EnvPercent("QFAB_SEARCH_GROUP_LONG_MEM_PERCENT", &c.search_group.long_mem_percent); },
        [&] { return EnvPercent("QFAB_SEARCH_GROUP_SHORT_CPU_PERCENT", &c.search_group.short_cpu_percent); },
        [&] { return EnvPercent("QFAB_SEARCH_GROUP_SHORT_MEM_PERCENT", &c.search_group.short_mem_percent); },
        [&] { return EnvString("QFAB_LOG_LEVEL", &c.log.level); },
    });
}

Result<EngineConfig> LoadConfigFromJson(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "Invalid config JSON at offset " << doc.GetErrorOffset() << ": "
            << rapidjson::GetParseError_En(doc.GetParseError());
        return Result<EngineConfig>::error(oss.str(), Error::Code::INVALID_CONFIGURATION);
    }
    if (!doc.IsObject()) {
        return Result<EngineConfig>::error("Config JSON must be an object", Error::Code::INVALID_CONFIGURATION);
    }

    EngineConfig c = EngineConfig::Default();
    static const rapidjson::Value kEmpty(rapidjson::kObjectType);
    auto section = [&doc](const char* name) -> const rapidjson::Value& {
        auto it = doc.FindMember(name);
        if (it == doc.MemberEnd() || !it->value.IsObject()) return kEmpty;
        return it->value;
    };
    const auto& common = section("common");
    const auto& limit = section("limit");
    const auto& memory = section("memory_cache");
    const auto& group = section("search_group");
    const auto& log = section("log");

    auto res = RunAll({
        [&] { return JsonString(common, "column_timestamp", &c.common.column_timestamp); },
        [&] { return JsonString(common, "data_dir", &c.common.data_dir); },
        [&] { return JsonString(common, "wal_dir", &c.common.wal_dir); },
        [&] { return JsonString(common, "tmp_dir", &c.common.tmp_dir); },
        [&] { return JsonBool(common, "bloom_filter_enabled", &c.common.bloom_filter_enabled); },
        [&] { return JsonBool(common, "bloom_filter_disabled_on_search", &c.common.bloom_filter_disabled_on_search); },
        [&] { return JsonBool(common, "feature_join_match_one_enabled", &c.common.feature_join_match_one_enabled); },
        [&] { return JsonSize(limit, "cpu_num", &c.limit.cpu_num); },
        [&] { return JsonSize(limit, "min_partition_num", &c.limit.min_partition_num); },
        [&] { return JsonSize(limit, "file_stat_cache_max_entries", &c.limit.file_stat_cache_max_entries); },
        [&] { return JsonBool(limit, "distinct_values_hourly", &c.limit.distinct_values_hourly); },
        [&] { return JsonString(memory, "query_memory_pool", &c.memory_cache.query_memory_pool); },
        [&] { return JsonSize(memory, "query_max_size", &c.memory_cache.query_max_size); },
        [&] { return JsonSize(memory, "data_cache_max_size", &c.memory_cache.data_cache_max_size); },
        [&] { return JsonBool(group, "cpu_limit_enabled", &c.search_group.cpu_limit_enabled); },
        [&] { return JsonPercent(group, "long_cpu_percent", &c.search_group.long_cpu_percent); },
        [&] { return JsonPercent(group, "long_mem_percent", &c.search_group.long_mem_percent); },
        [&] { return JsonPercent(group, "short_cpu_percent", &c.search_group.short_cpu_percent); },
        [&] { return JsonPercent(group, "short_mem_percent", &c.search_group.short_mem_percent); },
        [&] { return JsonString(log, "level", &c.log.level); },
    });
    if (!res.ok()) {
        return Result<EngineConfig>::error(res);
    }
    return Result<EngineConfig>(std::move(c));
}

Result<EngineConfig> LoadConfigFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        return Result<EngineConfig>::error("Cannot open config file " + path, Error::Code::INVALID_CONFIGURATION);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return LoadConfigFromJson(ss.str());
}

std::shared_ptr<const EngineConfig> GetConfig() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    if (!g_config) {
        g_config = std::make_shared<const EngineConfig>(EngineConfig::Default());
    }
    return g_config;
}

void SetConfig(const EngineConfig& config) {
    auto next = std::make_shared<const EngineConfig>(config);
    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_config = std::move(next);
}

} // namespace core
} // namespace qfab
