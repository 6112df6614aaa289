#ifndef QFAB_COMMON_LOGGER_H_
#define QFAB_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace qfab {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    // Accepts spdlog level names ("trace", "debug", "info", ...). Unknown names
    // leave the current level untouched and return false.
    static bool SetLevel(const std::string& level_name);
};

} // namespace common
} // namespace qfab

// Macros for convenient logging
#define QFAB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define QFAB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define QFAB_INFO(...)  spdlog::info(__VA_ARGS__)
#define QFAB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define QFAB_ERROR(...) spdlog::error(__VA_ARGS__)
#define QFAB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // QFAB_COMMON_LOGGER_H_
