#ifndef MNEMO_COMMON_LOGGER_H_
#define MNEMO_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace mnemo {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace mnemo

// Macros for convenient logging
#define MNEMO_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MNEMO_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MNEMO_INFO(...)  spdlog::info(__VA_ARGS__)
#define MNEMO_WARN(...)  spdlog::warn(__VA_ARGS__)
#define MNEMO_ERROR(...) spdlog::error(__VA_ARGS__)
#define MNEMO_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // MNEMO_COMMON_LOGGER_H_
