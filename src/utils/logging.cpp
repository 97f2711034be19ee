#include "devmux/utils/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace devmux {
namespace utils {

namespace {
const char* const kLoggerName = "devmux";

std::shared_ptr<spdlog::logger> createLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::info);
    return created;
}
} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = createLogger();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace utils
} // namespace devmux
