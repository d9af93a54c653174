#include "gitshort/logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace gitshort {

namespace {

std::string resolve_level(const std::string& level) {
    if (const char* env = std::getenv("GITSHORT_LOG_LEVEL")) {
        if (*env) return env;
    }
    if (!level.empty()) return level;
    return "info";
}

} // anonymous namespace

void init_logging(const std::string& level) {
    spdlog::drop("gitshort");
    auto logger = spdlog::stderr_color_mt("gitshort");
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v");

    std::string name = resolve_level(level);
    auto lvl = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && name != "off") {
        lvl = spdlog::level::info;
    }
    logger->set_level(lvl);

    spdlog::set_default_logger(logger);
}

} // namespace gitshort
