#include "lpm/log.hpp"
#include "lpm/errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace lpm {

void setup_logging(const std::string& level) {
    spdlog::level::level_enum lvl;
    if (level == "trace") lvl = spdlog::level::trace;
    else if (level == "debug") lvl = spdlog::level::debug;
    else if (level == "info") lvl = spdlog::level::info;
    else if (level == "warn") lvl = spdlog::level::warn;
    else if (level == "error") lvl = spdlog::level::err;
    else if (level == "off") lvl = spdlog::level::off;
    else throw ConfigError("unknown log level: " + level);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("lpm", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace lpm
