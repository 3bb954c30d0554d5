#ifndef LPM_LOG_HPP
#define LPM_LOG_HPP

#include <string>

namespace lpm {

// Installs the default spdlog logger: colour sink on stderr (stdout carries
// the JSON report). Levels: trace, debug, info, warn, error, off.
// Throws ConfigError for an unknown level.
void setup_logging(const std::string& level);

} // namespace lpm

#endif // LPM_LOG_HPP
