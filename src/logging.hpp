#ifndef CALLPROC_LOGGING_HPP
#define CALLPROC_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace callproc {
namespace logging {

// Named component logger ("events.processor", "handlers.dtmf_validation", ...).
// All loggers share one stderr sink; created on first use.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// Apply a level name (trace/debug/info/warn/error/critical/off) to every
// existing logger and to loggers created afterwards. Unknown names map to info.
void set_level(const std::string& level_name);

} // namespace logging
} // namespace callproc

#endif // CALLPROC_LOGGING_HPP
