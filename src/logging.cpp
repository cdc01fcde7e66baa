#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace callproc {
namespace logging {

namespace {

constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [%n] %v";

std::mutex& registry_mutex() {
    static std::mutex mu;
    return mu;
}

spdlog::sink_ptr shared_sink() {
    static spdlog::sink_ptr sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return sink;
}

spdlog::level::level_enum& current_level() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    auto existing = spdlog::get(name);
    if (existing) return existing;

    auto logger = std::make_shared<spdlog::logger>(name, shared_sink());
    logger->set_pattern(kPattern);
    logger->set_level(current_level());
    spdlog::register_logger(logger);
    return logger;
}

void set_level(const std::string& level_name) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    auto level = spdlog::level::from_str(level_name);
    // from_str returns off for unknown names; only honour an explicit "off"
    if (level == spdlog::level::off && level_name != "off") {
        level = spdlog::level::info;
    }
    current_level() = level;
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> l) { l->set_level(level); });
}

} // namespace logging
} // namespace callproc
