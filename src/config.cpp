#include "config.hpp"
#include "errors.hpp"
#include "helpers.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace callproc {

using utils::parse_bool;
using utils::trim;

namespace {

constexpr const char* kKeys[] = {
    "DTMF_VALIDATION_ENABLED",
    "DTMF_VALIDATION_TIMEOUT_MS",
    "DTMF_CHALLENGE_LENGTH",
    "DTMF_PIN_LENGTH",
    "DTMF_SEQUENCE_TTL_SECONDS",
    "LOG_LEVEL",
};

long parse_number(const std::string& key, const std::string& value, long min_value) {
    std::size_t pos = 0;
    long n = 0;
    try {
        n = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw ConfigError("Invalid numeric value for " + key + ": '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigError("Invalid numeric value for " + key + ": '" + value + "'");
    }
    if (n < min_value) {
        throw ConfigError(key + " must be >= " + std::to_string(min_value));
    }
    return n;
}

void apply(ProcessorConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "DTMF_VALIDATION_ENABLED") {
        cfg.dtmf_validation_enabled = parse_bool(value);
    } else if (key == "DTMF_VALIDATION_TIMEOUT_MS") {
        cfg.dtmf_validation_timeout_ms = static_cast<int>(parse_number(key, value, 0));
    } else if (key == "DTMF_CHALLENGE_LENGTH") {
        cfg.challenge_length = static_cast<std::size_t>(parse_number(key, value, 1));
    } else if (key == "DTMF_PIN_LENGTH") {
        cfg.pin_length = static_cast<std::size_t>(parse_number(key, value, 1));
    } else if (key == "DTMF_SEQUENCE_TTL_SECONDS") {
        cfg.dtmf_sequence_ttl_seconds = static_cast<int>(parse_number(key, value, 0));
    } else if (key == "LOG_LEVEL") {
        cfg.log_level = utils::to_lower(value);
    }
}

} // namespace

std::string ProcessorConfig::to_env_string() const {
    std::ostringstream oss;
    oss << "DTMF_VALIDATION_ENABLED=" << (dtmf_validation_enabled ? "true" : "false") << "\n"
        << "DTMF_VALIDATION_TIMEOUT_MS=" << dtmf_validation_timeout_ms << "\n"
        << "DTMF_CHALLENGE_LENGTH=" << challenge_length << "\n"
        << "DTMF_PIN_LENGTH=" << pin_length << "\n"
        << "DTMF_SEQUENCE_TTL_SECONDS=" << dtmf_sequence_ttl_seconds << "\n"
        << "LOG_LEVEL=" << log_level << "\n";
    return oss.str();
}

ProcessorConfig ProcessorConfig::from_env_string(const std::string& env_content) {
    ProcessorConfig cfg;
    std::istringstream in(env_content);
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        apply(cfg, key, value);
    }
    return cfg;
}

ProcessorConfig ProcessorConfig::from_environment() {
    ProcessorConfig cfg;
    for (const char* key : kKeys) {
        const char* value = std::getenv(key);
        if (value) apply(cfg, key, trim(value));
    }
    return cfg;
}

} // namespace callproc
