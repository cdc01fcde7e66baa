#ifndef CALLPROC_CONFIG_HPP
#define CALLPROC_CONFIG_HPP

#include <cstddef>
#include <string>

namespace callproc {

// -----------------------------------------------------------------------------
// ProcessorConfig - feature flags and DTMF validation tunables
// -----------------------------------------------------------------------------
struct ProcessorConfig {
    // Gate conversation start behind a DTMF challenge on call connect
    bool dtmf_validation_enabled = false;

    // Default bound for wait_for_dtmf_validation_completion
    int dtmf_validation_timeout_ms = 30000;

    // Digits in a generated challenge / required in fixed-PIN mode
    std::size_t challenge_length = 3;
    std::size_t pin_length = 4;

    // TTL of the mirrored dtmf_sequence:<id> key
    int dtmf_sequence_ttl_seconds = 300;

    std::string log_level = "info";

    // Serialize to environment variable format (KEY=value lines)
    std::string to_env_string() const;

    // Deserialize from environment variable format. Throws ConfigError on
    // malformed numeric values; unknown keys are ignored.
    static ProcessorConfig from_env_string(const std::string& env_content);

    // Read the same keys from the process environment
    static ProcessorConfig from_environment();
};

} // namespace callproc

#endif // CALLPROC_CONFIG_HPP
