#ifndef CALLPROC_HELPERS_HPP
#define CALLPROC_HELPERS_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace callproc {

using Bytes = std::vector<uint8_t>;
using Json  = nlohmann::json;

namespace utils {

    // String helpers
    std::string to_lower(const std::string& s);
    std::string trim(const std::string& s);
    bool        is_all_digits(const std::string& s);
    Bytes       to_bytes(const std::string& s);

    // true/1/yes/on (case-insensitive)
    bool parse_bool(const std::string& s);

    // Current UTC time, ISO-8601 with trailing 'Z'
    std::string utc_timestamp();

    // Seconds since epoch with sub-second precision
    double epoch_seconds();

    // Uniformly random decimal digits (libsodium CSPRNG)
    std::string random_digits(std::size_t count);

    // Typed lookups on a JSON object that never throw
    std::string json_string(const Json& obj, const std::string& key, const std::string& def = "");
    bool        json_bool(const Json& obj, const std::string& key, bool def = false);
    const Json* json_find(const Json& obj, const std::string& key);

} // namespace utils
} // namespace callproc

#endif // CALLPROC_HELPERS_HPP
