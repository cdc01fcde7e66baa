#include "helpers.hpp"

#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace callproc {
namespace utils {

std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

bool parse_bool(const std::string& s) {
    std::string v = to_lower(trim(s));
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::tm tm_utc{};

#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

double epoch_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

// Ensure sodium is initialized (safe to call from any thread)
static void ensure_sodium_init() {
    static const bool ok = sodium_init() >= 0;
    if (!ok) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

std::string random_digits(std::size_t count) {
    ensure_sodium_init();

    std::string digits;
    digits.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        digits.push_back(static_cast<char>('0' + randombytes_uniform(10)));
    }
    return digits;
}

const Json* json_find(const Json& obj, const std::string& key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end()) return nullptr;
    return &(*it);
}

std::string json_string(const Json& obj, const std::string& key, const std::string& def) {
    const Json* v = json_find(obj, key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

bool json_bool(const Json& obj, const std::string& key, bool def) {
    const Json* v = json_find(obj, key);
    if (!v || !v->is_boolean()) return def;
    return v->get<bool>();
}

} // namespace utils
} // namespace callproc
