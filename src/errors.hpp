#ifndef CALLPROC_ERRORS_HPP
#define CALLPROC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace callproc {

// -----------------------------------------------------------------------------
// Error types raised by collaborators and caught at the dispatch boundaries
// -----------------------------------------------------------------------------
class CallProcError : public std::runtime_error {
public:
    explicit CallProcError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public CallProcError {
public:
    explicit ConfigError(const std::string& msg) : CallProcError(msg) {}
};

class StoreError : public CallProcError {
public:
    explicit StoreError(const std::string& msg) : CallProcError(msg) {}
};

class ProviderError : public CallProcError {
public:
    explicit ProviderError(const std::string& msg) : CallProcError(msg) {}
};

} // namespace callproc

#endif // CALLPROC_ERRORS_HPP
