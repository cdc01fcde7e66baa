#ifndef CALLPROC_SERVICES_SESSION_STORE_HPP
#define CALLPROC_SERVICES_SESSION_STORE_HPP

#include "../helpers.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace callproc {
namespace services {

// One entry read back from a notification stream
struct StreamEvent {
    std::string id;
    Json        data;
};

// -----------------------------------------------------------------------------
// SessionStateStore - durable per-call state plus a notification stream
// -----------------------------------------------------------------------------
// Implementations raise StoreError when the backing store is unavailable.
class SessionStateStore {
public:
    virtual ~SessionStateStore() = default;

    // Full session object for a call id; empty object when none exists
    virtual Json load_session(const std::string& session_id) = 0;
    virtual void save_session(const std::string& session_id, const Json& session) = 0;

    // Plain keys (side mappings, mirrored buffers)
    virtual std::optional<std::string> get_value(const std::string& key) = 0;
    virtual void set_value(const std::string& key, const std::string& value,
                           std::chrono::seconds ttl = std::chrono::seconds::zero()) = 0;

    // Append to a stream; returns the entry id
    virtual std::string publish_event(const std::string& stream, const Json& data) = 0;

    // Block until an entry published after this call began arrives, or the
    // timeout elapses (nullopt)
    virtual std::optional<StreamEvent> read_event_blocking(const std::string& stream,
                                                           std::chrono::milliseconds timeout) = 0;
};

} // namespace services
} // namespace callproc

#endif // CALLPROC_SERVICES_SESSION_STORE_HPP
