#ifndef CALLPROC_EVENTS_REGISTRY_HPP
#define CALLPROC_EVENTS_REGISTRY_HPP

#include "context.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace callproc {
namespace events {

using HandlerFn = std::function<void(CallEventContext&)>;

// A named handler function. Identity is the shared object, so the same
// registration can be removed again with the handle it was added with.
struct CallEventHandler {
    std::string name;
    HandlerFn   fn;
};

using HandlerRef = std::shared_ptr<const CallEventHandler>;

HandlerRef make_handler(const std::string& name, HandlerFn fn);

// -----------------------------------------------------------------------------
// HandlerRegistry - event type -> ordered handler list
// -----------------------------------------------------------------------------
class HandlerRegistry {
public:
    // Appends; the same handler may be registered more than once
    void register_handler(const std::string& event_type, HandlerRef handler);

    // Removes the first registration of this handler; false when absent
    bool unregister_handler(const std::string& event_type, const HandlerRef& handler);

    // Snapshot in registration order (empty when none)
    std::vector<HandlerRef> handlers_for(const std::string& event_type) const;

    std::size_t handler_count() const;
    std::vector<std::string> event_types() const;

private:
    std::map<std::string, std::vector<HandlerRef>> handlers_;
    mutable std::mutex mu_;
};

// -----------------------------------------------------------------------------
// ActiveCallSet - in-memory cache of connected call ids
// -----------------------------------------------------------------------------
class ActiveCallSet {
public:
    void add(const std::string& call_connection_id);
    void remove(const std::string& call_connection_id);
    bool contains(const std::string& call_connection_id) const;
    std::size_t size() const;
    std::vector<std::string> snapshot() const;

private:
    std::vector<std::string> calls_;
    mutable std::mutex mu_;
};

} // namespace events
} // namespace callproc

#endif // CALLPROC_EVENTS_REGISTRY_HPP
