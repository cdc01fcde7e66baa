#ifndef CALLPROC_EVENTS_PROCESSOR_HPP
#define CALLPROC_EVENTS_PROCESSOR_HPP

#include "context.hpp"
#include "registry.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace callproc {
namespace events {

// Result of one process_events batch
struct ProcessingSummary {
    std::string status = "success";  // "partial_failure" when failed > 0
    std::size_t processed = 0;
    std::size_t failed = 0;
    std::size_t handler_failures = 0;
    std::size_t dropped = 0;         // no resolvable call id
    double      timestamp = 0.0;

    Json to_json() const;
};

// -----------------------------------------------------------------------------
// CallEventProcessor - correlate, track, dispatch
// -----------------------------------------------------------------------------
// Holds no cross-call lock: separate batches may be processed concurrently.
// Within one batch, dispatch strictly follows input order and handlers run
// sequentially.
class CallEventProcessor {
public:
    CallEventProcessor() = default;

    CallEventProcessor(const CallEventProcessor&) = delete;
    CallEventProcessor& operator=(const CallEventProcessor&) = delete;

    void register_handler(const std::string& event_type, HandlerRef handler);
    HandlerRef register_handler(const std::string& event_type, const std::string& name, HandlerFn fn);
    bool unregister_handler(const std::string& event_type, const HandlerRef& handler);

    ProcessingSummary process_events(const std::vector<EventEnvelope>& events, const CallRuntime& runtime);

    // Read-only snapshots
    Json get_stats() const;
    std::vector<std::string> get_active_calls() const;
    bool is_call_active(const std::string& call_connection_id) const;

    const HandlerRegistry& registry() const { return registry_; }

private:
    // false when the event was dropped for lack of a call id
    bool process_single_event(const EventEnvelope& event, const CallRuntime& runtime,
                              std::size_t& handler_failures);

    std::size_t execute_handlers(const std::vector<HandlerRef>& handlers, CallEventContext& context);

    HandlerRegistry registry_;
    ActiveCallSet   active_calls_;

    std::atomic<std::size_t> events_processed_{0};
    std::atomic<std::size_t> events_failed_{0};
    std::atomic<std::size_t> events_dropped_{0};
    std::atomic<std::size_t> handler_failures_{0};
    std::atomic<std::size_t> handlers_registered_{0};
};

} // namespace events
} // namespace callproc

#endif // CALLPROC_EVENTS_PROCESSOR_HPP
