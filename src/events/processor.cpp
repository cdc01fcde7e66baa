#include "processor.hpp"
#include "../logging.hpp"

namespace callproc {
namespace events {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return logging::get_logger("events.processor");
}

} // namespace

Json ProcessingSummary::to_json() const {
    return Json{
        {"status", status},
        {"processed", processed},
        {"failed", failed},
        {"handler_failures", handler_failures},
        {"dropped", dropped},
        {"timestamp", timestamp},
    };
}

// -----------------------------------------------------------------------------
// Registration
// -----------------------------------------------------------------------------

void CallEventProcessor::register_handler(const std::string& event_type, HandlerRef handler) {
    registry_.register_handler(event_type, std::move(handler));
    ++handlers_registered_;
}

HandlerRef CallEventProcessor::register_handler(const std::string& event_type,
                                                const std::string& name,
                                                HandlerFn fn) {
    HandlerRef handler = make_handler(name, std::move(fn));
    register_handler(event_type, handler);
    return handler;
}

bool CallEventProcessor::unregister_handler(const std::string& event_type, const HandlerRef& handler) {
    bool removed = registry_.unregister_handler(event_type, handler);
    if (removed) --handlers_registered_;
    return removed;
}

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------

ProcessingSummary CallEventProcessor::process_events(const std::vector<EventEnvelope>& events,
                                                     const CallRuntime& runtime) {
    ProcessingSummary summary;

    for (const auto& event : events) {
        try {
            if (process_single_event(event, runtime, summary.handler_failures)) {
                ++summary.processed;
            } else {
                ++summary.dropped;
            }
        } catch (const std::exception& e) {
            ++summary.failed;
            logger()->error("Failed to process event {}: {}", event.type, e.what());
        }
    }

    events_processed_ += summary.processed;
    events_failed_ += summary.failed;
    events_dropped_ += summary.dropped;
    handler_failures_ += summary.handler_failures;

    summary.status = summary.failed == 0 ? "success" : "partial_failure";
    summary.timestamp = utils::epoch_seconds();

    logger()->debug("Processed {}/{} events ({} dropped, {} handler failures)",
                    summary.processed, events.size(), summary.dropped, summary.handler_failures);
    return summary;
}

bool CallEventProcessor::process_single_event(const EventEnvelope& event,
                                              const CallRuntime& runtime,
                                              std::size_t& handler_failures) {
    const std::string call_connection_id = event.call_connection_id();
    if (call_connection_id.empty()) {
        logger()->warn("No call connection id found in event {}; dropping", event.type);
        return false;
    }

    switch (event.effective_kind()) {
        case EventKind::CallConnected:
            active_calls_.add(call_connection_id);
            break;
        case EventKind::CallDisconnected:
            active_calls_.remove(call_connection_id);
            break;
        default:
            break;
    }

    CallEventContext context(event, call_connection_id, runtime);

    auto handlers = registry_.handlers_for(event.type);
    if (handlers.empty()) {
        logger()->debug("No handlers registered for {}", event.type);
        return true;
    }

    handler_failures += execute_handlers(handlers, context);
    return true;
}

std::size_t CallEventProcessor::execute_handlers(const std::vector<HandlerRef>& handlers,
                                                 CallEventContext& context) {
    std::size_t failed = 0;
    for (const auto& handler : handlers) {
        try {
            handler->fn(context);
        } catch (const std::exception& e) {
            ++failed;
            logger()->error("Handler '{}' failed for {} (call {}): {}",
                            handler->name, context.event_type, context.call_connection_id, e.what());
        } catch (...) {
            ++failed;
            logger()->error("Handler '{}' failed for {} (call {}) with a non-standard exception",
                            handler->name, context.event_type, context.call_connection_id);
        }
    }
    logger()->debug("Handler execution for {}: {} succeeded, {} failed",
                    context.event_type, handlers.size() - failed, failed);
    return failed;
}

// -----------------------------------------------------------------------------
// Snapshots
// -----------------------------------------------------------------------------

Json CallEventProcessor::get_stats() const {
    return Json{
        {"events_processed", events_processed_.load()},
        {"events_failed", events_failed_.load()},
        {"events_dropped", events_dropped_.load()},
        {"handler_failures", handler_failures_.load()},
        {"handlers_registered", handlers_registered_.load()},
        {"active_calls", active_calls_.size()},
        {"registered_handlers", registry_.handler_count()},
        {"event_types", registry_.event_types()},
    };
}

std::vector<std::string> CallEventProcessor::get_active_calls() const {
    return active_calls_.snapshot();
}

bool CallEventProcessor::is_call_active(const std::string& call_connection_id) const {
    return active_calls_.contains(call_connection_id);
}

} // namespace events
} // namespace callproc
