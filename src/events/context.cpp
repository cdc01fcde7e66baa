#include "context.hpp"
#include "../errors.hpp"
#include "../logging.hpp"

namespace callproc {
namespace events {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return logging::get_logger("events.context");
}

} // namespace

CallEventContext::CallEventContext(const EventEnvelope& ev,
                                   const std::string& call_id,
                                   const CallRuntime& rt)
    : event(ev),
      call_connection_id(call_id),
      event_type(ev.effective_type.empty() ? ev.type : ev.effective_type),
      runtime(rt) {
    if (!runtime.store) {
        logger()->debug("No session store attached for call {}", call_connection_id);
        return;
    }
    try {
        session = std::make_shared<services::CallSession>(runtime.store, call_connection_id);
    } catch (const std::exception& e) {
        logger()->error("Failed to load session for call {}: {}", call_connection_id, e.what());
        session.reset();
    }
}

std::shared_ptr<services::CallConnection> CallEventContext::call_connection() const {
    if (!runtime.provider) {
        throw ProviderError("no telephony provider attached");
    }
    auto connection = runtime.provider->get_call_connection(call_connection_id);
    if (!connection) {
        throw ProviderError("no call connection for " + call_connection_id);
    }
    return connection;
}

std::string CallEventContext::presentation_session_id() const {
    if (!runtime.store) return call_connection_id;
    try {
        auto mapped = runtime.store->get_value(kSessionMappingPrefix + call_connection_id);
        if (mapped && !mapped->empty()) return *mapped;
    } catch (const std::exception& e) {
        logger()->warn("Session mapping lookup failed for call {}: {}", call_connection_id, e.what());
    }
    return call_connection_id;
}

void CallEventContext::broadcast(const Json& message) const {
    if (!runtime.observer) {
        logger()->debug("No observer attached; skipping broadcast for call {}", call_connection_id);
        return;
    }

    auto observer = runtime.observer;
    std::string session_id = presentation_session_id();
    std::string call_id = call_connection_id;

    auto deliver = [observer, session_id, call_id, message]() {
        try {
            observer->broadcast(session_id, message);
        } catch (const std::exception& e) {
            logger()->warn("Broadcast to session {} (call {}) failed: {}", session_id, call_id, e.what());
        }
    };

    if (runtime.tasks) {
        runtime.tasks->spawn("broadcast:" + call_id, deliver);
    } else {
        deliver();
    }
}

} // namespace events
} // namespace callproc
