#ifndef CALLPROC_EVENTS_CONTEXT_HPP
#define CALLPROC_EVENTS_CONTEXT_HPP

#include "types.hpp"
#include "../config.hpp"
#include "../services/background.hpp"
#include "../services/session.hpp"
#include "../services/session_store.hpp"
#include "../services/telephony.hpp"

#include <memory>
#include <string>

namespace callproc {
namespace events {

// -----------------------------------------------------------------------------
// CallRuntime - collaborator handles shared by every dispatch
// -----------------------------------------------------------------------------
// Any handle may be null; handlers degrade to logging when one is missing.
struct CallRuntime {
    std::shared_ptr<services::SessionStateStore> store;
    std::shared_ptr<services::TelephonyProvider> provider;
    std::shared_ptr<services::SessionObserver>   observer;
    std::shared_ptr<services::SessionTerminator> terminator;
    services::BackgroundTasks*                   tasks = nullptr;
    ProcessorConfig                              config;
};

constexpr const char* kSessionMappingPrefix = "call_session_mapping:";

// -----------------------------------------------------------------------------
// CallEventContext - per-dispatch bag, built fresh for every event
// -----------------------------------------------------------------------------
class CallEventContext {
public:
    CallEventContext(const EventEnvelope& event,
                     const std::string& call_connection_id,
                     const CallRuntime& runtime);

    const EventEnvelope& event;
    std::string          call_connection_id;
    std::string          event_type;  // effective type (embedded one for WebhookEvents)
    std::shared_ptr<services::CallSession> session;  // null when the store failed
    const CallRuntime&   runtime;

    EventKind event_kind() const { return event_kind_from_type(event_type); }
    const EventPayload& payload() const { return event.payload; }

    // Safe access to the decoded event data
    Json get_event_field(const std::string& field, const Json& def = nullptr) const {
        return event.get_event_field(field, def);
    }

    // Provider handle for this call; raises ProviderError when unavailable
    std::shared_ptr<services::CallConnection> call_connection() const;

    // UI-facing id from the side mapping; falls back to the call id
    std::string presentation_session_id() const;

    // Fire-and-forget delivery to the observer layer. Failures are logged.
    void broadcast(const Json& message) const;
};

} // namespace events
} // namespace callproc

#endif // CALLPROC_EVENTS_CONTEXT_HPP
