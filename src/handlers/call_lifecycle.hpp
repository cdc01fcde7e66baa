#ifndef CALLPROC_HANDLERS_CALL_LIFECYCLE_HPP
#define CALLPROC_HANDLERS_CALL_LIFECYCLE_HPP

#include "../events/context.hpp"

#include <string>

namespace callproc {
namespace handlers {

using events::CallEventContext;

// -----------------------------------------------------------------------------
// API-initiated events
// -----------------------------------------------------------------------------

// V1.Call.Initiated - outbound call placed through the API
void handle_call_initiated(CallEventContext& context);

// V1.Call.InboundReceived - incoming call offered by the provider
void handle_inbound_call_received(CallEventContext& context);

// V1.Call.Answered
void handle_call_answered(CallEventContext& context);

// V1.Webhook.Events - route on the embedded event type
void handle_webhook_events(CallEventContext& context);

// -----------------------------------------------------------------------------
// Provider events
// -----------------------------------------------------------------------------

// Resolve caller and provider legs, start DTMF validation when enabled,
// announce the connection to observers
void handle_call_connected(CallEventContext& context);

// Mark the session inactive; the session itself is retained
void handle_call_disconnected(CallEventContext& context);

// Terminal, log-only
void handle_create_call_failed(CallEventContext& context);
void handle_answer_call_failed(CallEventContext& context);

void handle_participants_updated(CallEventContext& context);

void handle_play_completed(CallEventContext& context);
void handle_play_failed(CallEventContext& context);
void handle_recognize_completed(CallEventContext& context);
void handle_recognize_failed(CallEventContext& context);

// Phone number for phoneNumber identifiers, else rawId, else "unknown"
std::string extract_caller_id(const Json& caller_info);

} // namespace handlers
} // namespace callproc

#endif // CALLPROC_HANDLERS_CALL_LIFECYCLE_HPP
