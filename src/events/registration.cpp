#include "registration.hpp"
#include "../handlers/call_lifecycle.hpp"
#include "../handlers/dtmf_validation.hpp"
#include "../logging.hpp"

#include <iterator>

namespace callproc {
namespace events {

void register_default_handlers(CallEventProcessor& processor) {
    struct Entry {
        EventKind   kind;
        const char* name;
        HandlerFn   fn;
    };

    const Entry entries[] = {
        // API-initiated
        {EventKind::CallInitiated,       "handle_call_initiated",        handlers::handle_call_initiated},
        {EventKind::InboundCallReceived, "handle_inbound_call_received", handlers::handle_inbound_call_received},
        {EventKind::CallAnswered,        "handle_call_answered",         handlers::handle_call_answered},
        {EventKind::WebhookEvents,       "handle_webhook_events",        handlers::handle_webhook_events},

        // Call lifecycle
        {EventKind::CallConnected,       "handle_call_connected",        handlers::handle_call_connected},
        {EventKind::CallDisconnected,    "handle_call_disconnected",     handlers::handle_call_disconnected},
        {EventKind::CreateCallFailed,    "handle_create_call_failed",    handlers::handle_create_call_failed},
        {EventKind::AnswerCallFailed,    "handle_answer_call_failed",    handlers::handle_answer_call_failed},
        {EventKind::ParticipantsUpdated, "handle_participants_updated",  handlers::handle_participants_updated},

        // DTMF
        {EventKind::DtmfToneReceived,    "handle_dtmf_tone_received",    handlers::handle_dtmf_tone_received},
        {EventKind::DtmfRecognitionStartRequested, "handle_dtmf_recognition_start_requested",
         handlers::handle_dtmf_recognition_start_requested},

        // Media and recognition
        {EventKind::PlayCompleted,       "handle_play_completed",        handlers::handle_play_completed},
        {EventKind::PlayFailed,          "handle_play_failed",           handlers::handle_play_failed},
        {EventKind::RecognizeCompleted,  "handle_recognize_completed",   handlers::handle_recognize_completed},
        {EventKind::RecognizeFailed,     "handle_recognize_failed",      handlers::handle_recognize_failed},
    };

    for (const auto& entry : entries) {
        processor.register_handler(event_type_name(entry.kind), entry.name, entry.fn);
    }

    logging::get_logger("events.registration")->info("Registered {} default call event handlers", std::size(entries));
}

} // namespace events
} // namespace callproc
