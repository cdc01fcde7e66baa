#include "call_lifecycle.hpp"
#include "dtmf_validation.hpp"
#include "../logging.hpp"

#include <map>

namespace callproc {
namespace handlers {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return logging::get_logger("handlers.call_lifecycle");
}

// All-or-nothing session write; failures are logged
void commit_session(CallEventContext& context, const Json& changes, const char* what) {
    if (!context.session) {
        logger()->debug("No session for call {}; skipping {}", context.call_connection_id, what);
        return;
    }
    try {
        context.session->commit(changes);
    } catch (const std::exception& e) {
        logger()->error("Failed to {} for call {}: {}", what, context.call_connection_id, e.what());
    }
}

std::string describe(const events::ResultInformation& info) {
    return "code=" + std::to_string(info.code) + " subCode=" + std::to_string(info.sub_code) +
           " message='" + info.message + "'";
}

events::ResultInformation result_information(const CallEventContext& context) {
    if (const auto* failure = std::get_if<events::ResultInfoData>(&context.payload())) {
        return failure->result_information;
    }
    if (const auto* disconnect = std::get_if<events::CallDisconnectedData>(&context.payload())) {
        return disconnect->result_information;
    }
    return {};
}

} // namespace

std::string extract_caller_id(const Json& caller_info) {
    if (utils::json_string(caller_info, "kind") == "phoneNumber") {
        if (const Json* phone = utils::json_find(caller_info, "phoneNumber")) {
            return utils::json_string(*phone, "value", "unknown");
        }
        return "unknown";
    }
    return utils::json_string(caller_info, "rawId", "unknown");
}

// -----------------------------------------------------------------------------
// API-initiated events
// -----------------------------------------------------------------------------

void handle_call_initiated(CallEventContext& context) {
    events::CallInitiatedData initiated;
    if (const auto* data = std::get_if<events::CallInitiatedData>(&context.payload())) {
        initiated = *data;
    }
    if (initiated.api_version.empty()) initiated.api_version = "unknown";

    logger()->info("Call initiated: {} (target {}, api {})", context.call_connection_id,
                   initiated.target_number.empty() ? "unknown" : initiated.target_number,
                   initiated.api_version);

    Json changes = {
        {"call_initiated_via", "api"},
        {"api_version", initiated.api_version},
        {"call_direction", "outbound"},
    };
    if (!initiated.target_number.empty()) changes["target_number"] = initiated.target_number;
    commit_session(context, changes, "record call initiation");
}

void handle_inbound_call_received(CallEventContext& context) {
    Json caller_info = Json::object();
    if (const auto* inbound = std::get_if<events::InboundCallData>(&context.payload())) {
        caller_info = inbound->caller_info;
    }
    std::string caller_id = extract_caller_id(caller_info);
    logger()->info("Inbound call received from {} on {}", caller_id, context.call_connection_id);

    commit_session(context, Json{
        {"call_direction", "inbound"},
        {"caller_id", caller_id},
        {"caller_info", caller_info},
        {"api_version", "v1"},
    }, "initialize inbound call state");
}

void handle_call_answered(CallEventContext& context) {
    logger()->info("Call answered: {}", context.call_connection_id);
    commit_session(context, Json{
        {"call_answered", true},
        {"answered_at", utils::utc_timestamp()},
    }, "record call answer");
}

void handle_webhook_events(CallEventContext& context) {
    using Route = void (*)(CallEventContext&);
    static const std::map<events::EventKind, Route> routes = {
        {events::EventKind::CallConnected,       &handle_call_connected},
        {events::EventKind::CallDisconnected,    &handle_call_disconnected},
        {events::EventKind::CreateCallFailed,    &handle_create_call_failed},
        {events::EventKind::AnswerCallFailed,    &handle_answer_call_failed},
        {events::EventKind::ParticipantsUpdated, &handle_participants_updated},
        {events::EventKind::DtmfToneReceived,    &handle_dtmf_tone_received},
        {events::EventKind::PlayCompleted,       &handle_play_completed},
        {events::EventKind::PlayFailed,          &handle_play_failed},
        {events::EventKind::RecognizeCompleted,  &handle_recognize_completed},
        {events::EventKind::RecognizeFailed,     &handle_recognize_failed},
    };

    logger()->info("Webhook event {} for call {}", context.event_type, context.call_connection_id);

    auto route = routes.find(context.event_kind());
    if (route != routes.end()) {
        route->second(context);
    } else {
        logger()->warn("Unhandled webhook event type: {}", context.event_type);
    }

    commit_session(context, Json{{"last_webhook_event", context.event_type}}, "record last webhook event");
}

// -----------------------------------------------------------------------------
// Provider events
// -----------------------------------------------------------------------------

void handle_call_connected(CallEventContext& context) {
    logger()->info("Call connected: {}", context.call_connection_id);

    std::shared_ptr<services::CallConnection> connection;
    std::string caller_id;
    try {
        connection = context.call_connection();

        const events::Participant* caller = nullptr;
        const events::Participant* provider_leg = nullptr;
        auto participants = connection->list_participants();
        for (const auto& participant : participants) {
            if (!caller && events::is_phone_number(participant)) {
                caller = &participant;
            } else if (!provider_leg && events::is_communication_user(participant)) {
                provider_leg = &participant;
            }
        }

        if (!caller) logger()->warn("Caller participant not found for call {}", context.call_connection_id);
        if (!provider_leg) logger()->warn("Provider participant not found for call {}", context.call_connection_id);
        if (caller) caller_id = caller->phone_number.empty() ? caller->raw_id : caller->phone_number;

        logger()->info("Caller phone number: {}", caller_id.empty() ? "unknown" : caller_id);
    } catch (const std::exception& e) {
        logger()->error("Failed to resolve participants for call {}: {}", context.call_connection_id, e.what());
    }

    Json changes = {{"call_active", true}};
    if (!caller_id.empty()) changes["caller_id"] = caller_id;
    commit_session(context, changes, "record call connection");

    // Conversation start stays gated until validation completes
    if (context.runtime.config.dtmf_validation_enabled) {
        setup_challenge_validation(context, connection);
    }

    std::string connected_time;
    if (const auto* connected = std::get_if<events::CallConnectedData>(&context.payload())) {
        connected_time = connected->connected_time;
    }
    context.broadcast(Json{
        {"type", "call_connected"},
        {"call_connection_id", context.call_connection_id},
        {"timestamp", connected_time.empty() ? Json(nullptr) : Json(connected_time)},
        {"validation_flow", "aws_connect_simulation"},
    });
}

void handle_call_disconnected(CallEventContext& context) {
    std::string reason;
    if (const auto* disconnected = std::get_if<events::CallDisconnectedData>(&context.payload())) {
        reason = disconnected->call_connection_state;
    }
    logger()->info("Call disconnected: {} (reason: {})", context.call_connection_id,
                   reason.empty() ? "unknown" : reason);

    commit_session(context, Json{
        {"call_active", false},
        {"call_disconnected", true},
        {"disconnect_reason", reason.empty() ? Json(nullptr) : Json(reason)},
    }, "clean up call state");
}

void handle_create_call_failed(CallEventContext& context) {
    logger()->error("Create call failed: {} ({})", context.call_connection_id,
                    describe(result_information(context)));
}

void handle_answer_call_failed(CallEventContext& context) {
    logger()->error("Answer call failed: {} ({})", context.call_connection_id,
                    describe(result_information(context)));
}

void handle_participants_updated(CallEventContext& context) {
    const auto* update = std::get_if<events::ParticipantsUpdatedData>(&context.payload());
    if (!update) {
        logger()->info("Participants updated for call {} (no roster)", context.call_connection_id);
        return;
    }

    logger()->info("Participants updated for call {}: {} participants", context.call_connection_id,
                   update->participants.size());
    for (std::size_t i = 0; i < update->participants.size(); ++i) {
        const auto& p = update->participants[i];
        logger()->info("  Participant {}: {}, muted: {}", i + 1, p.kind.empty() ? "unknown" : p.kind, p.is_muted);
    }
}

void handle_play_completed(CallEventContext& context) {
    logger()->info("Play completed: {}", context.call_connection_id);
}

void handle_play_failed(CallEventContext& context) {
    logger()->error("Play failed: {} ({})", context.call_connection_id, describe(result_information(context)));
}

void handle_recognize_completed(CallEventContext& context) {
    logger()->info("Recognize completed: {}", context.call_connection_id);
}

void handle_recognize_failed(CallEventContext& context) {
    logger()->error("Recognize failed: {} ({})", context.call_connection_id, describe(result_information(context)));
}

} // namespace handlers
} // namespace callproc
