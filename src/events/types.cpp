#include "types.hpp"
#include "../logging.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace callproc {
namespace events {

using utils::json_find;
using utils::json_string;

namespace {

struct CatalogEntry {
    EventKind   kind;
    const char* type;
    EventFamily family;
};

constexpr CatalogEntry kCatalog[] = {
    {EventKind::CallConnected,        "Microsoft.Communication.CallConnected",        EventFamily::Provider},
    {EventKind::CallDisconnected,     "Microsoft.Communication.CallDisconnected",     EventFamily::Provider},
    {EventKind::CallTransferAccepted, "Microsoft.Communication.CallTransferAccepted", EventFamily::Provider},
    {EventKind::CallTransferFailed,   "Microsoft.Communication.CallTransferFailed",   EventFamily::Provider},
    {EventKind::CreateCallFailed,     "Microsoft.Communication.CreateCallFailed",     EventFamily::Provider},
    {EventKind::AnswerCallFailed,     "Microsoft.Communication.AnswerCallFailed",     EventFamily::Provider},
    {EventKind::ParticipantsUpdated,  "Microsoft.Communication.ParticipantsUpdated",  EventFamily::Provider},
    {EventKind::DtmfToneReceived,     "Microsoft.Communication.ContinuousDtmfRecognitionToneReceived", EventFamily::Provider},
    {EventKind::DtmfToneFailed,       "Microsoft.Communication.ContinuousDtmfRecognitionToneFailed",   EventFamily::Provider},
    {EventKind::DtmfToneStopped,      "Microsoft.Communication.ContinuousDtmfRecognitionStopped",      EventFamily::Provider},
    {EventKind::PlayCompleted,        "Microsoft.Communication.PlayCompleted",        EventFamily::Provider},
    {EventKind::PlayFailed,           "Microsoft.Communication.PlayFailed",           EventFamily::Provider},
    {EventKind::PlayCanceled,         "Microsoft.Communication.PlayCanceled",         EventFamily::Provider},
    {EventKind::RecognizeCompleted,   "Microsoft.Communication.RecognizeCompleted",   EventFamily::Provider},
    {EventKind::RecognizeFailed,      "Microsoft.Communication.RecognizeFailed",      EventFamily::Provider},
    {EventKind::RecognizeCanceled,    "Microsoft.Communication.RecognizeCanceled",    EventFamily::Provider},

    {EventKind::CallInitiated,        "V1.Call.Initiated",        EventFamily::Internal},
    {EventKind::InboundCallReceived,  "V1.Call.InboundReceived",  EventFamily::Internal},
    {EventKind::CallAnswered,         "V1.Call.Answered",         EventFamily::Internal},
    {EventKind::WebhookEvents,        "V1.Webhook.Events",        EventFamily::Internal},
    {EventKind::CallStateUpdated,     "V1.Call.StateUpdated",     EventFamily::Internal},
    {EventKind::CallCleanupRequested, "V1.Call.CleanupRequested", EventFamily::Internal},
    {EventKind::DtmfRecognitionStartRequested, "V1.DTMF.RecognitionStartRequested", EventFamily::Internal},
};

ResultInformation decode_result_information(const Json& data) {
    ResultInformation info;
    const Json* ri = json_find(data, "resultInformation");
    if (!ri || !ri->is_object()) return info;

    if (const Json* code = json_find(*ri, "code"); code && code->is_number_integer()) {
        info.code = code->get<int>();
    }
    if (const Json* sub = json_find(*ri, "subCode"); sub && sub->is_number_integer()) {
        info.sub_code = sub->get<int>();
    }
    info.message = json_string(*ri, "message");
    return info;
}

Participant decode_participant(const Json& entry) {
    Participant p;
    if (!entry.is_object()) return p;

    const Json* identifier = json_find(entry, "identifier");
    const Json& id = (identifier && identifier->is_object()) ? *identifier : entry;

    p.kind = json_string(id, "kind");
    p.raw_id = json_string(id, "rawId");

    if (const Json* phone = json_find(id, "phoneNumber"); phone && phone->is_object()) {
        p.phone_number = json_string(*phone, "value");
    }
    // rawId "4:+12345678901" denotes a PSTN leg
    if (p.phone_number.empty() && p.raw_id.rfind("4:", 0) == 0) {
        p.phone_number = p.raw_id.substr(2);
    }
    if (p.kind.empty() && !p.phone_number.empty()) {
        p.kind = "phoneNumber";
    }
    p.is_muted = utils::json_bool(entry, "isMuted");
    return p;
}

// Sequence ids are 1-based; anything outside [1, INT_MAX] is treated as absent
std::optional<int> decode_sequence_id(const Json& data) {
    const Json* seq = json_find(data, "sequenceId");
    if (!seq) return std::nullopt;

    long long value = 0;
    if (seq->is_number_unsigned()) {
        auto u = seq->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        value = static_cast<long long>(u);
    } else if (seq->is_number_integer()) {
        value = seq->get<std::int64_t>();
    } else if (seq->is_string()) {
        const std::string text = seq->get<std::string>();
        std::size_t pos = 0;
        try {
            value = std::stoll(text, &pos);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (pos != text.size()) return std::nullopt;
    } else {
        return std::nullopt;
    }

    if (value < 1 || value > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(value);
}

} // namespace

const char* event_type_name(EventKind kind) {
    for (const auto& entry : kCatalog) {
        if (entry.kind == kind) return entry.type;
    }
    return "Unknown";
}

EventKind event_kind_from_type(const std::string& type) {
    for (const auto& entry : kCatalog) {
        if (type == entry.type) return entry.kind;
    }
    return EventKind::Unknown;
}

bool is_phone_number(const Participant& p) {
    return p.kind == "phoneNumber" || p.kind == "phone_number";
}

bool is_communication_user(const Participant& p) {
    return p.kind == "communicationUser" || p.kind == "communication_user";
}

EventFamily event_family(EventKind kind) {
    for (const auto& entry : kCatalog) {
        if (entry.kind == kind) return entry.family;
    }
    return EventFamily::Unknown;
}

// -----------------------------------------------------------------------------
// Payload decoding
// -----------------------------------------------------------------------------

Json get_event_data(const RawPayload& raw) noexcept {
    try {
        Json decoded;
        if (const auto* j = std::get_if<Json>(&raw)) {
            decoded = *j;
        } else if (const auto* s = std::get_if<std::string>(&raw)) {
            decoded = Json::parse(*s);
        } else if (const auto* b = std::get_if<Bytes>(&raw)) {
            decoded = Json::parse(b->begin(), b->end());
        } else if (const auto* obj = std::get_if<std::shared_ptr<const AttributeSource>>(&raw)) {
            if (*obj) decoded = (*obj)->attributes();
        }
        if (decoded.is_object()) return decoded;
    } catch (const std::exception& e) {
        logging::get_logger("events.types")->debug("Undecodable event payload: {}", e.what());
    }
    return Json::object();
}

EventPayload decode_payload(EventKind kind, const Json& data) {
    switch (kind) {
        case EventKind::CallConnected: {
            CallConnectedData d;
            d.server_call_id = json_string(data, "serverCallId");
            d.correlation_id = json_string(data, "correlationId");
            if (const Json* props = json_find(data, "callConnectionProperties")) {
                d.connected_time = json_string(*props, "connectedTime");
            }
            return d;
        }
        case EventKind::CallDisconnected: {
            CallDisconnectedData d;
            d.call_connection_state = json_string(data, "callConnectionState");
            d.result_information = decode_result_information(data);
            return d;
        }
        case EventKind::ParticipantsUpdated: {
            ParticipantsUpdatedData d;
            if (const Json* list = json_find(data, "participants"); list && list->is_array()) {
                for (const auto& entry : *list) d.participants.push_back(decode_participant(entry));
            }
            if (const Json* seq = json_find(data, "sequenceNumber"); seq && seq->is_number_integer()) {
                d.sequence_number = seq->get<int>();
            }
            return d;
        }
        case EventKind::DtmfToneReceived: {
            DtmfToneData d;
            d.tone = json_string(data, "tone");
            d.sequence_id = decode_sequence_id(data);
            return d;
        }
        case EventKind::CreateCallFailed:
        case EventKind::AnswerCallFailed:
        case EventKind::CallTransferFailed:
        case EventKind::DtmfToneFailed:
        case EventKind::PlayFailed:
        case EventKind::RecognizeFailed: {
            ResultInfoData d;
            d.result_information = decode_result_information(data);
            d.operation_context = json_string(data, "operationContext");
            return d;
        }
        case EventKind::CallInitiated: {
            CallInitiatedData d;
            d.target_number = json_string(data, "target_number");
            d.api_version = json_string(data, "api_version", "unknown");
            return d;
        }
        case EventKind::InboundCallReceived: {
            InboundCallData d;
            const Json* from = json_find(data, "from");
            d.caller_info = (from && from->is_object()) ? *from : Json::object();
            return d;
        }
        default:
            return GenericData{data};
    }
}

// -----------------------------------------------------------------------------
// EventEnvelope
// -----------------------------------------------------------------------------

EventEnvelope EventEnvelope::from_raw(const std::string& source,
                                      const std::string& type,
                                      const RawPayload& raw,
                                      const Headers& headers) {
    EventEnvelope env;
    env.source = source;
    env.type = type;
    env.headers = headers;
    env.received_at = std::chrono::system_clock::now();
    env.data = get_event_data(raw);

    env.effective_type = type;
    if (env.kind() == EventKind::WebhookEvents) {
        std::string embedded = json_string(env.data, "eventType");
        if (!embedded.empty()) env.effective_type = embedded;
    }
    env.payload = decode_payload(env.effective_kind(), env.data);
    return env;
}

std::string EventEnvelope::call_connection_id() const {
    std::string id = json_string(data, "callConnectionId");
    if (id.empty()) id = json_string(data, "call_connection_id");
    if (id.empty()) {
        if (const Json* props = json_find(data, "callConnectionProperties")) {
            id = json_string(*props, "callConnectionId");
        }
    }
    if (id.empty()) {
        auto it = headers.find(kCallConnectionIdHeader);
        if (it != headers.end()) id = it->second;
    }
    return id;
}

Json EventEnvelope::get_event_field(const std::string& field, const Json& def) const {
    const Json* v = json_find(data, field);
    return v ? *v : def;
}

EventEnvelope make_api_event(const std::string& type,
                             const std::string& call_connection_id,
                             const Json& data) {
    Json merged = data.is_object() ? data : Json::object();
    merged["callConnectionId"] = call_connection_id;
    return EventEnvelope::from_raw("api/v1/calls", type, merged);
}

std::vector<EventEnvelope> parse_webhook_batch(const std::string& body,
                                               const std::string& source,
                                               const Headers& headers) {
    std::vector<EventEnvelope> batch;

    Json parsed = Json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        logging::get_logger("events.types")->warn("Webhook body is not valid JSON; ignoring batch");
        return batch;
    }

    auto convert = [&](const Json& item) {
        if (!item.is_object()) return;
        std::string type = json_string(item, "eventType");
        if (type.empty()) type = json_string(item, "type", "Unknown");
        const Json* data = json_find(item, "data");
        batch.push_back(EventEnvelope::from_raw(source, type, data ? *data : item, headers));
    };

    if (parsed.is_array()) {
        for (const auto& item : parsed) convert(item);
    } else {
        convert(parsed);
    }
    return batch;
}

} // namespace events
} // namespace callproc
