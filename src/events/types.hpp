#ifndef CALLPROC_EVENTS_TYPES_HPP
#define CALLPROC_EVENTS_TYPES_HPP

#include "../helpers.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace callproc {
namespace events {

// -----------------------------------------------------------------------------
// EventKind - protocol event vocabulary
// -----------------------------------------------------------------------------
enum class EventKind : uint8_t {
    Unknown = 0,

    // Provider-originated (webhook-delivered)
    CallConnected,
    CallDisconnected,
    CallTransferAccepted,
    CallTransferFailed,
    CreateCallFailed,
    AnswerCallFailed,
    ParticipantsUpdated,
    DtmfToneReceived,
    DtmfToneFailed,
    DtmfToneStopped,
    PlayCompleted,
    PlayFailed,
    PlayCanceled,
    RecognizeCompleted,
    RecognizeFailed,
    RecognizeCanceled,

    // Internally-synthesized (API-initiated)
    CallInitiated,
    InboundCallReceived,
    CallAnswered,
    WebhookEvents,
    CallStateUpdated,
    CallCleanupRequested,
    DtmfRecognitionStartRequested
};

enum class EventFamily : uint8_t {
    Unknown  = 0,
    Provider = 1,
    Internal = 2
};

// Catalog string for a kind ("Microsoft.Communication.CallConnected", "V1.Call.Initiated", ...)
const char* event_type_name(EventKind kind);

// Reverse lookup; unrecognized strings map to EventKind::Unknown
EventKind event_kind_from_type(const std::string& type);

EventFamily event_family(EventKind kind);

// Provider result codes carried by the failure family
struct ResultInformation {
    int         code = 0;
    int         sub_code = 0;
    std::string message;
};

// Participant entry as reported by the provider
struct Participant {
    std::string kind;          // "phoneNumber", "communicationUser", ...
    std::string raw_id;
    std::string phone_number;  // set for phoneNumber participants
    bool        is_muted = false;
};

// PSTN caller leg ("phoneNumber")
bool is_phone_number(const Participant& p);

// Provider/bot leg ("communicationUser")
bool is_communication_user(const Participant& p);

// -----------------------------------------------------------------------------
// Typed payloads, decoded once at ingress
// -----------------------------------------------------------------------------
struct CallConnectedData {
    std::string server_call_id;
    std::string correlation_id;
    std::string connected_time;
};

struct CallDisconnectedData {
    std::string call_connection_state;
    ResultInformation result_information;
};

struct ParticipantsUpdatedData {
    std::vector<Participant> participants;
    int sequence_number = 0;
};

struct DtmfToneData {
    std::string        tone;
    std::optional<int> sequence_id;  // 1-based when present
};

// CreateCallFailed, AnswerCallFailed, PlayFailed, RecognizeFailed, ...
struct ResultInfoData {
    ResultInformation result_information;
    std::string       operation_context;
};

struct CallInitiatedData {
    std::string target_number;
    std::string api_version;
};

struct InboundCallData {
    Json caller_info;
};

struct GenericData {
    Json fields;
};

using EventPayload = std::variant<GenericData,
                                  CallConnectedData,
                                  CallDisconnectedData,
                                  ParticipantsUpdatedData,
                                  DtmfToneData,
                                  ResultInfoData,
                                  CallInitiatedData,
                                  InboundCallData>;

// -----------------------------------------------------------------------------
// Raw payload as handed over by the transport
// -----------------------------------------------------------------------------

// An object that exposes its attributes as a JSON object
class AttributeSource {
public:
    virtual ~AttributeSource() = default;
    virtual Json attributes() const = 0;
};

using RawPayload = std::variant<std::monostate,
                                Json,
                                std::string,
                                Bytes,
                                std::shared_ptr<const AttributeSource>>;

// Total, defensive decode: mapping, JSON text, UTF-8 bytes or attribute
// object. Any failure (including non-object JSON) yields an empty object.
Json get_event_data(const RawPayload& raw) noexcept;

// Decode the typed payload for a kind from an already-decoded data object
EventPayload decode_payload(EventKind kind, const Json& data);

using Headers = std::map<std::string, std::string>;

constexpr const char* kCallConnectionIdHeader = "x-ms-call-connection-id";

// -----------------------------------------------------------------------------
// EventEnvelope - one inbound protocol event
// -----------------------------------------------------------------------------
struct EventEnvelope {
    std::string source;
    std::string type;            // catalog string used for handler lookup
    std::string effective_type;  // embedded original type for WebhookEvents, else type
    Json        data = Json::object();
    EventPayload payload;
    Headers     headers;
    std::chrono::system_clock::time_point received_at;

    EventKind kind() const { return event_kind_from_type(type); }
    EventKind effective_kind() const { return event_kind_from_type(effective_type); }

    // Decode once at ingress
    static EventEnvelope from_raw(const std::string& source,
                                  const std::string& type,
                                  const RawPayload& raw,
                                  const Headers& headers = {});

    // Correlation id: payload shapes first, then the transport header.
    // Empty when unresolvable.
    std::string call_connection_id() const;

    // Safe field access on the decoded data
    Json get_event_field(const std::string& field, const Json& def = nullptr) const;
};

// Internally-synthesized event (source "api/v1/calls", callConnectionId merged in)
EventEnvelope make_api_event(const std::string& type,
                             const std::string& call_connection_id,
                             const Json& data = Json::object());

// Convert a provider callback body (array of events or a single event) into
// envelopes. An undecodable body yields an empty batch.
std::vector<EventEnvelope> parse_webhook_batch(const std::string& body,
                                               const std::string& source = "azure.communication.callautomation",
                                               const Headers& headers = {});

} // namespace events
} // namespace callproc

#endif // CALLPROC_EVENTS_TYPES_HPP
