#ifndef CALLPROC_HANDLERS_DTMF_VALIDATION_HPP
#define CALLPROC_HANDLERS_DTMF_VALIDATION_HPP

#include "../events/context.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace callproc {
namespace handlers {

using events::CallEventContext;

// -----------------------------------------------------------------------------
// Session keys owned by DTMF validation
// -----------------------------------------------------------------------------
namespace dtmf_keys {
    constexpr const char* kValidationPending  = "validation_pending";
    constexpr const char* kChallengeDigits    = "aws_challenge_digits";
    constexpr const char* kChallengeInput     = "aws_input_sequence";
    constexpr const char* kSequence           = "dtmf_sequence";
    constexpr const char* kSequenceOffset     = "dtmf_sequence_offset";
    constexpr const char* kValidated          = "dtmf_validated";
    constexpr const char* kGateOpen           = "dtmf_validation_gate_open";
    constexpr const char* kEnteredPin         = "entered_pin";
    constexpr const char* kCancelledByFailure = "call_cancelled_dtmf_failure";
}

constexpr const char* kValidationFailedReason = "dtmf_validation_failed";

// "dtmf_validation:<call id>", the completion channel
std::string validation_stream_key(const std::string& call_connection_id);

// "dtmf_sequence:<call id>", the mirrored fixed-PIN buffer
std::string sequence_mirror_key(const std::string& call_connection_id);

// Map words ("zero".."nine", "star"/"asterisk", "pound"/"hash") and raw
// symbols to {0-9, *, #}. nullopt for anything else.
std::optional<char> normalize_tone(const std::string& tone);

// -----------------------------------------------------------------------------
// ValidationStrategy - how a normalized tone advances validation
// -----------------------------------------------------------------------------
class ValidationStrategy {
public:
    virtual ~ValidationStrategy() = default;

    virtual const char* name() const = 0;

    // Requires context.session
    virtual void on_tone(CallEventContext& context, char tone, std::optional<int> sequence_id) const = 0;
};

// Random challenge echoed back by the caller, terminated by '#'.
// A mismatch only records the rejection.
class ChallengeValidation : public ValidationStrategy {
public:
    const char* name() const override { return "challenge"; }
    void on_tone(CallEventContext& context, char tone, std::optional<int> sequence_id) const override;

    // Store a fresh challenge; returns the digits to present to the caller
    static std::string begin(CallEventContext& context);

private:
    static void complete(CallEventContext& context,
                         const std::string& input,
                         const std::string& expected,
                         std::optional<int> sequence_id);
};

// Fixed-length PIN entered directly, terminated by '#'.
// A rejected PIN cancels the call.
class FixedPinValidation : public ValidationStrategy {
public:
    const char* name() const override { return "fixed_pin"; }
    void on_tone(CallEventContext& context, char tone, std::optional<int> sequence_id) const override;

private:
    static void validate(CallEventContext& context, const std::string& sequence, int offset);
    static void mirror_sequence(const CallEventContext& context, const std::string& sequence);
};

// Challenge when one is pending on the session, fixed PIN otherwise
const ValidationStrategy& select_validation_strategy(const services::CallSession& session);

// -----------------------------------------------------------------------------
// Handlers
// -----------------------------------------------------------------------------

// ContinuousDtmfRecognitionToneReceived
void handle_dtmf_tone_received(CallEventContext& context);

// V1.DTMF.RecognitionStartRequested
void handle_dtmf_recognition_start_requested(CallEventContext& context);

// Create a challenge and start recognition on the caller leg. Used by the
// call-connected handler when validation is enabled; the connection is looked
// up through the provider when not supplied.
void setup_challenge_validation(CallEventContext& context,
                                std::shared_ptr<services::CallConnection> connection = nullptr);

// Start continuous recognition on the first phone-number participant.
// Returns false (logged) when no caller leg exists or the provider fails.
bool start_dtmf_recognition(CallEventContext& context, services::CallConnection& connection);

// -----------------------------------------------------------------------------
// Gates (fail open)
// -----------------------------------------------------------------------------

// Working-copy read of dtmf_validation_gate_open; true when session is null
bool is_dtmf_validation_gate_open(const services::CallSession* session, const std::string& call_connection_id);

// Same predicate loaded straight from the store; true when the store fails
bool is_dtmf_validation_gate_open(services::SessionStateStore* store, const std::string& call_connection_id);

// Refresh from the store, then read dtmf_validated; true on null session or error
bool get_fresh_dtmf_validation_status(services::CallSession* session, const std::string& call_connection_id);

// -----------------------------------------------------------------------------
// Completion wait and cancellation
// -----------------------------------------------------------------------------

// Block on the completion channel. true when a completion arrives; on timeout
// hang up the call (best effort) and return false; false on store errors.
bool wait_for_dtmf_validation_completion(services::SessionStateStore& store,
                                         services::TelephonyProvider* provider,
                                         const std::string& call_connection_id,
                                         std::chrono::milliseconds timeout);

// Close the gate, mark the failure reason, then terminate through the session
// layer or fall back to hanging up every leg. Never throws.
void cancel_call_for_dtmf_failure(CallEventContext& context);

} // namespace handlers
} // namespace callproc

#endif // CALLPROC_HANDLERS_DTMF_VALIDATION_HPP
