#include "dtmf_validation.hpp"
#include "../logging.hpp"

#include <map>

namespace callproc {
namespace handlers {

using namespace dtmf_keys;

namespace {

// Positions beyond this are appended rather than placed
constexpr int kMaxPlacedTones = 32;

std::shared_ptr<spdlog::logger> logger() {
    return logging::get_logger("handlers.dtmf_validation");
}

void publish_completion(const CallEventContext& context) {
    if (!context.runtime.store) {
        logger()->warn("No session store; completion for call {} not published", context.call_connection_id);
        return;
    }
    try {
        auto id = context.runtime.store->publish_event(
            validation_stream_key(context.call_connection_id),
            Json{{"validation_status", "completed"}, {"result", "success"}});
        logger()->debug("Published validation completion {} for call {}", id, context.call_connection_id);
    } catch (const std::exception& e) {
        logger()->error("Failed to publish validation completion for call {}: {}",
                        context.call_connection_id, e.what());
    }
}

} // namespace

std::string validation_stream_key(const std::string& call_connection_id) {
    return "dtmf_validation:" + call_connection_id;
}

std::string sequence_mirror_key(const std::string& call_connection_id) {
    return "dtmf_sequence:" + call_connection_id;
}

std::optional<char> normalize_tone(const std::string& tone) {
    static const std::map<std::string, char> tone_map = {
        {"0", '0'}, {"zero", '0'},
        {"1", '1'}, {"one", '1'},
        {"2", '2'}, {"two", '2'},
        {"3", '3'}, {"three", '3'},
        {"4", '4'}, {"four", '4'},
        {"5", '5'}, {"five", '5'},
        {"6", '6'}, {"six", '6'},
        {"7", '7'}, {"seven", '7'},
        {"8", '8'}, {"eight", '8'},
        {"9", '9'}, {"nine", '9'},
        {"*", '*'}, {"star", '*'}, {"asterisk", '*'},
        {"#", '#'}, {"pound", '#'}, {"hash", '#'},
    };

    auto it = tone_map.find(utils::to_lower(utils::trim(tone)));
    if (it == tone_map.end()) return std::nullopt;
    return it->second;
}

// -----------------------------------------------------------------------------
// ChallengeValidation
// -----------------------------------------------------------------------------

std::string ChallengeValidation::begin(CallEventContext& context) {
    std::string digits = utils::random_digits(context.runtime.config.challenge_length);
    context.session->commit(Json{
        {kValidationPending, true},
        {kChallengeDigits, digits},
        {kChallengeInput, ""},
        {kValidated, false},
        {kGateOpen, false},
    });
    logger()->info("Challenge validation started for call {}", context.call_connection_id);
    logger()->debug("Challenge digits for call {}: {}", context.call_connection_id, digits);
    return digits;
}

void ChallengeValidation::on_tone(CallEventContext& context, char tone, std::optional<int> sequence_id) const {
    auto& session = *context.session;
    std::string expected = session.get_string(kChallengeDigits);
    std::string input = session.get_string(kChallengeInput);

    if (tone == '#') {
        complete(context, input, expected, sequence_id);
        return;
    }
    if (tone == '*') {
        input.clear();
        logger()->info("Challenge input cleared for call {}", context.call_connection_id);
    } else {
        input.push_back(tone);
    }

    // Later PIN positions count from the last id consumed here
    Json changes{{kChallengeInput, input}};
    if (sequence_id) changes[kSequenceOffset] = *sequence_id;
    session.commit(changes);
    logger()->debug("Challenge input for call {}: {}", context.call_connection_id, input);
}

void ChallengeValidation::complete(CallEventContext& context,
                                   const std::string& input,
                                   const std::string& expected,
                                   std::optional<int> sequence_id) {
    auto& session = *context.session;

    if (!expected.empty() && input == expected) {
        Json changes{
            {kValidationPending, false},
            {kValidated, true},
            {kGateOpen, true},
            {kChallengeDigits, ""},
            {kChallengeInput, ""},
        };
        if (sequence_id) changes[kSequenceOffset] = *sequence_id;
        session.commit(changes);
        logger()->info("Challenge validation succeeded for call {}", context.call_connection_id);
        publish_completion(context);
        return;
    }

    // No retry is offered and the call stays up
    Json changes{
        {kValidationPending, false},
        {kValidated, false},
        {kChallengeDigits, ""},
        {kChallengeInput, ""},
    };
    if (sequence_id) changes[kSequenceOffset] = *sequence_id;
    session.commit(changes);
    logger()->warn("Challenge validation failed for call {}: expected {} digits, got '{}'",
                   context.call_connection_id, expected.size(), input);
}

// -----------------------------------------------------------------------------
// FixedPinValidation
// -----------------------------------------------------------------------------

void FixedPinValidation::on_tone(CallEventContext& context, char tone, std::optional<int> sequence_id) const {
    auto& session = *context.session;
    std::string sequence = session.get_string(kSequence);

    int offset = 0;
    Json stored_offset = session.get(kSequenceOffset, 0);
    if (stored_offset.is_number_integer()) offset = stored_offset.get<int>();

    if (tone == '*') {
        session.commit(Json{{kSequence, ""}, {kSequenceOffset, sequence_id.value_or(offset)}});
        mirror_sequence(context, "");
        logger()->info("DTMF sequence cleared for call {}", context.call_connection_id);
        return;
    }

    if (tone == '#') {
        if (sequence.empty()) {
            if (sequence_id) session.commit(Json{{kSequenceOffset, *sequence_id}});
            logger()->info("Ignoring '#' on empty DTMF sequence for call {}", context.call_connection_id);
            return;
        }
        validate(context, sequence, sequence_id.value_or(offset));
        return;
    }

    // Place by 1-based sequence id when given, growing the buffer for gaps
    long long position = sequence_id ? static_cast<long long>(*sequence_id) - offset - 1 : -1;
    if (position >= 0 && position < kMaxPlacedTones) {
        if (static_cast<std::size_t>(position) >= sequence.size()) {
            sequence.resize(static_cast<std::size_t>(position) + 1, '_');
        }
        sequence[static_cast<std::size_t>(position)] = tone;
    } else {
        sequence.push_back(tone);
    }

    session.commit(Json{{kSequence, sequence}});
    mirror_sequence(context, sequence);
    logger()->debug("DTMF sequence for call {} is now {} tones", context.call_connection_id, sequence.size());
}

void FixedPinValidation::validate(CallEventContext& context, const std::string& sequence, int offset) {
    auto& session = *context.session;
    const bool valid = sequence.size() == context.runtime.config.pin_length && utils::is_all_digits(sequence);

    if (valid) {
        session.commit(Json{
            {kSequence, ""},
            {kSequenceOffset, offset},
            {kValidated, true},
            {kGateOpen, true},
            {kEnteredPin, sequence},
        });
        mirror_sequence(context, "");
        logger()->info("PIN validation succeeded for call {}", context.call_connection_id);
        publish_completion(context);
        return;
    }

    logger()->warn("PIN validation failed for call {} ({} tones entered)", context.call_connection_id, sequence.size());
    try {
        session.commit(Json{
            {kSequence, ""},
            {kSequenceOffset, offset},
            {kValidated, false},
            {kEnteredPin, nullptr},
        });
    } catch (const std::exception& e) {
        logger()->error("Failed to record PIN rejection for call {}: {}", context.call_connection_id, e.what());
    }
    mirror_sequence(context, "");
    cancel_call_for_dtmf_failure(context);
}

void FixedPinValidation::mirror_sequence(const CallEventContext& context, const std::string& sequence) {
    if (!context.runtime.store) return;
    try {
        context.runtime.store->set_value(sequence_mirror_key(context.call_connection_id), sequence,
                                         std::chrono::seconds(context.runtime.config.dtmf_sequence_ttl_seconds));
    } catch (const std::exception& e) {
        logger()->warn("Failed to mirror DTMF sequence for call {}: {}", context.call_connection_id, e.what());
    }
}

const ValidationStrategy& select_validation_strategy(const services::CallSession& session) {
    static const ChallengeValidation challenge{};
    static const FixedPinValidation fixed_pin{};
    if (session.get_bool(kValidationPending, false)) return challenge;
    return fixed_pin;
}

// -----------------------------------------------------------------------------
// Handlers
// -----------------------------------------------------------------------------

void handle_dtmf_tone_received(CallEventContext& context) {
    try {
        if (!context.session) {
            logger()->warn("No session for call {}; DTMF tone ignored", context.call_connection_id);
            return;
        }

        std::string raw_tone;
        std::optional<int> sequence_id;
        if (const auto* tone = std::get_if<events::DtmfToneData>(&context.payload())) {
            raw_tone = tone->tone;
            sequence_id = tone->sequence_id;
        } else {
            raw_tone = utils::json_string(context.event.data, "tone");
        }

        auto tone = normalize_tone(raw_tone);
        if (!tone) {
            logger()->info("Ignoring unrecognized DTMF tone '{}' for call {}", raw_tone, context.call_connection_id);
            return;
        }

        const auto& strategy = select_validation_strategy(*context.session);
        logger()->info("DTMF tone received for call {} (sequence {}, {} mode)",
                       context.call_connection_id, sequence_id.value_or(0), strategy.name());
        strategy.on_tone(context, *tone, sequence_id);
    } catch (const std::exception& e) {
        logger()->error("Error handling DTMF tone for call {}: {}", context.call_connection_id, e.what());
    }
}

void handle_dtmf_recognition_start_requested(CallEventContext& context) {
    logger()->info("DTMF recognition start requested for call {}", context.call_connection_id);
    try {
        auto connection = context.call_connection();
        start_dtmf_recognition(context, *connection);
    } catch (const std::exception& e) {
        logger()->error("Cannot start DTMF recognition for call {}: {}", context.call_connection_id, e.what());
    }
}

void setup_challenge_validation(CallEventContext& context,
                                std::shared_ptr<services::CallConnection> connection) {
    if (!context.session) {
        logger()->warn("No session for call {}; challenge validation not started", context.call_connection_id);
        return;
    }
    try {
        ChallengeValidation::begin(context);
    } catch (const std::exception& e) {
        logger()->error("Failed to store challenge for call {}: {}", context.call_connection_id, e.what());
        return;
    }
    try {
        if (!connection) connection = context.call_connection();
        start_dtmf_recognition(context, *connection);
    } catch (const std::exception& e) {
        logger()->error("Cannot start DTMF recognition for call {}: {}", context.call_connection_id, e.what());
    }
}

bool start_dtmf_recognition(CallEventContext& context, services::CallConnection& connection) {
    try {
        for (const auto& participant : connection.list_participants()) {
            if (!events::is_phone_number(participant)) continue;
            connection.start_continuous_dtmf_recognition(participant,
                                                         "dtmf_recognition_" + context.call_connection_id);
            logger()->info("Started DTMF recognition for call {}", context.call_connection_id);
            return true;
        }
        logger()->warn("No caller participant found for DTMF recognition on call {}", context.call_connection_id);
    } catch (const std::exception& e) {
        logger()->error("Error starting DTMF recognition for call {}: {}", context.call_connection_id, e.what());
    }
    return false;
}

// -----------------------------------------------------------------------------
// Gates
// -----------------------------------------------------------------------------

bool is_dtmf_validation_gate_open(const services::CallSession* session, const std::string& call_connection_id) {
    if (!session) return true;
    try {
        bool open = session->get_bool(kGateOpen, false);
        if (!open) logger()->debug("DTMF validation gate closed for call {}", call_connection_id);
        return open;
    } catch (const std::exception& e) {
        logger()->warn("Error checking DTMF gate for call {}: {}; failing open", call_connection_id, e.what());
        return true;
    }
}

bool is_dtmf_validation_gate_open(services::SessionStateStore* store, const std::string& call_connection_id) {
    if (!store) return true;
    try {
        Json session = store->load_session(call_connection_id);
        bool open = utils::json_bool(session, kGateOpen, false);
        if (!open) logger()->debug("DTMF validation gate closed for call {}", call_connection_id);
        return open;
    } catch (const std::exception& e) {
        logger()->warn("Error checking DTMF gate for call {}: {}; failing open", call_connection_id, e.what());
        return true;
    }
}

bool get_fresh_dtmf_validation_status(services::CallSession* session, const std::string& call_connection_id) {
    if (!session) return true;
    try {
        session->refresh();
        return session->get_bool(kValidated, false);
    } catch (const std::exception& e) {
        logger()->warn("Error reading DTMF validation status for call {}: {}; assuming validated",
                       call_connection_id, e.what());
        return true;
    }
}

// -----------------------------------------------------------------------------
// Completion wait and cancellation
// -----------------------------------------------------------------------------

bool wait_for_dtmf_validation_completion(services::SessionStateStore& store,
                                         services::TelephonyProvider* provider,
                                         const std::string& call_connection_id,
                                         std::chrono::milliseconds timeout) {
    const std::string stream = validation_stream_key(call_connection_id);
    try {
        logger()->info("Waiting up to {} ms for DTMF validation on {}", timeout.count(), stream);
        auto event = store.read_event_blocking(stream, timeout);
        if (event) {
            logger()->info("DTMF validation completed for call {}", call_connection_id);
            return true;
        }
    } catch (const std::exception& e) {
        logger()->error("Error waiting for DTMF validation on call {}: {}", call_connection_id, e.what());
        return false;
    }

    logger()->warn("DTMF validation timed out for call {}", call_connection_id);
    if (!provider) return false;
    try {
        auto connection = provider->get_call_connection(call_connection_id);
        if (connection) {
            connection->hang_up(true);
            logger()->info("Call {} hung up after DTMF validation timeout", call_connection_id);
        }
    } catch (const std::exception& e) {
        logger()->error("Error hanging up call {}: {}", call_connection_id, e.what());
    }
    return false;
}

void cancel_call_for_dtmf_failure(CallEventContext& context) {
    const std::string& call_id = context.call_connection_id;
    logger()->warn("Cancelling call {} after DTMF validation failure", call_id);

    // Readers must see the reason before the call goes away
    if (context.session) {
        try {
            context.session->commit(Json{{kGateOpen, false}, {kCancelledByFailure, true}});
        } catch (const std::exception& e) {
            logger()->error("Failed to record cancellation for call {}: {}", call_id, e.what());
        }
    }

    bool terminated = false;
    if (context.runtime.terminator) {
        try {
            terminated = context.runtime.terminator->terminate_session(call_id, kValidationFailedReason);
            if (!terminated) logger()->warn("Session terminator declined call {}", call_id);
        } catch (const std::exception& e) {
            logger()->error("Session termination failed for call {}: {}", call_id, e.what());
        }
    }

    if (!terminated) {
        try {
            context.call_connection()->hang_up(true);
            terminated = true;
            logger()->info("Call {} hung up after DTMF validation failure", call_id);
        } catch (const std::exception& e) {
            logger()->error("Provider hang-up failed for call {}: {}", call_id, e.what());
        }
    }

    try {
        context.broadcast(Json{
            {"type", "call_cancelled"},
            {"call_connection_id", call_id},
            {"reason", kValidationFailedReason},
            {"terminated", terminated},
            {"timestamp", utils::utc_timestamp()},
        });
    } catch (const std::exception& e) {
        logger()->warn("Failed to announce cancellation for call {}: {}", call_id, e.what());
    }
}

} // namespace handlers
} // namespace callproc
