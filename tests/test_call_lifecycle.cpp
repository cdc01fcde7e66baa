#include <catch2/catch_test_macros.hpp>
#include "handlers/call_lifecycle.hpp"
#include "handlers/dtmf_validation.hpp"
#include "test_helpers.hpp"

using namespace callproc;
using namespace callproc::events;
using namespace callproc::handlers;
using test_helpers::dispatch;
using test_helpers::provider_event;
using test_helpers::TestRig;

namespace {

Json connected_data(const std::string& connected_time = "2025-01-01T10:00:00Z") {
    return Json{{"serverCallId", "srv-1"},
                {"callConnectionProperties", {{"connectedTime", connected_time}}}};
}

void add_default_participants(TestRig& rig) {
    rig.connection().participants = {
        test_helpers::acs_participant("8:acs:bot"),
        test_helpers::phone_participant("+15550001"),
    };
}

} // namespace

TEST_CASE("handle_call_connected", "[handlers][lifecycle][connected]") {
    TestRig rig;
    add_default_participants(rig);

    SECTION("records the caller and announces the connection") {
        dispatch(handle_call_connected, provider_event(EventKind::CallConnected, "call-1", connected_data()), rig);

        auto session = rig.session("call-1");
        REQUIRE(session["call_active"] == true);
        REQUIRE(session["caller_id"] == "+15550001");
        REQUIRE_FALSE(session.contains(dtmf_keys::kValidationPending));

        auto sent = rig.observer->messages_of_type("call_connected");
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].first == "call-1");
        REQUIRE(sent[0].second["call_connection_id"] == "call-1");
        REQUIRE(sent[0].second["timestamp"] == "2025-01-01T10:00:00Z");
        REQUIRE(sent[0].second["validation_flow"] == "aws_connect_simulation");

        REQUIRE(rig.connection().recognition_starts.empty());
    }

    SECTION("broadcasts go to the mapped presentation session") {
        rig.store->set_value(std::string(kSessionMappingPrefix) + "call-1", "browser-42");
        dispatch(handle_call_connected, provider_event(EventKind::CallConnected, "call-1", connected_data()), rig);

        auto sent = rig.observer->messages_of_type("call_connected");
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].first == "browser-42");
    }

    SECTION("validation enabled starts a challenge before anything else") {
        rig.runtime.config.dtmf_validation_enabled = true;
        dispatch(handle_call_connected, provider_event(EventKind::CallConnected, "call-1", connected_data()), rig);

        auto session = rig.session("call-1");
        REQUIRE(session[dtmf_keys::kValidationPending] == true);
        REQUIRE(session[dtmf_keys::kGateOpen] == false);
        std::string digits = session[dtmf_keys::kChallengeDigits].get<std::string>();
        REQUIRE(digits.size() == 3);
        REQUIRE(utils::is_all_digits(digits));
        REQUIRE(session[dtmf_keys::kChallengeInput] == "");

        auto& starts = rig.connection().recognition_starts;
        REQUIRE(starts.size() == 1);
        REQUIRE(starts[0].first.phone_number == "+15550001");
        REQUIRE(starts[0].second == "dtmf_recognition_call-1");

        REQUIRE_FALSE(is_dtmf_validation_gate_open(rig.store.get(), "call-1"));
    }

    SECTION("missing legs and provider outages are tolerated") {
        rig.connection().participants.clear();
        REQUIRE_NOTHROW(dispatch(handle_call_connected,
                                 provider_event(EventKind::CallConnected, "call-1", connected_data()), rig));
        REQUIRE_FALSE(rig.session("call-1").contains("caller_id"));

        rig.provider->unavailable = true;
        REQUIRE_NOTHROW(dispatch(handle_call_connected,
                                 provider_event(EventKind::CallConnected, "call-2", connected_data()), rig));
        REQUIRE(rig.session("call-2")["call_active"] == true);
        REQUIRE(rig.observer->messages_of_type("call_connected").size() == 2);
    }

    SECTION("observer failures do not escape") {
        rig.observer->fail = true;
        REQUIRE_NOTHROW(dispatch(handle_call_connected,
                                 provider_event(EventKind::CallConnected, "call-1", connected_data()), rig));
        REQUIRE(rig.session("call-1")["call_active"] == true);
    }

    SECTION("broadcasts through a task group are delivered once joined") {
        services::BackgroundTasks tasks;
        rig.runtime.tasks = &tasks;
        dispatch(handle_call_connected, provider_event(EventKind::CallConnected, "call-1", connected_data()), rig);
        tasks.wait_all();
        REQUIRE(rig.observer->messages_of_type("call_connected").size() == 1);
        rig.runtime.tasks = nullptr;
    }
}

TEST_CASE("handle_call_disconnected", "[handlers][lifecycle][disconnected]") {
    TestRig rig;
    rig.store->save_session("call-1", Json{{"call_active", true}, {"caller_id", "+15550001"}});

    dispatch(handle_call_disconnected,
             provider_event(EventKind::CallDisconnected, "call-1", Json{{"callConnectionState", "Disconnected"}}), rig);

    auto session = rig.session("call-1");
    REQUIRE(session["call_active"] == false);
    REQUIRE(session["call_disconnected"] == true);
    REQUIRE(session["disconnect_reason"] == "Disconnected");
    // Retained, not deleted
    REQUIRE(session["caller_id"] == "+15550001");
}

TEST_CASE("API-initiated lifecycle handlers", "[handlers][lifecycle][api]") {
    TestRig rig;

    SECTION("call initiated") {
        auto env = make_api_event(event_type_name(EventKind::CallInitiated), "call-1",
                                  Json{{"target_number", "+15557777"}, {"api_version", "v1"}});
        dispatch(handle_call_initiated, env, rig);

        auto session = rig.session("call-1");
        REQUIRE(session["call_initiated_via"] == "api");
        REQUIRE(session["call_direction"] == "outbound");
        REQUIRE(session["target_number"] == "+15557777");
        REQUIRE(session["api_version"] == "v1");
    }

    SECTION("call initiated without details") {
        dispatch(handle_call_initiated, make_api_event(event_type_name(EventKind::CallInitiated), "call-1"), rig);
        auto session = rig.session("call-1");
        REQUIRE(session["api_version"] == "unknown");
        REQUIRE_FALSE(session.contains("target_number"));
    }

    SECTION("inbound call received") {
        Json from = {{"kind", "phoneNumber"}, {"rawId", "4:+15550002"}, {"phoneNumber", {{"value", "+15550002"}}}};
        dispatch(handle_inbound_call_received,
                 make_api_event(event_type_name(EventKind::InboundCallReceived), "call-1", Json{{"from", from}}), rig);

        auto session = rig.session("call-1");
        REQUIRE(session["call_direction"] == "inbound");
        REQUIRE(session["caller_id"] == "+15550002");
        REQUIRE(session["caller_info"] == from);
    }

    SECTION("call answered") {
        dispatch(handle_call_answered, make_api_event(event_type_name(EventKind::CallAnswered), "call-1"), rig);
        auto session = rig.session("call-1");
        REQUIRE(session["call_answered"] == true);
        REQUIRE(session["answered_at"].get<std::string>().back() == 'Z');
    }

    SECTION("caller id extraction") {
        REQUIRE(extract_caller_id(Json{{"kind", "phoneNumber"}, {"phoneNumber", {{"value", "+1"}}}}) == "+1");
        REQUIRE(extract_caller_id(Json{{"kind", "communicationUser"}, {"rawId", "8:acs:x"}}) == "8:acs:x");
        REQUIRE(extract_caller_id(Json::object()) == "unknown");
        REQUIRE(extract_caller_id(Json{{"kind", "phoneNumber"}}) == "unknown");
    }
}

TEST_CASE("handle_webhook_events", "[handlers][lifecycle][webhook]") {
    TestRig rig;
    const std::string meta = event_type_name(EventKind::WebhookEvents);

    SECTION("routes on the embedded type") {
        rig.store->save_session("call-1", Json{{"call_active", true}});
        auto env = make_api_event(meta, "call-1", Json{{"eventType", event_type_name(EventKind::CallDisconnected)},
                                                       {"callConnectionState", "Disconnected"}});
        dispatch(handle_webhook_events, env, rig);

        auto session = rig.session("call-1");
        REQUIRE(session["call_active"] == false);
        REQUIRE(session["last_webhook_event"] == event_type_name(EventKind::CallDisconnected));
    }

    SECTION("embedded DTMF tones reach the validation lifecycle") {
        auto env = make_api_event(meta, "call-1", Json{{"eventType", event_type_name(EventKind::DtmfToneReceived)},
                                                       {"tone", "seven"}, {"sequenceId", 1}});
        dispatch(handle_webhook_events, env, rig);
        REQUIRE(rig.session("call-1")[dtmf_keys::kSequence] == "7");
    }

    SECTION("unknown embedded types are recorded, not fatal") {
        auto env = make_api_event(meta, "call-1", Json{{"eventType", "Microsoft.Communication.Unheard"}});
        REQUIRE_NOTHROW(dispatch(handle_webhook_events, env, rig));
        REQUIRE(rig.session("call-1")["last_webhook_event"] == "Microsoft.Communication.Unheard");
    }
}

TEST_CASE("Log-only lifecycle handlers", "[handlers][lifecycle][log_only]") {
    TestRig rig;
    Json failure = {{"resultInformation", {{"code", 403}, {"subCode", 7}, {"message", "denied"}}}};

    REQUIRE_NOTHROW(dispatch(handle_create_call_failed, provider_event(EventKind::CreateCallFailed, "call-1", failure), rig));
    REQUIRE_NOTHROW(dispatch(handle_answer_call_failed, provider_event(EventKind::AnswerCallFailed, "call-1", failure), rig));
    REQUIRE_NOTHROW(dispatch(handle_play_completed, provider_event(EventKind::PlayCompleted, "call-1"), rig));
    REQUIRE_NOTHROW(dispatch(handle_play_failed, provider_event(EventKind::PlayFailed, "call-1", failure), rig));
    REQUIRE_NOTHROW(dispatch(handle_recognize_completed, provider_event(EventKind::RecognizeCompleted, "call-1"), rig));
    REQUIRE_NOTHROW(dispatch(handle_recognize_failed, provider_event(EventKind::RecognizeFailed, "call-1", failure), rig));

    Json roster = {{"participants", Json::array({{{"identifier", {{"kind", "phoneNumber"}, {"rawId", "4:+1"}}}}})}};
    REQUIRE_NOTHROW(dispatch(handle_participants_updated, provider_event(EventKind::ParticipantsUpdated, "call-1", roster), rig));

    // No retry and no state change at this layer
    REQUIRE(rig.session("call-1").empty());
    REQUIRE(rig.terminations() == 0);
    REQUIRE(rig.provider->requested_ids.empty());
}
