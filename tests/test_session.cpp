#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "services/background.hpp"
#include "services/memory_store.hpp"
#include "services/session.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace callproc;
using namespace callproc::services;
using namespace std::chrono_literals;

TEST_CASE("MemorySessionStore", "[services][store]") {
    MemorySessionStore store;

    SECTION("sessions are stored per id") {
        REQUIRE(store.load_session("a").empty());
        store.save_session("a", Json{{"call_active", true}});
        REQUIRE(store.load_session("a")["call_active"] == true);
        REQUIRE(store.load_session("b").empty());
    }

    SECTION("values honour their TTL") {
        store.set_value("k", "v");
        REQUIRE(store.get_value("k") == std::optional<std::string>("v"));

        store.set_value("short", "x", std::chrono::seconds(1));
        REQUIRE(store.get_value("short").has_value());
        std::this_thread::sleep_for(1100ms);
        REQUIRE_FALSE(store.get_value("short").has_value());
        REQUIRE_FALSE(store.get_value("missing").has_value());
    }

    SECTION("blocking read only sees events published after it starts") {
        store.publish_event("s", Json{{"n", 1}});

        std::atomic<bool> received{false};
        std::thread publisher([&] {
            for (int i = 0; i < 100 && !received; ++i) {
                std::this_thread::sleep_for(20ms);
                store.publish_event("s", Json{{"n", 2}});
            }
        });
        auto event = store.read_event_blocking("s", 5000ms);
        received = true;
        publisher.join();

        REQUIRE(event.has_value());
        REQUIRE(event->data["n"] == 2);
        REQUIRE(store.stream_entries("s").size() >= 2);
    }

    SECTION("blocking read times out") {
        auto start = std::chrono::steady_clock::now();
        auto event = store.read_event_blocking("quiet", 100ms);
        REQUIRE_FALSE(event.has_value());
        REQUIRE(std::chrono::steady_clock::now() - start >= 100ms);
    }

    SECTION("outage raises StoreError everywhere") {
        store.set_available(false);
        REQUIRE_FALSE(store.is_available());
        REQUIRE_THROWS_AS(store.load_session("a"), StoreError);
        REQUIRE_THROWS_AS(store.save_session("a", Json::object()), StoreError);
        REQUIRE_THROWS_AS(store.get_value("k"), StoreError);
        REQUIRE_THROWS_AS(store.set_value("k", "v"), StoreError);
        REQUIRE_THROWS_AS(store.publish_event("s", Json::object()), StoreError);
        REQUIRE_THROWS_AS(store.read_event_blocking("s", 10ms), StoreError);

        store.set_available(true);
        REQUIRE_NOTHROW(store.load_session("a"));
    }
}

TEST_CASE("CallSession", "[services][session]") {
    auto store = std::make_shared<MemorySessionStore>();

    SECTION("writes stay local until persisted") {
        CallSession session(store, "call-1");
        session.set("status", "connected");
        session.update(Json{{"caller_id", "+1555"}, {"call_active", true}});

        REQUIRE(session.get_string("status") == "connected");
        REQUIRE(session.get_bool("call_active"));
        REQUIRE(store->load_session("call-1").empty());

        session.persist();
        REQUIRE(store->load_session("call-1")["caller_id"] == "+1555");
    }

    SECTION("get falls back to the default") {
        CallSession session(store, "call-1");
        REQUIRE(session.get("missing", 7) == 7);
        REQUIRE(session.get_string("missing", "none") == "none");
        REQUIRE_FALSE(session.contains("missing"));
    }

    SECTION("commit writes every field or none") {
        CallSession session(store, "call-1");
        session.commit(Json{{"dtmf_validated", true}, {"dtmf_validation_gate_open", true}});
        REQUIRE(store->load_session("call-1")["dtmf_validation_gate_open"] == true);

        store->set_available(false);
        REQUIRE_THROWS_AS(session.commit(Json{{"dtmf_validated", false}, {"entered_pin", nullptr}}), StoreError);
        REQUIRE(session.get_bool("dtmf_validated"));
        REQUIRE_FALSE(session.contains("entered_pin"));

        store->set_available(true);
        REQUIRE(store->load_session("call-1")["dtmf_validated"] == true);
    }

    SECTION("refresh picks up writes from another session") {
        CallSession reader(store, "call-1");
        CallSession writer(store, "call-1");
        writer.commit(Json{{"dtmf_validated", true}});

        REQUIRE_FALSE(reader.get_bool("dtmf_validated"));
        reader.refresh();
        REQUIRE(reader.get_bool("dtmf_validated"));
    }

    SECTION("loading from an unavailable store fails") {
        store->set_available(false);
        REQUIRE_THROWS_AS(CallSession(store, "call-1"), StoreError);
        REQUIRE_THROWS_AS(CallSession(nullptr, "call-1"), StoreError);
    }
}

TEST_CASE("BackgroundTasks", "[services][background]") {

    SECTION("wait_all joins spawned work") {
        std::atomic<int> ran{0};
        BackgroundTasks tasks;
        for (int i = 0; i < 5; ++i) {
            tasks.spawn("count", [&ran] { ++ran; });
        }
        tasks.wait_all();
        REQUIRE(ran == 5);
        REQUIRE(tasks.failures() == 0);
    }

    SECTION("failures are counted, not rethrown") {
        BackgroundTasks tasks;
        tasks.spawn("boom", [] { throw std::runtime_error("boom"); });
        tasks.spawn("ok", [] {});
        REQUIRE_NOTHROW(tasks.wait_all());
        REQUIRE(tasks.failures() == 1);
    }

    SECTION("destructor waits for outstanding tasks") {
        std::atomic<bool> done{false};
        {
            BackgroundTasks tasks;
            tasks.spawn("slow", [&done] {
                std::this_thread::sleep_for(50ms);
                done = true;
            });
        }
        REQUIRE(done);
    }

    SECTION("finished tasks are released as new ones are spawned") {
        std::atomic<int> ran{0};
        BackgroundTasks tasks;
        for (int i = 0; i < 20; ++i) {
            tasks.spawn("count", [&ran] { ++ran; });
        }
        while (ran < 20) std::this_thread::sleep_for(1ms);

        for (int i = 0; i < 200 && tasks.retained() > 1; ++i) {
            std::this_thread::sleep_for(5ms);
            tasks.spawn("tick", [] {});
        }
        REQUIRE(tasks.retained() == 1);
        tasks.wait_all();
        REQUIRE(tasks.retained() == 0);
    }
}
