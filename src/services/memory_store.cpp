#include "memory_store.hpp"
#include "../errors.hpp"
#include "../logging.hpp"

namespace callproc {
namespace services {

void MemorySessionStore::check_available() const {
    if (!available_.load()) {
        throw StoreError("session store unavailable");
    }
}

void MemorySessionStore::set_available(bool available) {
    available_.store(available);
    logging::get_logger("services.memory_store")->info("Session store availability set to {}", available);
    // Wake blocked readers so they observe the outage
    cv_.notify_all();
}

Json MemorySessionStore::load_session(const std::string& session_id) {
    check_available();
    std::lock_guard<std::mutex> lock(mu_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? Json::object() : it->second;
}

void MemorySessionStore::save_session(const std::string& session_id, const Json& session) {
    check_available();
    std::lock_guard<std::mutex> lock(mu_);
    sessions_[session_id] = session;
}

std::optional<std::string> MemorySessionStore::get_value(const std::string& key) {
    check_available();
    std::lock_guard<std::mutex> lock(mu_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    if (it->second.expires_at && Clock::now() >= *it->second.expires_at) {
        values_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemorySessionStore::set_value(const std::string& key, const std::string& value,
                                   std::chrono::seconds ttl) {
    check_available();
    std::lock_guard<std::mutex> lock(mu_);
    Value v{value, std::nullopt};
    if (ttl > std::chrono::seconds::zero()) {
        v.expires_at = Clock::now() + ttl;
    }
    values_[key] = std::move(v);
}

std::string MemorySessionStore::publish_event(const std::string& stream, const Json& data) {
    check_available();
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mu_);
        id = std::to_string(++next_entry_) + "-0";
        streams_[stream].push_back(StreamEvent{id, data});
    }
    cv_.notify_all();
    return id;
}

std::optional<StreamEvent> MemorySessionStore::read_event_blocking(const std::string& stream,
                                                                   std::chrono::milliseconds timeout) {
    check_available();
    std::unique_lock<std::mutex> lock(mu_);

    // Only entries appended after this point count ("$" semantics)
    const std::size_t start = streams_[stream].size();
    const auto deadline = Clock::now() + timeout;

    bool arrived = cv_.wait_until(lock, deadline, [&] {
        return !available_.load() || streams_[stream].size() > start;
    });
    if (!available_.load()) {
        throw StoreError("session store unavailable");
    }
    if (!arrived) return std::nullopt;
    return streams_[stream][start];
}

std::vector<StreamEvent> MemorySessionStore::stream_entries(const std::string& stream) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = streams_.find(stream);
    return it == streams_.end() ? std::vector<StreamEvent>{} : it->second;
}

} // namespace services
} // namespace callproc
