#ifndef CALLPROC_SERVICES_MEMORY_STORE_HPP
#define CALLPROC_SERVICES_MEMORY_STORE_HPP

#include "session_store.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>

namespace callproc {
namespace services {

// -----------------------------------------------------------------------------
// MemorySessionStore - in-process SessionStateStore
// -----------------------------------------------------------------------------
class MemorySessionStore : public SessionStateStore {
public:
    MemorySessionStore() = default;

    Json load_session(const std::string& session_id) override;
    void save_session(const std::string& session_id, const Json& session) override;

    std::optional<std::string> get_value(const std::string& key) override;
    void set_value(const std::string& key, const std::string& value,
                   std::chrono::seconds ttl = std::chrono::seconds::zero()) override;

    std::string publish_event(const std::string& stream, const Json& data) override;
    std::optional<StreamEvent> read_event_blocking(const std::string& stream,
                                                   std::chrono::milliseconds timeout) override;

    // Simulated outage: while unavailable every operation raises StoreError
    void set_available(bool available);
    bool is_available() const { return available_.load(); }

    // Entries published so far on a stream (inspection)
    std::vector<StreamEvent> stream_entries(const std::string& stream) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Value {
        std::string value;
        std::optional<Clock::time_point> expires_at;
    };

    void check_available() const;

    std::atomic<bool> available_{true};
    std::map<std::string, Json> sessions_;
    std::map<std::string, Value> values_;
    std::map<std::string, std::vector<StreamEvent>> streams_;
    uint64_t next_entry_ = 0;

    mutable std::mutex mu_;
    std::condition_variable cv_;
};

} // namespace services
} // namespace callproc

#endif // CALLPROC_SERVICES_MEMORY_STORE_HPP
