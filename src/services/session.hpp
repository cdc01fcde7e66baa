#ifndef CALLPROC_SERVICES_SESSION_HPP
#define CALLPROC_SERVICES_SESSION_HPP

#include "session_store.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace callproc {
namespace services {

// -----------------------------------------------------------------------------
// CallSession - working copy of one call's durable state
// -----------------------------------------------------------------------------
// Reads and single-field writes go to the in-memory copy; nothing reaches
// the store until persist() or commit().
class CallSession {
public:
    // Loads the current state for call_id; raises StoreError on store failure
    CallSession(std::shared_ptr<SessionStateStore> store, const std::string& call_id);

    const std::string& call_id() const { return call_id_; }

    Json        get(const std::string& key, const Json& def = nullptr) const;
    std::string get_string(const std::string& key, const std::string& def = "") const;
    bool        get_bool(const std::string& key, bool def = false) const;
    bool        contains(const std::string& key) const;

    void set(const std::string& key, const Json& value);

    // Merge every key of an object into the working copy
    void update(const Json& changes);

    // Write the working copy back to the store
    void persist();

    // Discard the working copy and reload from the store
    void refresh();

    // All-or-nothing multi-field write: stage on a copy, save, then adopt.
    // On store failure the working copy is left unchanged and the error
    // propagates.
    void commit(const Json& changes);

    Json snapshot() const;

private:
    std::shared_ptr<SessionStateStore> store_;
    std::string call_id_;
    Json state_;

    mutable std::mutex mu_;
};

} // namespace services
} // namespace callproc

#endif // CALLPROC_SERVICES_SESSION_HPP
