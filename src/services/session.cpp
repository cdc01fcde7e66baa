#include "session.hpp"
#include "../errors.hpp"

namespace callproc {
namespace services {

CallSession::CallSession(std::shared_ptr<SessionStateStore> store, const std::string& call_id)
    : store_(std::move(store)), call_id_(call_id) {
    if (!store_) {
        throw StoreError("no session store attached");
    }
    state_ = store_->load_session(call_id_);
    if (!state_.is_object()) state_ = Json::object();
}

Json CallSession::get(const std::string& key, const Json& def) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = state_.find(key);
    return it == state_.end() ? def : *it;
}

std::string CallSession::get_string(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(mu_);
    return utils::json_string(state_, key, def);
}

bool CallSession::get_bool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(mu_);
    return utils::json_bool(state_, key, def);
}

bool CallSession::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.contains(key);
}

void CallSession::set(const std::string& key, const Json& value) {
    std::lock_guard<std::mutex> lock(mu_);
    state_[key] = value;
}

void CallSession::update(const Json& changes) {
    if (!changes.is_object()) return;
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = changes.begin(); it != changes.end(); ++it) {
        state_[it.key()] = it.value();
    }
}

void CallSession::persist() {
    std::lock_guard<std::mutex> lock(mu_);
    store_->save_session(call_id_, state_);
}

void CallSession::refresh() {
    Json fresh = store_->load_session(call_id_);
    std::lock_guard<std::mutex> lock(mu_);
    state_ = fresh.is_object() ? std::move(fresh) : Json::object();
}

void CallSession::commit(const Json& changes) {
    std::lock_guard<std::mutex> lock(mu_);
    Json staged = state_;
    if (changes.is_object()) {
        for (auto it = changes.begin(); it != changes.end(); ++it) {
            staged[it.key()] = it.value();
        }
    }
    store_->save_session(call_id_, staged);
    state_ = std::move(staged);
}

Json CallSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

} // namespace services
} // namespace callproc
