#include "registry.hpp"
#include "../errors.hpp"
#include "../logging.hpp"

#include <algorithm>

namespace callproc {
namespace events {

HandlerRef make_handler(const std::string& name, HandlerFn fn) {
    return std::make_shared<CallEventHandler>(CallEventHandler{name, std::move(fn)});
}

// -----------------------------------------------------------------------------
// HandlerRegistry
// -----------------------------------------------------------------------------

void HandlerRegistry::register_handler(const std::string& event_type, HandlerRef handler) {
    if (!handler || !handler->fn) {
        throw CallProcError("cannot register an empty handler for " + event_type);
    }
    std::lock_guard<std::mutex> lock(mu_);
    handlers_[event_type].push_back(handler);
    logging::get_logger("events.registry")->debug("Registered handler '{}' for {}", handler->name, event_type);
}

bool HandlerRegistry::unregister_handler(const std::string& event_type, const HandlerRef& handler) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = handlers_.find(event_type);
    if (it == handlers_.end()) return false;

    auto& list = it->second;
    auto pos = std::find(list.begin(), list.end(), handler);
    if (pos == list.end()) return false;

    list.erase(pos);
    if (list.empty()) handlers_.erase(it);
    logging::get_logger("events.registry")->debug("Unregistered handler '{}' for {}",
                                                  handler ? handler->name : "<null>", event_type);
    return true;
}

std::vector<HandlerRef> HandlerRegistry::handlers_for(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = handlers_.find(event_type);
    return it == handlers_.end() ? std::vector<HandlerRef>{} : it->second;
}

std::size_t HandlerRegistry::handler_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t total = 0;
    for (const auto& [type, list] : handlers_) total += list.size();
    return total;
}

std::vector<std::string> HandlerRegistry::event_types() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> types;
    types.reserve(handlers_.size());
    for (const auto& [type, list] : handlers_) types.push_back(type);
    return types;
}

// -----------------------------------------------------------------------------
// ActiveCallSet
// -----------------------------------------------------------------------------

void ActiveCallSet::add(const std::string& call_connection_id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (std::find(calls_.begin(), calls_.end(), call_connection_id) == calls_.end()) {
        calls_.push_back(call_connection_id);
    }
}

void ActiveCallSet::remove(const std::string& call_connection_id) {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.erase(std::remove(calls_.begin(), calls_.end(), call_connection_id), calls_.end());
}

bool ActiveCallSet::contains(const std::string& call_connection_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return std::find(calls_.begin(), calls_.end(), call_connection_id) != calls_.end();
}

std::size_t ActiveCallSet::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_.size();
}

std::vector<std::string> ActiveCallSet::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
}

} // namespace events
} // namespace callproc
