#ifndef CALLPROC_SERVICES_TELEPHONY_HPP
#define CALLPROC_SERVICES_TELEPHONY_HPP

#include "../events/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace callproc {
namespace services {

using events::Participant;

// -----------------------------------------------------------------------------
// Telephony provider (consumed; implemented by the host)
// -----------------------------------------------------------------------------
// Implementations raise ProviderError on failure.
class CallConnection {
public:
    virtual ~CallConnection() = default;

    virtual std::vector<Participant> list_participants() = 0;
    virtual void hang_up(bool is_for_everyone) = 0;
    virtual void start_continuous_dtmf_recognition(const Participant& target,
                                                   const std::string& operation_context) = 0;
};

class TelephonyProvider {
public:
    virtual ~TelephonyProvider() = default;

    virtual std::shared_ptr<CallConnection> get_call_connection(const std::string& call_connection_id) = 0;
};

// -----------------------------------------------------------------------------
// Observer / broadcast (fire-and-forget, keyed by presentation session id)
// -----------------------------------------------------------------------------
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void broadcast(const std::string& session_id, const Json& message) = 0;
};

// -----------------------------------------------------------------------------
// Session-aware graceful termination
// -----------------------------------------------------------------------------
class SessionTerminator {
public:
    virtual ~SessionTerminator() = default;

    // true when the call was terminated through the session layer
    virtual bool terminate_session(const std::string& call_connection_id, const std::string& reason) = 0;
};

} // namespace services
} // namespace callproc

#endif // CALLPROC_SERVICES_TELEPHONY_HPP
