#ifndef CALLPROC_EVENTS_REGISTRATION_HPP
#define CALLPROC_EVENTS_REGISTRATION_HPP

#include "processor.hpp"

namespace callproc {
namespace events {

// Wire the lifecycle and DTMF handlers into a processor. The host calls this
// once per processor; calling it again registers every handler a second time.
void register_default_handlers(CallEventProcessor& processor);

} // namespace events
} // namespace callproc

#endif // CALLPROC_EVENTS_REGISTRATION_HPP
