#ifndef CTXBRIDGE_LWS_LOGGING_HPP
#define CTXBRIDGE_LWS_LOGGING_HPP

namespace lws_logging {

// Route libwebsockets' own error and warning lines through debug_log (debug-gated).
// Idempotent; every transport calls it before creating a context.
void route_library_logs();

} // namespace lws_logging

#endif // CTXBRIDGE_LWS_LOGGING_HPP
