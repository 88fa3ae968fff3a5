#ifndef CTXBRIDGE_DEBUG_LOG_HPP
#define CTXBRIDGE_DEBUG_LOG_HPP

// Process-wide logging to stderr.
// Every line carries the [ctxbridge] prefix; lines from concurrent threads never interleave.

#include <string>
#include <functional>

namespace debug_log {

// Receives each formatted line (prefix included) instead of stderr.
using OutputSink = std::function<void(const std::string &line)>;

// Returns true if CTXBRIDGE_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [ctxbridge] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [ctxbridge] prefix unconditionally.
// Warnings and errors start with "Warning:" / "Error:".
void log_message(const std::string &message);

// Redirect output (used by tests). Pass an empty function to restore stderr.
void set_output_sink(OutputSink sink);

} // namespace debug_log

#endif // CTXBRIDGE_DEBUG_LOG_HPP
