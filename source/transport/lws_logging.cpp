#include "transport/lws_logging.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <mutex>
#include <string>

namespace lws_logging {

static void emit_library_line(int level, const char *line) {
    std::string text = (line != nullptr) ? line : "";
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    debug_log::log(std::string(level == LLL_ERR ? "libwebsockets error: " : "libwebsockets: ") + text);
}

void route_library_logs() {
    static std::once_flag configured;
    std::call_once(configured, [] { lws_set_log_level(LLL_ERR | LLL_WARN, emit_library_line); });
}

} // namespace lws_logging
