#ifndef CTXBRIDGE_BRIDGE_CONFIG_HPP
#define CTXBRIDGE_BRIDGE_CONFIG_HPP

// Operational constants for both executables.
// Values come from defaults, then CTXBRIDGE_* environment variables, then command-line flags.

#include <string>
#include <vector>

namespace config {

struct BridgeConfig {
    std::string host = "127.0.0.1";
    int port_start = 30001;
    int port_end = 30005;

    // Client connection supervision.
    int max_connection_attempts = 5;
    int retry_delay_milliseconds = 3000;
    int probe_timeout_milliseconds = 2000;
    int request_timeout_milliseconds = 30000;

    // Largest WebSocket message either side assembles; a connection exceeding it is closed.
    int max_message_bytes = 64 * 1024 * 1024;

    // Primary-side multi-window coordination.
    int aggregation_timeout_milliseconds = 5000;
    int max_secondaries = 16;
    int worker_threads = 4;

    // Editor-window process only.
    std::vector<std::string> workspace_folders;
    std::vector<std::string> open_files;
    bool workspace_trusted = true;
    std::string window_id;

    // Browser-agent client only.
    int active_tab_id = -1;
    std::string llm_host;
};

// Candidate ports in ascending order.
std::vector<int> port_range(const BridgeConfig &config);

// Apply CTXBRIDGE_* environment overrides. Returns false (with error_message) on an unparsable value.
bool load_from_environment(BridgeConfig &config, std::string &error_message);

// Apply command-line flags. Unknown flags and missing values are errors.
bool parse_command_line(int argc, char **argv, BridgeConfig &config, std::string &error_message);

// Check ranges and timeouts. Returns false with error_message describing the first problem.
bool validate(const BridgeConfig &config, std::string &error_message);

// Usage text listing every flag.
std::string usage_text(const std::string &program_name);

} // namespace config

#endif // CTXBRIDGE_BRIDGE_CONFIG_HPP
