#include "config/bridge_config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace config {

std::vector<int> port_range(const BridgeConfig &config) {
    std::vector<int> ports;
    for (int port = config.port_start; port <= config.port_end; port++) {
        ports.push_back(port);
    }
    return ports;
}

// strtol with full-string and range checking.
static bool parse_integer(const std::string &text, int &output_value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char *end_pointer = nullptr;
    long parsed_value = std::strtol(text.c_str(), &end_pointer, 10);
    if (errno != 0 || end_pointer == nullptr || *end_pointer != '\0') {
        return false;
    }
    if (parsed_value < INT_MIN || parsed_value > INT_MAX) {
        return false;
    }
    output_value = static_cast<int>(parsed_value);
    return true;
}

static bool read_integer_variable(const char *variable_name, int &output_value, std::string &error_message) {
    const char *value = std::getenv(variable_name);
    if (value == nullptr || value[0] == '\0') {
        return true;
    }
    if (!parse_integer(value, output_value)) {
        error_message = std::string("Invalid integer in ") + variable_name + ": '" + value + "'";
        return false;
    }
    return true;
}

bool load_from_environment(BridgeConfig &config, std::string &error_message) {
    const char *host = std::getenv("CTXBRIDGE_HOST");
    if (host != nullptr && host[0] != '\0') {
        config.host = host;
    }

    return read_integer_variable("CTXBRIDGE_PORT_START", config.port_start, error_message) &&
           read_integer_variable("CTXBRIDGE_PORT_END", config.port_end, error_message) &&
           read_integer_variable("CTXBRIDGE_MAX_RETRIES", config.max_connection_attempts, error_message) &&
           read_integer_variable("CTXBRIDGE_RETRY_DELAY_MS", config.retry_delay_milliseconds, error_message) &&
           read_integer_variable("CTXBRIDGE_PROBE_TIMEOUT_MS", config.probe_timeout_milliseconds, error_message) &&
           read_integer_variable("CTXBRIDGE_REQUEST_TIMEOUT_MS", config.request_timeout_milliseconds, error_message) &&
           read_integer_variable("CTXBRIDGE_MAX_MESSAGE_BYTES", config.max_message_bytes, error_message) &&
           read_integer_variable("CTXBRIDGE_AGGREGATION_TIMEOUT_MS", config.aggregation_timeout_milliseconds, error_message) &&
           read_integer_variable("CTXBRIDGE_MAX_SECONDARIES", config.max_secondaries, error_message) &&
           read_integer_variable("CTXBRIDGE_WORKER_THREADS", config.worker_threads, error_message);
}

bool parse_command_line(int argc, char **argv, BridgeConfig &config, std::string &error_message) {
    // Flags that take an integer value.
    struct IntegerFlag {
        const char *name;
        int *target;
    };
    const IntegerFlag integer_flags[] = {
        {"--port-start", &config.port_start},
        {"--port-end", &config.port_end},
        {"--max-retries", &config.max_connection_attempts},
        {"--retry-delay-ms", &config.retry_delay_milliseconds},
        {"--probe-timeout-ms", &config.probe_timeout_milliseconds},
        {"--request-timeout-ms", &config.request_timeout_milliseconds},
        {"--max-message-bytes", &config.max_message_bytes},
        {"--aggregation-timeout-ms", &config.aggregation_timeout_milliseconds},
        {"--max-secondaries", &config.max_secondaries},
        {"--worker-threads", &config.worker_threads},
        {"--tab-id", &config.active_tab_id},
    };

    for (int index = 1; index < argc; index++) {
        const char *argument = argv[index];

        if (strcmp(argument, "--untrusted") == 0) {
            config.workspace_trusted = false;
            continue;
        }

        if (index + 1 >= argc) {
            error_message = std::string("Missing value for ") + argument;
            return false;
        }
        const char *value = argv[index + 1];

        bool matched = false;
        for (const auto &flag : integer_flags) {
            if (strcmp(argument, flag.name) == 0) {
                if (!parse_integer(value, *flag.target)) {
                    error_message = std::string("Invalid integer for ") + argument + ": '" + value + "'";
                    return false;
                }
                matched = true;
                break;
            }
        }

        if (!matched) {
            if (strcmp(argument, "--host") == 0) {
                config.host = value;
            } else if (strcmp(argument, "--workspace") == 0) {
                config.workspace_folders.push_back(value);
            } else if (strcmp(argument, "--open") == 0) {
                config.open_files.push_back(value);
            } else if (strcmp(argument, "--window-id") == 0) {
                config.window_id = value;
            } else if (strcmp(argument, "--llm-host") == 0) {
                config.llm_host = value;
            } else {
                error_message = std::string("Unknown option: ") + argument;
                return false;
            }
        }
        index++;
    }
    return true;
}

bool validate(const BridgeConfig &config, std::string &error_message) {
    if (config.host.empty()) {
        error_message = "Host must not be empty.";
        return false;
    }
    if (config.port_start <= 0 || config.port_end > 65535 || config.port_start > config.port_end) {
        error_message = "Port range " + std::to_string(config.port_start) + ".." +
                        std::to_string(config.port_end) + " is empty or out of bounds.";
        return false;
    }
    if (config.max_connection_attempts <= 0) {
        error_message = "Maximum connection attempts must be at least 1.";
        return false;
    }
    if (config.retry_delay_milliseconds < 0 || config.probe_timeout_milliseconds <= 0 ||
        config.request_timeout_milliseconds <= 0 || config.aggregation_timeout_milliseconds <= 0) {
        error_message = "Timeouts must be positive (retry delay may be zero).";
        return false;
    }
    if (config.max_message_bytes <= 0) {
        error_message = "Maximum message size must be positive.";
        return false;
    }
    if (config.max_secondaries < 0) {
        error_message = "Maximum secondaries must not be negative.";
        return false;
    }
    if (config.worker_threads <= 0) {
        error_message = "Worker thread count must be at least 1.";
        return false;
    }
    return true;
}

std::string usage_text(const std::string &program_name) {
    std::ostringstream usage;
    usage << "Usage: " << program_name << " [options]\n"
          << "  --host ADDRESS               Loopback address (default 127.0.0.1)\n"
          << "  --port-start N               First candidate port (default 30001)\n"
          << "  --port-end N                 Last candidate port (default 30005)\n"
          << "  --max-retries N              Connection attempts before giving up (default 5)\n"
          << "  --retry-delay-ms N           Delay between connection attempts (default 3000)\n"
          << "  --probe-timeout-ms N         Port probe timeout (default 2000)\n"
          << "  --request-timeout-ms N       Per-request timeout (default 30000)\n"
          << "  --max-message-bytes N        Largest accepted WebSocket message (default 67108864)\n"
          << "  --aggregation-timeout-ms N   Multi-window aggregation deadline (default 5000)\n"
          << "  --max-secondaries N          Secondary windows accepted by a Primary (default 16)\n"
          << "  --worker-threads N           Command worker threads (default 4)\n"
          << "  --workspace DIR              Workspace root folder (repeatable)\n"
          << "  --open FILE                  Open editor file; the first is active (repeatable)\n"
          << "  --untrusted                  Mark the workspace as not trusted\n"
          << "  --window-id ID               Window identifier (default: random UUID)\n"
          << "  --tab-id N                   Client: register as the active target tab\n"
          << "  --llm-host HOST              Client: host name sent with --tab-id\n";
    return usage.str();
}

} // namespace config
