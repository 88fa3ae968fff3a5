// Tests for configuration defaults, environment overrides, flags and validation.

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "config/bridge_config.hpp"
#include "test_support.hpp"

using test_support::report;

namespace test_bridge_config {

// Build a mutable argv from string literals.
struct ArgumentList {
    std::vector<std::string> storage;
    std::vector<char *> pointers;

    explicit ArgumentList(const std::vector<std::string> &arguments) : storage(arguments) {
        for (auto &argument : storage) {
            pointers.push_back(&argument[0]);
        }
        pointers.push_back(nullptr);
    }

    int count() const { return static_cast<int>(storage.size()); }
    char **values() { return pointers.data(); }
};

// Test: defaults match the documented constants.
static bool test_defaults() {
    config::BridgeConfig bridge_config;
    std::vector<int> ports = config::port_range(bridge_config);
    bool success = bridge_config.host == "127.0.0.1" && ports.size() == 5 && ports.front() == 30001 &&
                   ports.back() == 30005 && bridge_config.max_connection_attempts == 5 &&
                   bridge_config.retry_delay_milliseconds == 3000 && bridge_config.probe_timeout_milliseconds == 2000 &&
                   bridge_config.request_timeout_milliseconds == 30000 &&
                   bridge_config.aggregation_timeout_milliseconds == 5000 && bridge_config.max_secondaries == 16 &&
                   bridge_config.workspace_trusted;
    return report(success, "Defaults: 127.0.0.1, ports 30001-30005, 5 attempts, 3000/2000/30000/5000 ms");
}

// Test: environment variables override defaults.
static bool test_environment_overrides() {
    setenv("CTXBRIDGE_PORT_START", "40001", 1);
    setenv("CTXBRIDGE_PORT_END", "40003", 1);
    setenv("CTXBRIDGE_REQUEST_TIMEOUT_MS", "1500", 1);

    config::BridgeConfig bridge_config;
    std::string error_message;
    bool loaded = config::load_from_environment(bridge_config, error_message);

    unsetenv("CTXBRIDGE_PORT_START");
    unsetenv("CTXBRIDGE_PORT_END");
    unsetenv("CTXBRIDGE_REQUEST_TIMEOUT_MS");

    bool success = loaded && bridge_config.port_start == 40001 && bridge_config.port_end == 40003 &&
                   bridge_config.request_timeout_milliseconds == 1500;
    return report(success, "Environment overrides port range and request timeout", error_message);
}

// Test: an unparsable environment value is an error.
static bool test_environment_rejects_garbage() {
    setenv("CTXBRIDGE_MAX_RETRIES", "five", 1);
    config::BridgeConfig bridge_config;
    std::string error_message;
    bool loaded = config::load_from_environment(bridge_config, error_message);
    unsetenv("CTXBRIDGE_MAX_RETRIES");

    return report(!loaded && error_message.find("CTXBRIDGE_MAX_RETRIES") != std::string::npos,
                  "Non-numeric CTXBRIDGE_MAX_RETRIES rejected", error_message);
}

// Test: command-line flags are applied, repeatable flags accumulate.
static bool test_command_line_flags() {
    ArgumentList arguments({"ctxbridge", "--port-start", "31000", "--port-end", "31002", "--workspace", "/tmp/a",
                            "--workspace", "/tmp/b", "--open", "/tmp/a/main.cpp", "--untrusted", "--window-id",
                            "window-7", "--tab-id", "12", "--llm-host", "chat.example"});
    config::BridgeConfig bridge_config;
    std::string error_message;
    bool parsed = config::parse_command_line(arguments.count(), arguments.values(), bridge_config, error_message);

    bool success = parsed && bridge_config.port_start == 31000 && bridge_config.port_end == 31002 &&
                   bridge_config.workspace_folders.size() == 2 && bridge_config.workspace_folders[1] == "/tmp/b" &&
                   bridge_config.open_files.size() == 1 && !bridge_config.workspace_trusted &&
                   bridge_config.window_id == "window-7" && bridge_config.active_tab_id == 12 &&
                   bridge_config.llm_host == "chat.example";
    return report(success, "Command-line flags parsed", error_message);
}

// Test: unknown flags and missing values are errors.
static bool test_command_line_errors() {
    ArgumentList unknown({"ctxbridge", "--frobnicate", "1"});
    ArgumentList missing({"ctxbridge", "--port-start"});
    ArgumentList not_a_number({"ctxbridge", "--port-end", "30x"});
    config::BridgeConfig bridge_config;
    std::string unknown_error;
    std::string missing_error;
    std::string number_error;

    bool success = !config::parse_command_line(unknown.count(), unknown.values(), bridge_config, unknown_error) &&
                   !config::parse_command_line(missing.count(), missing.values(), bridge_config, missing_error) &&
                   !config::parse_command_line(not_a_number.count(), not_a_number.values(), bridge_config,
                                               number_error) &&
                   unknown_error.find("Unknown option") != std::string::npos &&
                   missing_error.find("Missing value") != std::string::npos;
    return report(success, "Unknown flag, missing value and bad integer rejected");
}

// Test: validation rejects inverted ranges, zero attempts and non-positive timeouts.
static bool test_validation() {
    std::string error_message;
    config::BridgeConfig valid;
    bool valid_passes = config::validate(valid, error_message);

    config::BridgeConfig inverted;
    inverted.port_start = 30010;
    inverted.port_end = 30001;
    config::BridgeConfig zero_attempts;
    zero_attempts.max_connection_attempts = 0;
    config::BridgeConfig zero_timeout;
    zero_timeout.request_timeout_milliseconds = 0;
    config::BridgeConfig single_port;
    single_port.port_start = 30001;
    single_port.port_end = 30001;

    bool success = valid_passes && !config::validate(inverted, error_message) &&
                   !config::validate(zero_attempts, error_message) && !config::validate(zero_timeout, error_message) &&
                   config::validate(single_port, error_message);
    return report(success, "Validation rejects inverted range, zero attempts and zero timeout");
}

// Test: the message size cap defaults to 64 MiB, can be overridden, and must be positive.
static bool test_max_message_bytes() {
    config::BridgeConfig defaults;

    setenv("CTXBRIDGE_MAX_MESSAGE_BYTES", "1048576", 1);
    config::BridgeConfig from_environment;
    std::string error_message;
    bool loaded = config::load_from_environment(from_environment, error_message);
    unsetenv("CTXBRIDGE_MAX_MESSAGE_BYTES");

    ArgumentList arguments({"ctxbridge", "--max-message-bytes", "4096"});
    config::BridgeConfig from_flags;
    bool parsed = config::parse_command_line(arguments.count(), arguments.values(), from_flags, error_message);

    config::BridgeConfig zero_limit;
    zero_limit.max_message_bytes = 0;
    std::string validation_error;
    bool zero_rejected = !config::validate(zero_limit, validation_error);

    bool success = defaults.max_message_bytes == 64 * 1024 * 1024 && loaded &&
                   from_environment.max_message_bytes == 1048576 && parsed && from_flags.max_message_bytes == 4096 &&
                   zero_rejected && validation_error.find("message size") != std::string::npos;
    return report(success, "Message size cap: 64 MiB default, env and flag overrides, zero rejected",
                  error_message + " | " + validation_error);
}

// Test: usage text lists every flag.
static bool test_usage_lists_flags() {
    std::string usage = config::usage_text("ctxbridge");
    bool success = true;
    for (const char *flag : {"--host", "--port-start", "--port-end", "--max-retries", "--retry-delay-ms",
                             "--probe-timeout-ms", "--request-timeout-ms", "--max-message-bytes",
                             "--aggregation-timeout-ms",
                             "--max-secondaries", "--worker-threads", "--workspace", "--open", "--untrusted",
                             "--window-id", "--tab-id", "--llm-host"}) {
        if (usage.find(flag) == std::string::npos) {
            success = false;
        }
    }
    return report(success, "Usage text lists every flag");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults();
    all_passed &= test_environment_overrides();
    all_passed &= test_environment_rejects_garbage();
    all_passed &= test_command_line_flags();
    all_passed &= test_command_line_errors();
    all_passed &= test_validation();
    all_passed &= test_max_message_bytes();
    all_passed &= test_usage_lists_flags();
    return all_passed;
}

} // namespace test_bridge_config
