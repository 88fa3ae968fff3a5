// ctxbridge: editor-window process.
// Entry point: elects a primary among the windows sharing the port range, serves workspace
// commands, and reads local editor actions from stdin.
//
// stdin carries one JSON object per line, such as {"action":"send_snippet","payload":{...}} or
// {"action":"set_diagnostics","diagnostics":[...]}. Logs go to stderr; status replies go to stdout.

#include <nlohmann/json.hpp>
#include <chrono>
#include <csignal>
#include <pthread.h>
#include <signal.h>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "command_handlers/command_handlers.hpp"
#include "config/bridge_config.hpp"
#include "multi_window/multi_window_coordinator.hpp"
#include "protocol/wire_protocol.hpp"
#include "server/command_dispatcher.hpp"
#include "server/command_registry.hpp"
#include "transport/lws_transport_factory.hpp"
#include "utils/console_io.hpp"
#include "utils/debug_log.hpp"
#include "workspace/diagnostics_store.hpp"
#include "workspace/local_workspace.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// Installed without SA_RESTART so a blocking read on stdin returns when a signal arrives.
static void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// Threads started while the signals are blocked inherit the mask, so only the main thread
// (the one reading stdin) ever receives them.
static void set_shutdown_signals_blocked(bool blocked) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(blocked ? SIG_BLOCK : SIG_UNBLOCK, &signals, nullptr);
}

static json status_of(const multi_window_coordinator::MultiWindowCoordinator &coordinator) {
    json status;
    status["role"] = multi_window_coordinator::to_string(coordinator.role());
    status["windowId"] = coordinator.window_id();
    status["port"] = coordinator.port();
    status["secondaries"] = coordinator.registered_secondary_count();
    return status;
}

// Replaces the whole problem set; one malformed entry rejects the update.
static void replace_diagnostics(const json &message, diagnostics_store::DiagnosticsStore &diagnostics) {
    if (!message.contains("diagnostics") || !message["diagnostics"].is_array()) {
        debug_log::log_message("Warning: set_diagnostics needs a 'diagnostics' array.");
        return;
    }
    std::vector<diagnostics_store::Diagnostic> parsed_diagnostics;
    for (const auto &entry : message["diagnostics"]) {
        diagnostics_store::Diagnostic diagnostic;
        std::string error_message;
        if (!diagnostics_store::diagnostic_from_json(entry, diagnostic, error_message)) {
            debug_log::log_message("Warning: Diagnostics update rejected: " + error_message);
            return;
        }
        parsed_diagnostics.push_back(diagnostic);
    }
    debug_log::log("Diagnostics replaced: " + std::to_string(parsed_diagnostics.size()) + " problem(s).");
    diagnostics.replace_all(std::move(parsed_diagnostics));
}

static void handle_action(const json &message, multi_window_coordinator::MultiWindowCoordinator &coordinator,
                          diagnostics_store::DiagnosticsStore &diagnostics) {
    std::string action = wire_protocol::get_string(message, "action", "");

    if (action == "send_snippet") {
        json snippet_payload = message.contains("payload") ? message["payload"] : json::object();
        if (!snippet_payload.is_object()) {
            debug_log::log_message("Warning: send_snippet payload must be an object.");
            return;
        }
        if (!coordinator.send_snippet(snippet_payload)) {
            debug_log::log_message("Warning: Snippet was not delivered (role: " +
                                   multi_window_coordinator::to_string(coordinator.role()) + ").");
        }
        return;
    }

    if (action == "set_diagnostics") {
        replace_diagnostics(message, diagnostics);
        return;
    }

    if (action == "status") {
        console_io::write_message(status_of(coordinator).dump());
        return;
    }

    debug_log::log_message("Warning: Unknown action '" + action + "' ignored.");
}

int main(int argc, char **argv) {
    std::cerr << "[ctxbridge] ctxbridge editor window, build " << __DATE__ << " " << __TIME__ << std::endl;

    config::BridgeConfig bridge_config;
    std::string error_message;
    if (!config::load_from_environment(bridge_config, error_message) ||
        !config::parse_command_line(argc, argv, bridge_config, error_message) ||
        !config::validate(bridge_config, error_message)) {
        debug_log::log_message("Error: " + error_message);
        std::cerr << config::usage_text(argv[0]);
        return 2;
    }
    if (bridge_config.window_id.empty()) {
        bridge_config.window_id = wire_protocol::generate_message_id();
    }

    install_signal_handlers();
    set_shutdown_signals_blocked(true);

    local_workspace::LocalWorkspace workspace(bridge_config.workspace_folders, bridge_config.open_files,
                                              bridge_config.workspace_trusted);
    diagnostics_store::DiagnosticsStore diagnostics;
    command_registry::CommandRegistry registry;
    command_handlers::register_all_commands(registry, workspace, diagnostics);
    command_dispatcher::CommandDispatcher dispatcher(registry, workspace);

    lws_transport_factory::LwsTransportFactory transports = lws_transport_factory::factory_from_config(bridge_config);
    multi_window_coordinator::MultiWindowCoordinator coordinator(bridge_config, bridge_config.window_id, dispatcher,
                                                                 transports);
    coordinator.start();
    set_shutdown_signals_blocked(false);

    debug_log::log_message("Window " + bridge_config.window_id + " started with " +
                           std::to_string(workspace.folders().size()) + " workspace folder(s). Waiting for actions on stdin.");

    while (!shutdown_requested) {
        console_io::ReadResult input = console_io::read_message(std::cin);

        if (input.status == console_io::ReadStatus::EndOfInput) {
            if (shutdown_requested) {
                break;
            }
            // EOF on stdin: keep serving until a signal arrives.
            debug_log::log("EOF on stdin. Serving until SIGINT/SIGTERM.");
            while (!shutdown_requested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            break;
        }
        if (input.status == console_io::ReadStatus::Malformed) {
            debug_log::log_message("Warning: Failed to parse action: " + input.error_message);
            continue;
        }

        handle_action(input.message, coordinator, diagnostics);
    }

    debug_log::log("Shutdown requested; leaving role " + multi_window_coordinator::to_string(coordinator.role()) + ".");
    coordinator.stop();
    debug_log::log_message("ctxbridge window " + bridge_config.window_id + " shut down.");

    return 0;
}
