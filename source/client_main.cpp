// ctxbridge_client: browser-agent side of the bridge.
// Entry point: reads requests from stdin, routes them to whichever window is primary, and
// prints every response and push as one JSON line on stdout.
//
// stdin carries one JSON object per line: {"command":..., "payload":...} requests and {"action":"reconnect"} /
// {"action":"disconnect"} controls. Connection status goes to stderr.

#include <nlohmann/json.hpp>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "client/connection_supervisor.hpp"
#include "client/request_router.hpp"
#include "client/workspace_client.hpp"
#include "config/bridge_config.hpp"
#include "protocol/wire_protocol.hpp"
#include "transport/lws_client_transport.hpp"
#include "utils/console_io.hpp"
#include "utils/debug_log.hpp"
#include "utils/timer_queue.hpp"

using json = nlohmann::json;

static json result_line(const std::string &command, const request_router::RequestResult &result) {
    json line;
    line["command"] = command;
    line["success"] = result.success;
    if (result.success) {
        line["payload"] = result.payload;
    } else {
        line["error"] = result.error_message;
        line["errorCode"] = result.error_code;
    }
    return line;
}

static void print_push(const wire_protocol::Message &push) {
    json line;
    line["push"] = push.command;
    line["payload"] = push.payload;
    console_io::write_message(line.dump(-1, ' ', false, json::error_handler_t::replace));
}

int main(int argc, char **argv) {
    std::cerr << "[ctxbridge] ctxbridge client, build " << __DATE__ << " " << __TIME__ << std::endl;

    config::BridgeConfig bridge_config;
    std::string error_message;
    if (!config::load_from_environment(bridge_config, error_message) ||
        !config::parse_command_line(argc, argv, bridge_config, error_message) ||
        !config::validate(bridge_config, error_message)) {
        debug_log::log_message("Error: " + error_message);
        std::cerr << config::usage_text(argv[0]);
        return 2;
    }

    lws_client_transport::LwsClientTransport transport(bridge_config.probe_timeout_milliseconds,
                                                       static_cast<size_t>(bridge_config.max_message_bytes));
    connection_supervisor::ConnectionSupervisor supervisor(transport,
                                                           connection_supervisor::options_from_config(bridge_config));
    timer_queue::TimerQueue timers;
    request_router::RequestRouter router(supervisor, timers, bridge_config.request_timeout_milliseconds);
    workspace_client::WorkspaceClient client(router);

    router.set_push_handler(print_push);

    // Active-target registrations are sent from the supervisor thread and awaited here at exit.
    std::mutex registration_mutex;
    std::vector<std::future<request_router::RequestResult>> registrations;

    const int tab_id = bridge_config.active_tab_id;
    const std::string llm_host = bridge_config.llm_host;
    supervisor.set_status_observer([&](connection_supervisor::ConnectionStatus status, const std::string &detail) {
        debug_log::log_message("Status " + connection_supervisor::to_string(status) + ": " + detail);
        if (status != connection_supervisor::ConnectionStatus::Connected || tab_id < 0) {
            return;
        }
        // Every new connection is a new client record on the primary, so register again.
        std::lock_guard<std::mutex> lock(registration_mutex);
        registrations.push_back(client.register_active_target(tab_id, llm_host));
    });

    debug_log::log_message("Client started. Waiting for requests on stdin.");

    while (true) {
        console_io::ReadResult input = console_io::read_message(std::cin);
        if (input.status == console_io::ReadStatus::EndOfInput) {
            debug_log::log("EOF on stdin. Shutting down.");
            break;
        }
        if (input.status == console_io::ReadStatus::Malformed) {
            debug_log::log_message("Warning: Failed to parse input: " + input.error_message);
            continue;
        }
        const json &parsed_message = input.message;

        std::string action = wire_protocol::get_string(parsed_message, "action", "");
        if (action == "reconnect") {
            supervisor.reconnect();
            continue;
        }
        if (action == "disconnect") {
            supervisor.disconnect();
            continue;
        }
        if (!action.empty()) {
            debug_log::log_message("Warning: Unknown action '" + action + "' ignored.");
            continue;
        }

        std::string command = wire_protocol::get_string(parsed_message, "command", "");
        if (command.empty()) {
            debug_log::log_message("Warning: Input has neither 'command' nor 'action'.");
            continue;
        }
        json payload = parsed_message.contains("payload") ? parsed_message["payload"] : json::object();

        request_router::RequestResult result = router.send_and_wait(command, payload);
        console_io::write_message(result_line(command, result).dump(-1, ' ', false, json::error_handler_t::replace));
    }

    supervisor.set_status_observer(nullptr);
    router.set_push_handler(nullptr);

    std::vector<std::future<request_router::RequestResult>> pending_registrations;
    {
        std::lock_guard<std::mutex> lock(registration_mutex);
        pending_registrations.swap(registrations);
    }
    for (auto &registration : pending_registrations) {
        request_router::RequestResult outcome = registration.get();
        if (!outcome.success) {
            debug_log::log_message("Warning: Active target registration failed (" + outcome.error_code + "): " +
                                   outcome.error_message);
        }
    }

    supervisor.disconnect();
    debug_log::log_message("Client shut down.");
    return 0;
}
