// Tests for request/response correlation, deadlines and push routing.

#include <nlohmann/json.hpp>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "client/connection_supervisor.hpp"
#include "client/request_router.hpp"
#include "client/workspace_client.hpp"
#include "protocol/command_names.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"
#include "utils/timer_queue.hpp"

using json = nlohmann::json;
using test_support::report;

namespace test_request_router {

static connection_supervisor::SupervisorOptions single_attempt_options() {
    connection_supervisor::SupervisorOptions options;
    options.ports = {30001};
    options.max_attempts = 1;
    options.retry_delay_milliseconds = 0;
    return options;
}

// Transport, supervisor, timers and router wired together.
struct RouterFixture {
    test_fakes::FakeClientTransport transport;
    connection_supervisor::ConnectionSupervisor supervisor;
    timer_queue::TimerQueue timers;
    request_router::RequestRouter router;

    explicit RouterFixture(int timeout_milliseconds, bool reachable = true)
        : supervisor(transport, single_attempt_options()), router(supervisor, timers, timeout_milliseconds) {
        if (reachable) {
            transport.script_discoveries({30001});
        }
    }
};

// Test: the response with the request's id resolves the future with its payload.
static bool test_response_resolves_request() {
    RouterFixture fixture(2000);
    fixture.transport.set_responder([](const std::string &frame) {
        json payload;
        payload["success"] = true;
        payload["data"]["files"] = json::array({"a.cpp"});
        return std::vector<std::string>{test_fakes::reply_to(frame, payload)};
    });

    request_router::RequestResult result = fixture.router.send_and_wait(command_names::GET_OPEN_FILES, json::object());
    bool success = result.success && result.payload["data"]["files"][0] == "a.cpp" &&
                   fixture.router.pending_count() == 0;
    return report(success, "Response resolves the matching request", result.error_message);
}

// Test: responses arriving out of order reach their own requests.
static bool test_out_of_order_responses() {
    RouterFixture fixture(2000);
    std::future<request_router::RequestResult> first =
        fixture.router.send(command_names::SEARCH_WORKSPACE, json{{"query", "first"}});
    std::future<request_router::RequestResult> second =
        fixture.router.send(command_names::SEARCH_WORKSPACE, json{{"query", "second"}});

    std::vector<std::string> sent = fixture.transport.sent_frames();
    if (sent.size() != 2) {
        return report(false, "Out-of-order responses", "expected two sent frames");
    }
    fixture.transport.deliver(test_fakes::reply_to(sent[1], json{{"success", true}, {"tag", "second"}}));
    fixture.transport.deliver(test_fakes::reply_to(sent[0], json{{"success", true}, {"tag", "first"}}));

    request_router::RequestResult first_result = first.get();
    request_router::RequestResult second_result = second.get();
    bool success = first_result.payload["tag"] == "first" && second_result.payload["tag"] == "second";
    return report(success, "Out-of-order responses are matched by message id");
}

// Test: an error_response resolves the request as a failure with the server's code.
static bool test_error_response_fails_request() {
    RouterFixture fixture(2000);
    fixture.transport.set_responder([](const std::string &frame) {
        wire_protocol::DecodeResult decoded = wire_protocol::decode(frame);
        wire_protocol::Message error = wire_protocol::make_error_response(
            decoded.message.message_id, wire_protocol::UNKNOWN_COMMAND, "Unknown command.", decoded.message.command);
        return std::vector<std::string>{wire_protocol::encode(error)};
    });

    request_router::RequestResult result = fixture.router.send_and_wait("frobnicate", json::object());
    bool success = !result.success && result.error_code == wire_protocol::UNKNOWN_COMMAND &&
                   result.error_message == "Unknown command.";
    return report(success, "error_response resolves as failure with its code", result.error_code);
}

// Test: a normal response whose payload says success:false is a failure too.
static bool test_failed_payload_is_failure() {
    RouterFixture fixture(2000);
    fixture.transport.set_responder([](const std::string &frame) {
        json payload = wire_protocol::build_error_payload("FILE_NOT_FOUND", "No such file.", "get_file_content");
        return std::vector<std::string>{test_fakes::reply_to(frame, payload)};
    });

    request_router::RequestResult result =
        fixture.router.send_and_wait(command_names::GET_FILE_CONTENT, json{{"filePath", "/nope"}});
    return report(!result.success && result.error_code == "FILE_NOT_FOUND",
                  "Response payload with success:false is reported as failure", result.error_code);
}

// Test: an unanswered request times out and a late answer is dropped.
static bool test_timeout_then_late_response() {
    RouterFixture fixture(80);
    std::future<request_router::RequestResult> pending =
        fixture.router.send(command_names::GET_WORKSPACE_DETAILS, json::object());
    request_router::RequestResult result = pending.get();

    std::vector<std::string> sent = fixture.transport.sent_frames();
    if (!sent.empty()) {
        fixture.transport.deliver(test_fakes::reply_to(sent[0], json{{"success", true}}));
    }

    bool success = !result.success && result.error_code == request_router::IPC_REQUEST_TIMEOUT &&
                   result.error_message.find("get_workspace_details") != std::string::npos &&
                   fixture.router.pending_count() == 0;
    return report(success, "Request times out with IPC_REQUEST_TIMEOUT; late response dropped", result.error_message);
}

// Test: with no server reachable the request fails immediately.
static bool test_not_connected() {
    RouterFixture fixture(2000, false);
    request_router::RequestResult result = fixture.router.send_and_wait(command_names::GET_OPEN_FILES, json::object());
    bool success = !result.success && result.error_code == request_router::IPC_CLIENT_NOT_CONNECTED &&
                   fixture.transport.sent_frames().empty();
    return report(success, "Unreachable server yields IPC_CLIENT_NOT_CONNECTED", result.error_code);
}

// Test: pushes go to the push handler and never touch pending requests.
static bool test_push_goes_to_handler() {
    RouterFixture fixture(2000);
    std::mutex push_mutex;
    std::vector<std::string> push_commands;
    fixture.router.set_push_handler([&](const wire_protocol::Message &push) {
        std::lock_guard<std::mutex> lock(push_mutex);
        push_commands.push_back(push.command);
    });

    std::future<request_router::RequestResult> pending =
        fixture.router.send(command_names::GET_OPEN_FILES, json::object());
    fixture.transport.deliver(
        wire_protocol::encode(wire_protocol::make_push(command_names::PUSH_SNIPPET, json{{"snippet", "x"}})));

    bool still_pending = fixture.router.pending_count() == 1;
    std::vector<std::string> sent = fixture.transport.sent_frames();
    fixture.transport.deliver(test_fakes::reply_to(sent.at(0), json{{"success", true}}));
    bool resolved = pending.get().success;

    fixture.router.set_push_handler(nullptr);
    std::lock_guard<std::mutex> lock(push_mutex);
    bool success = still_pending && resolved && push_commands.size() == 1 && push_commands[0] == "push_snippet";
    return report(success, "Push reaches the push handler without resolving a request");
}

// Test: a malformed frame with a usable id fails that request and is answered with error_response.
static bool test_malformed_frame_with_recovered_id() {
    RouterFixture fixture(2000);
    std::future<request_router::RequestResult> pending =
        fixture.router.send(command_names::GET_OPEN_FILES, json::object());
    std::vector<std::string> sent = fixture.transport.sent_frames();
    if (sent.empty()) {
        return report(false, "Malformed frame with recovered id", "nothing was sent");
    }
    std::string request_id = wire_protocol::decode(sent[0]).message.message_id;

    json bad_frame;
    bad_frame["protocol_version"] = "9.9";
    bad_frame["message_id"] = request_id;
    bad_frame["type"] = "response";
    bad_frame["command"] = "response_open_files";
    fixture.transport.deliver(bad_frame.dump());

    request_router::RequestResult result = pending.get();
    std::vector<std::string> after = fixture.transport.sent_frames();
    bool answered = after.size() == 2 && wire_protocol::decode(after[1]).message.type ==
                                             wire_protocol::MessageType::ErrorResponse &&
                    wire_protocol::decode(after[1]).message.message_id == request_id;

    bool success = !result.success && result.error_code == wire_protocol::UNSUPPORTED_PROTOCOL_VERSION && answered;
    return report(success, "Bad-version response fails its request and is answered with error_response");
}

// Test: the typed client sends the command's documented payload.
static bool test_workspace_client_payloads() {
    RouterFixture fixture(2000);
    fixture.transport.set_responder([](const std::string &frame) {
        return std::vector<std::string>{test_fakes::reply_to(frame, json{{"success", true}})};
    });
    workspace_client::WorkspaceClient client(fixture.router);

    bool registered = client.register_active_target(7, "chat.example").get().success;
    bool searched = client.search_workspace("util").get().success;
    bool fetched = client.get_contents_for_files({"file:///tmp/a.txt"}).get().success;

    std::vector<std::string> sent = fixture.transport.sent_frames();
    if (sent.size() != 3) {
        return report(false, "Typed client payloads", "expected three frames");
    }
    wire_protocol::Message register_message = wire_protocol::decode(sent[0]).message;
    wire_protocol::Message search_message = wire_protocol::decode(sent[1]).message;
    wire_protocol::Message contents_message = wire_protocol::decode(sent[2]).message;

    bool success = registered && searched && fetched && register_message.command == "register_active_target" &&
                   register_message.payload["tabId"] == 7 && register_message.payload["llmHost"] == "chat.example" &&
                   search_message.payload["query"] == "util" && search_message.payload["workspaceFolderUri"].is_null() &&
                   contents_message.payload["fileUris"][0] == "file:///tmp/a.txt";
    return report(success, "Typed client builds register, search and contents payloads");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_response_resolves_request();
    all_passed &= test_out_of_order_responses();
    all_passed &= test_error_response_fails_request();
    all_passed &= test_failed_payload_is_failure();
    all_passed &= test_timeout_then_late_response();
    all_passed &= test_not_connected();
    all_passed &= test_push_goes_to_handler();
    all_passed &= test_malformed_frame_with_recovered_id();
    all_passed &= test_workspace_client_payloads();
    return all_passed;
}

} // namespace test_request_router
