// Tests for the primary hub: dispatch, secondary registration, aggregation and snippet relay.
// Frames are fed straight into the hub; a recording sink stands in for the listening socket.

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "command_handlers/command_handlers.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"
#include "server/command_dispatcher.hpp"
#include "server/command_registry.hpp"
#include "server/primary_hub.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"
#include "utils/timer_queue.hpp"
#include "workspace/diagnostics_store.hpp"
#include "workspace/local_workspace.hpp"

using json = nlohmann::json;
using test_support::report;
using test_support::wait_until;

namespace test_primary_hub {

constexpr message_sink::ConnectionId BROWSER = 1;
constexpr message_sink::ConnectionId SECONDARY = 2;
constexpr message_sink::ConnectionId OTHER_SECONDARY = 3;

// A primary window over a scratch workspace containing main.cpp.
struct HubFixture {
    test_support::TemporaryDirectory directory;
    std::unique_ptr<local_workspace::LocalWorkspace> workspace;
    diagnostics_store::DiagnosticsStore diagnostics;
    command_registry::CommandRegistry registry;
    std::unique_ptr<command_dispatcher::CommandDispatcher> dispatcher;
    timer_queue::TimerQueue timers;
    test_fakes::RecordingSink sink;
    std::unique_ptr<primary_hub::PrimaryHub> hub;

    explicit HubFixture(int aggregation_timeout_milliseconds = 5000, size_t max_secondaries = 16) {
        directory.write_file("main.cpp", "int main() { return 0; }\n");
        workspace = std::make_unique<local_workspace::LocalWorkspace>(std::vector<std::string>{directory.path()},
                                                                      std::vector<std::string>{}, true);
        command_handlers::register_all_commands(registry, *workspace, diagnostics);
        dispatcher = std::make_unique<command_dispatcher::CommandDispatcher>(registry, *workspace);

        primary_hub::HubOptions options;
        options.window_id = "primary-window";
        options.aggregation_timeout_milliseconds = aggregation_timeout_milliseconds;
        options.max_secondaries = max_secondaries;
        hub = std::make_unique<primary_hub::PrimaryHub>(sink, *dispatcher, timers, options);

        hub->handle_connection_opened(BROWSER, "127.0.0.1:50001");
        hub->handle_connection_opened(SECONDARY, "127.0.0.1:50002");
        hub->handle_connection_opened(OTHER_SECONDARY, "127.0.0.1:50003");
    }

    wire_protocol::Message request(message_sink::ConnectionId connection_id, const std::string &command,
                                   const json &payload) {
        wire_protocol::Message message = wire_protocol::make_request(command, payload);
        hub->handle_frame(connection_id, wire_protocol::encode(message));
        return message;
    }

    void push(message_sink::ConnectionId connection_id, const std::string &command, const json &payload) {
        hub->handle_frame(connection_id, wire_protocol::encode(wire_protocol::make_push(command, payload)));
    }

    bool register_secondary(message_sink::ConnectionId connection_id, const std::string &window_id) {
        wire_protocol::Message sent =
            request(connection_id, command_names::REGISTER_SECONDARY, json{{"windowId", window_id}, {"port", 0}});
        std::vector<wire_protocol::Message> replies = sink.messages_for(connection_id);
        return !replies.empty() && replies.back().message_id == sent.message_id &&
               replies.back().type == wire_protocol::MessageType::Response;
    }
};

// Test: with no secondaries a workspace-wide request is answered locally.
static bool test_local_dispatch_without_secondaries() {
    HubFixture fixture;
    wire_protocol::Message sent = fixture.request(BROWSER, command_names::GET_WORKSPACE_DETAILS, json::object());
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(BROWSER);

    bool success = replies.size() == 1 && replies[0].message_id == sent.message_id &&
                   replies[0].command == "response_workspace_details" &&
                   replies[0].payload["data"]["windowId"] == "primary-window" &&
                   replies[0].payload["data"]["workspaceFolders"].size() == 1;
    return report(success, "Request answered locally when no secondary is registered");
}

// Test: register_secondary is acknowledged and the connection stops counting as a browser.
static bool test_register_secondary() {
    HubFixture fixture;
    bool acknowledged = fixture.register_secondary(SECONDARY, "window-s1");
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(SECONDARY);

    std::optional<client_registry::ClientRecord> record = fixture.hub->clients().find(SECONDARY);
    bool success = acknowledged && replies.back().command == "response_generic_ack" &&
                   replies.back().payload["success"] == true &&
                   replies.back().payload["message"] == "Secondary registered successfully." &&
                   fixture.hub->secondaries().size() == 1 && fixture.hub->secondaries().find("window-s1") &&
                   record && record->window_id == std::string("window-s1");
    return report(success, "register_secondary acknowledged with response_generic_ack");
}

// Test: registration without windowId is INVALID_PAYLOAD.
static bool test_register_secondary_requires_window_id() {
    HubFixture fixture;
    fixture.request(SECONDARY, command_names::REGISTER_SECONDARY, json{{"port", 0}});
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(SECONDARY);

    bool success = replies.size() == 1 && replies[0].type == wire_protocol::MessageType::ErrorResponse &&
                   replies[0].payload["errorCode"] == "INVALID_PAYLOAD" && fixture.hub->secondaries().size() == 0;
    return report(success, "register_secondary without windowId rejected");
}

// Test: registrations beyond the limit are refused; re-registering the same window is not.
static bool test_secondary_limit() {
    HubFixture fixture(5000, 1);
    bool first = fixture.register_secondary(SECONDARY, "window-s1");
    bool again = fixture.register_secondary(SECONDARY, "window-s1");
    fixture.request(OTHER_SECONDARY, command_names::REGISTER_SECONDARY, json{{"windowId", "window-s2"}});
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(OTHER_SECONDARY);

    bool success = first && again && replies.size() == 1 &&
                   replies[0].payload["errorCode"] == "TOO_MANY_SECONDARIES" && fixture.hub->secondaries().size() == 1;
    return report(success, "Second distinct secondary refused with TOO_MANY_SECONDARIES");
}

// Test: a workspace-wide request is forwarded, and the merged answer reaches the requester.
static bool test_aggregated_search() {
    HubFixture fixture;
    fixture.register_secondary(SECONDARY, "window-s1");
    size_t secondary_frames_before = fixture.sink.frame_count(SECONDARY);

    wire_protocol::Message sent = fixture.request(BROWSER, command_names::SEARCH_WORKSPACE, json{{"query", "main"}});
    bool browser_waiting = fixture.sink.frame_count(BROWSER) == 0;

    std::vector<wire_protocol::Message> secondary_messages = fixture.sink.messages_for(SECONDARY);
    if (secondary_messages.size() != secondary_frames_before + 1) {
        return report(false, "Aggregated search", "secondary did not receive forward_request");
    }
    const wire_protocol::Message &forward = secondary_messages.back();
    bool forwarded = forward.type == wire_protocol::MessageType::Push && forward.command == "forward_request" &&
                     forward.payload["originalCommand"] == "search_workspace" &&
                     forward.payload["originalPayload"]["query"] == "main";

    json remote_result;
    remote_result["name"] = "main_remote.cpp";
    remote_result["type"] = "file";
    json remote_payload;
    remote_payload["success"] = true;
    remote_payload["data"]["results"] = json::array({remote_result});
    json reply;
    reply["aggregationId"] = forward.payload["aggregationId"];
    reply["windowId"] = "window-s1";
    reply["responsePayload"] = remote_payload;
    fixture.push(SECONDARY, command_names::FORWARD_RESPONSE_TO_PRIMARY, reply);

    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(BROWSER);
    bool success = browser_waiting && forwarded && replies.size() == 1 && replies[0].message_id == sent.message_id &&
                   replies[0].command == "response_search_workspace";
    if (success) {
        const json &results = replies[0].payload["data"]["results"];
        success = results.size() == 2 && results[0]["name"] == "main.cpp" &&
                  results[0]["windowId"] == "primary-window" && results[1]["name"] == "main_remote.cpp" &&
                  results[1]["windowId"] == "window-s1" && replies[0].payload["query"] == "main";
    }
    return report(success, "Search fans out to the secondary and merges both windows' results");
}

// Test: the aggregation deadline answers with what the primary has.
static bool test_aggregation_timeout() {
    HubFixture fixture(100);
    fixture.register_secondary(SECONDARY, "window-s1");
    fixture.request(BROWSER, command_names::SEARCH_WORKSPACE, json{{"query", "main"}});

    bool answered = wait_until([&] { return fixture.sink.frame_count(BROWSER) == 1; }, 2000);
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(BROWSER);
    bool success = answered && replies.size() == 1 && replies[0].payload["success"] == true &&
                   replies[0].payload["data"]["results"].size() == 1 && fixture.hub->aggregations().active_count() == 0;
    return report(success, "Silent secondary: answer sent at the deadline with local results only");
}

// Test: a secondary's own workspace-wide request is not fanned out again.
static bool test_secondary_request_not_aggregated() {
    HubFixture fixture;
    fixture.register_secondary(SECONDARY, "window-s1");
    fixture.register_secondary(OTHER_SECONDARY, "window-s2");
    size_t other_frames_before = fixture.sink.frame_count(OTHER_SECONDARY);

    fixture.request(SECONDARY, command_names::GET_OPEN_FILES, json::object());
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(SECONDARY);

    bool success = fixture.sink.frame_count(OTHER_SECONDARY) == other_frames_before &&
                   replies.back().command == "response_open_files" && fixture.hub->aggregations().active_count() == 0;
    return report(success, "Request from a secondary is answered locally");
}

// Test: malformed frames are answered when an id is recoverable, dropped otherwise.
static bool test_malformed_frames() {
    HubFixture fixture;
    fixture.hub->handle_frame(BROWSER, "{not json");
    bool dropped = fixture.sink.frame_count(BROWSER) == 0;

    json bad_version;
    bad_version["protocol_version"] = "0.9";
    bad_version["message_id"] = "req-old";
    bad_version["type"] = "request";
    bad_version["command"] = "get_open_files";
    fixture.hub->handle_frame(BROWSER, bad_version.dump());
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(BROWSER);

    bool success = dropped && replies.size() == 1 && replies[0].message_id == "req-old" &&
                   replies[0].payload["errorCode"] == "UNSUPPORTED_PROTOCOL_VERSION";
    return report(success, "Garbage dropped; bad version answered with error_response");
}

// Test: clients may not send response messages; error_response is only logged.
static bool test_unexpected_message_types() {
    HubFixture fixture;
    wire_protocol::Message stray = wire_protocol::make_response("resp-1", "response_generic_ack", json::object());
    fixture.hub->handle_frame(BROWSER, wire_protocol::encode(stray));
    wire_protocol::Message error = wire_protocol::make_error_response("err-1", "SOMETHING", "Client complaint.");
    fixture.hub->handle_frame(BROWSER, wire_protocol::encode(error));

    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(BROWSER);
    bool success = replies.size() == 1 && replies[0].payload["errorCode"] == "INVALID_MESSAGE_TYPE" &&
                   replies[0].message_id == "resp-1";
    return report(success, "Response rejected with INVALID_MESSAGE_TYPE; error_response not answered");
}

// Test: a relayed snippet reaches the active tab; without one it is dropped with a warning.
static bool test_forwarded_snippet() {
    HubFixture fixture;
    fixture.register_secondary(SECONDARY, "window-s1");
    json snippet;
    snippet["snippet"] = "int answer = 42;";
    snippet["language"] = "cpp";
    snippet["windowId"] = "window-s1";

    bool warned;
    {
        test_support::LogCapture capture;
        fixture.push(SECONDARY, command_names::FORWARD_PUSH_TO_PRIMARY, json{{"originalPushPayload", snippet}});
        warned = capture.contains("no active target");
    }
    bool nothing_delivered = fixture.sink.frame_count(BROWSER) == 0;

    fixture.request(BROWSER, command_names::REGISTER_ACTIVE_TARGET, json{{"tabId", 9}, {"llmHost", "chat.example"}});
    size_t frames_after_register = fixture.sink.frame_count(BROWSER);
    fixture.push(SECONDARY, command_names::FORWARD_PUSH_TO_PRIMARY, json{{"originalPushPayload", snippet}});

    std::vector<wire_protocol::Message> browser_messages = fixture.sink.messages_for(BROWSER);
    bool delivered = browser_messages.size() == frames_after_register + 1 &&
                     browser_messages.back().command == "push_snippet" &&
                     browser_messages.back().payload["targetTabId"] == 9 &&
                     browser_messages.back().payload["snippet"] == "int answer = 42;" &&
                     browser_messages.back().payload["windowId"] == "window-s1";
    return report(warned && nothing_delivered && delivered,
                  "Snippet dropped without an active tab, delivered with targetTabId once one registers");
}

// Test: unregister and disconnect both remove the secondary.
static bool test_secondary_removal() {
    HubFixture fixture;
    fixture.register_secondary(SECONDARY, "window-s1");
    fixture.register_secondary(OTHER_SECONDARY, "window-s2");

    fixture.request(SECONDARY, command_names::UNREGISTER_SECONDARY, json{{"windowId", "window-s1"}});
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(SECONDARY);
    bool unregistered = replies.back().command == "response_unregister_secondary_ack" &&
                        fixture.hub->secondaries().size() == 1;

    fixture.hub->handle_connection_closed(OTHER_SECONDARY);
    bool success = unregistered && fixture.hub->secondaries().size() == 0 && fixture.hub->clients().size() == 2;
    return report(success, "unregister_secondary acked; closed connection drops its registration");
}

// Test: only the connection that registered a window may unregister it; the record is cleared.
static bool test_unregister_requires_owner() {
    HubFixture fixture;
    fixture.register_secondary(SECONDARY, "window-s1");

    fixture.request(OTHER_SECONDARY, command_names::UNREGISTER_SECONDARY, json{{"windowId", "window-s1"}});
    std::vector<wire_protocol::Message> stranger_replies = fixture.sink.messages_for(OTHER_SECONDARY);
    bool refused = stranger_replies.size() == 1 &&
                   stranger_replies[0].type == wire_protocol::MessageType::ErrorResponse &&
                   stranger_replies[0].payload["errorCode"] == wire_protocol::REGISTRATION_NOT_OWNED &&
                   fixture.hub->secondaries().find("window-s1").has_value();

    fixture.request(SECONDARY, command_names::UNREGISTER_SECONDARY, json{{"windowId", "window-s1"}});
    std::optional<client_registry::ClientRecord> record = fixture.hub->clients().find(SECONDARY);
    bool removed = fixture.hub->secondaries().size() == 0 && record && !record->window_id;
    return report(refused && removed, "Foreign unregister refused; owner's unregister clears the window id");
}

// Test: a window re-registering over a new connection releases the old one.
static bool test_reregistration_moves_connection() {
    HubFixture fixture;
    fixture.register_secondary(SECONDARY, "window-s1");
    bool moved = fixture.register_secondary(OTHER_SECONDARY, "window-s1");

    std::optional<client_registry::ClientRecord> old_record = fixture.hub->clients().find(SECONDARY);
    std::optional<client_registry::ClientRecord> new_record = fixture.hub->clients().find(OTHER_SECONDARY);
    std::optional<secondary_registry::SecondaryRegistration> registration =
        fixture.hub->secondaries().find("window-s1");
    bool success = moved && old_record && !old_record->window_id && new_record &&
                   new_record->window_id == std::string("window-s1") && registration &&
                   registration->connection_id == OTHER_SECONDARY && fixture.hub->secondaries().size() == 1;
    return report(success, "Re-registration moves the window to the new connection");
}

// Test: registration is acknowledged on the receiving thread even when every worker is busy.
static bool test_registration_bypasses_busy_workers() {
    HubFixture fixture;
    std::vector<std::function<void()>> queued_tasks;
    fixture.hub->set_task_runner([&queued_tasks](std::function<void()> task) {
        queued_tasks.push_back(std::move(task));
        return true;
    });

    fixture.request(BROWSER, command_names::GET_FILE_TREE, json::object());
    bool registered = fixture.register_secondary(SECONDARY, "window-s1");
    bool browser_waiting = fixture.sink.frame_count(BROWSER) == 0 && queued_tasks.size() == 1;

    for (auto &task : queued_tasks) {
        task();
    }
    std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(BROWSER);
    bool success = registered && browser_waiting && replies.size() == 1 &&
                   replies[0].command == "response_file_tree";
    return report(success, "register_secondary acked while the browser request waits for a worker");
}

// Test: a runner that refuses work drops the request with a warning.
static bool test_rejected_task_is_logged() {
    HubFixture fixture;
    fixture.hub->set_task_runner([](std::function<void()>) { return false; });
    test_support::LogCapture capture;

    fixture.request(BROWSER, command_names::GET_OPEN_FILES, json::object());
    bool success = fixture.sink.frame_count(BROWSER) == 0 && capture.contains("get_open_files from connection 1 dropped");
    return report(success, "Request refused by the runner is logged and dropped");
}

// Test: for every limit, exactly that many distinct secondaries are accepted.
static bool test_secondary_limit_across_values() {
    bool success = true;
    std::string detail;
    for (size_t limit : {size_t(0), size_t(1), size_t(2), size_t(5)}) {
        HubFixture fixture(5000, limit);
        size_t accepted = 0;
        size_t refused = 0;
        for (size_t index = 0; index < limit + 2; index++) {
            message_sink::ConnectionId connection_id = 100 + index;
            fixture.hub->handle_connection_opened(connection_id, "127.0.0.1:" + std::to_string(51000 + index));
            fixture.request(connection_id, command_names::REGISTER_SECONDARY,
                            json{{"windowId", "window-" + std::to_string(index)}, {"port", 0}});
            std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(connection_id);
            if (replies.size() == 1 && replies[0].type == wire_protocol::MessageType::Response) {
                accepted++;
            } else if (replies.size() == 1 && replies[0].payload["errorCode"] == "TOO_MANY_SECONDARIES") {
                refused++;
            }
        }
        if (accepted != limit || refused != 2 || fixture.hub->secondaries().size() != limit) {
            success = false;
            detail += "limit " + std::to_string(limit) + ": accepted " + std::to_string(accepted) + " ";
        }
    }
    return report(success, "Accepted secondaries equal the limit for 0, 1, 2 and 5", detail);
}

// Test: for every deadline, a silent secondary delays the answer by at least the deadline.
static bool test_aggregation_deadline_across_values() {
    bool success = true;
    std::string detail;
    for (int deadline_milliseconds : {50, 150, 400}) {
        HubFixture fixture(deadline_milliseconds);
        fixture.register_secondary(SECONDARY, "window-s1");
        auto start_time = std::chrono::steady_clock::now();
        fixture.request(BROWSER, command_names::SEARCH_WORKSPACE, json{{"query", "main"}});

        bool answered = wait_until([&] { return fixture.sink.frame_count(BROWSER) == 1; }, deadline_milliseconds + 2000);
        long elapsed = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                             std::chrono::steady_clock::now() - start_time)
                                             .count());
        std::vector<wire_protocol::Message> replies = fixture.sink.messages_for(BROWSER);
        bool partial = answered && replies.size() == 1 && replies[0].payload["success"] == true &&
                       replies[0].payload["data"]["results"].size() == 1;
        if (!partial || elapsed < deadline_milliseconds - 5 || fixture.hub->aggregations().active_count() != 0) {
            success = false;
            detail += "deadline " + std::to_string(deadline_milliseconds) + ": elapsed " + std::to_string(elapsed) + " ";
        }
    }
    return report(success, "Partial answer never before the deadline for 50, 150 and 400 ms", detail);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_local_dispatch_without_secondaries();
    all_passed &= test_register_secondary();
    all_passed &= test_register_secondary_requires_window_id();
    all_passed &= test_secondary_limit();
    all_passed &= test_aggregated_search();
    all_passed &= test_aggregation_timeout();
    all_passed &= test_secondary_request_not_aggregated();
    all_passed &= test_malformed_frames();
    all_passed &= test_unexpected_message_types();
    all_passed &= test_forwarded_snippet();
    all_passed &= test_secondary_removal();
    all_passed &= test_unregister_requires_owner();
    all_passed &= test_reregistration_moves_connection();
    all_passed &= test_registration_bypasses_busy_workers();
    all_passed &= test_rejected_task_is_logged();
    all_passed &= test_secondary_limit_across_values();
    all_passed &= test_aggregation_deadline_across_values();
    return all_passed;
}

} // namespace test_primary_hub
