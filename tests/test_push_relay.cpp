// Tests for snippet delivery to the active tab.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "protocol/command_names.hpp"
#include "server/client_registry.hpp"
#include "server/push_relay.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using test_support::LogCapture;
using test_support::report;

namespace test_push_relay {

// Two browser tabs and one secondary window.
static void add_clients(client_registry::ClientRegistry &clients) {
    clients.add(1, "127.0.0.1:40001", true);
    clients.add(2, "127.0.0.1:40002", true);
    clients.add(3, "127.0.0.1:40003", true);
    clients.set_window_id(3, "window-b");
}

// Test: the snippet goes to the most recently registered tab with targetTabId filled in.
static bool test_snippet_reaches_latest_target() {
    client_registry::ClientRegistry clients;
    add_clients(clients);
    clients.set_active_target(1, 101, "chat.one");
    clients.set_active_target(2, 202, "chat.two");
    test_fakes::RecordingSink sink;
    push_relay::PushRelay relay(clients, sink);

    json snippet;
    snippet["snippet"] = "int main() {}";
    snippet["language"] = "cpp";
    snippet["filePath"] = "/src/main.cpp";
    bool pushed = relay.push_snippet(snippet);

    std::vector<wire_protocol::Message> delivered = sink.messages_for(2);
    bool success = pushed && sink.frame_count(1) == 0 && delivered.size() == 1 &&
                   delivered[0].command == command_names::PUSH_SNIPPET && delivered[0].payload["targetTabId"] == 202 &&
                   delivered[0].payload["snippet"] == "int main() {}" && delivered[0].payload["language"] == "cpp";
    return report(success, "Snippet delivered to the latest active tab with targetTabId");
}

// Test: with no active tab the snippet is dropped with a warning.
static bool test_snippet_without_target() {
    client_registry::ClientRegistry clients;
    add_clients(clients);
    test_fakes::RecordingSink sink;
    push_relay::PushRelay relay(clients, sink);
    LogCapture capture;

    bool pushed = relay.push_snippet(json{{"snippet", "x"}});
    bool success = !pushed && sink.total_frame_count() == 0 && capture.contains("no active target tab");
    return report(success, "Snippet without an active tab is dropped and logged");
}

// Test: a closed target connection is logged and reported as not delivered.
static bool test_snippet_to_closed_target() {
    client_registry::ClientRegistry clients;
    add_clients(clients);
    clients.set_active_target(1, 101, "chat.one");
    test_fakes::RecordingSink sink;
    sink.mark_closed(1);
    push_relay::PushRelay relay(clients, sink);
    LogCapture capture;

    bool pushed = relay.push_snippet(json{{"snippet", "x"}});
    bool success = !pushed && sink.total_frame_count() == 0 &&
                   capture.contains("Could not deliver push_snippet push to connection 1");
    return report(success, "Snippet to a closed tab is reported undelivered");
}

// Test: a secondary window's connection never becomes the push target.
static bool test_secondary_window_is_not_a_target() {
    client_registry::ClientRegistry clients;
    add_clients(clients);
    clients.set_active_target(1, 101, "chat.one");
    test_fakes::RecordingSink sink;
    push_relay::PushRelay relay(clients, sink);

    bool pushed = relay.push_snippet(json{{"snippet", "x"}});
    bool success = pushed && sink.frame_count(1) == 1 && sink.frame_count(3) == 0;
    return report(success, "Snippet reaches the tab and never the secondary window");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_snippet_reaches_latest_target();
    all_passed &= test_snippet_without_target();
    all_passed &= test_snippet_to_closed_target();
    all_passed &= test_secondary_window_is_not_a_target();
    return all_passed;
}

} // namespace test_push_relay
