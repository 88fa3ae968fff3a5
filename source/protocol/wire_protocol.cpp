#include "protocol/wire_protocol.hpp"
#include "protocol/command_names.hpp"

#include <cstdint>
#include <cstdio>
#include <map>
#include <random>

namespace wire_protocol {

std::string to_string(MessageType type) {
    switch (type) {
    case MessageType::Request:
        return "request";
    case MessageType::Response:
        return "response";
    case MessageType::ErrorResponse:
        return "error_response";
    case MessageType::Push:
        return "push";
    }
    return "request";
}

bool parse_message_type(const std::string &type_name, MessageType &output_type) {
    if (type_name == "request") {
        output_type = MessageType::Request;
    } else if (type_name == "response") {
        output_type = MessageType::Response;
    } else if (type_name == "error_response") {
        output_type = MessageType::ErrorResponse;
    } else if (type_name == "push") {
        output_type = MessageType::Push;
    } else {
        return false;
    }
    return true;
}

std::string generate_message_id() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    uint64_t high_bits = generator();
    uint64_t low_bits = generator();

    // Version 4, variant 10xx.
    high_bits = (high_bits & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low_bits = (low_bits & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned int>(high_bits >> 32),
                  static_cast<unsigned int>((high_bits >> 16) & 0xFFFF),
                  static_cast<unsigned int>(high_bits & 0xFFFF),
                  static_cast<unsigned int>(low_bits >> 48),
                  static_cast<unsigned long long>(low_bits & 0xFFFFFFFFFFFFULL));
    return std::string(buffer);
}

Message make_request(const std::string &command, const json &payload) {
    Message message;
    message.message_id = generate_message_id();
    message.type = MessageType::Request;
    message.command = command;
    message.payload = payload.is_null() ? json::object() : payload;
    return message;
}

Message make_response(const std::string &request_message_id, const std::string &command, const json &payload) {
    Message message;
    message.message_id = request_message_id;
    message.type = MessageType::Response;
    message.command = command;
    message.payload = payload;
    return message;
}

Message make_error_response(const std::string &message_id, const std::string &error_code,
                            const std::string &error_message, const std::string &original_command) {
    Message message;
    message.message_id = message_id.empty() ? generate_message_id() : message_id;
    message.type = MessageType::ErrorResponse;
    message.command = command_names::ERROR_RESPONSE;
    message.payload = build_error_payload(error_code, error_message, original_command);
    return message;
}

Message make_push(const std::string &command, const json &payload) {
    Message message;
    message.message_id = generate_message_id();
    message.type = MessageType::Push;
    message.command = command;
    message.payload = payload;
    return message;
}

json build_error_payload(const std::string &error_code, const std::string &error_message,
                         const std::string &original_command) {
    json payload;
    payload["success"] = false;
    payload["error"] = error_message;
    payload["errorCode"] = error_code;
    if (original_command.empty()) {
        payload["originalCommand"] = nullptr;
    } else {
        payload["originalCommand"] = original_command;
    }
    return payload;
}

std::string encode(const Message &message) {
    json frame;
    frame["protocol_version"] = message.protocol_version;
    frame["message_id"] = message.message_id;
    frame["type"] = to_string(message.type);
    frame["command"] = message.command;
    frame["payload"] = message.payload;
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

static DecodeResult reject(DecodeResult result, const std::string &error_code, const std::string &error_message) {
    result.success = false;
    result.error_code = error_code;
    result.error_message = error_message;
    return result;
}

DecodeResult decode(const std::string &frame) {
    DecodeResult result;

    json parsed = json::parse(frame, nullptr, false);
    if (parsed.is_discarded()) {
        return reject(result, INVALID_MESSAGE_FORMAT, "Frame is not valid JSON.");
    }
    if (!parsed.is_object()) {
        return reject(result, INVALID_MESSAGE_FORMAT, "Frame is not a JSON object.");
    }

    result.recovered_message_id = get_string(parsed, "message_id");
    result.recovered_command = get_string(parsed, "command");

    for (const char *required_field : {"protocol_version", "message_id", "type", "command"}) {
        if (!parsed.contains(required_field) || !parsed[required_field].is_string()) {
            return reject(result, INVALID_MESSAGE_FORMAT,
                          "Missing or invalid field '" + std::string(required_field) + "'.");
        }
    }

    std::string version = parsed["protocol_version"].get<std::string>();
    if (version != PROTOCOL_VERSION) {
        return reject(result, UNSUPPORTED_PROTOCOL_VERSION,
                      "Unsupported protocol version '" + version + "', expected '" + PROTOCOL_VERSION + "'.");
    }

    std::string type_name = parsed["type"].get<std::string>();
    if (!parse_message_type(type_name, result.message.type)) {
        return reject(result, INVALID_MESSAGE_FORMAT, "Unknown message type '" + type_name + "'.");
    }

    result.message.protocol_version = version;
    result.message.message_id = result.recovered_message_id;
    result.message.command = result.recovered_command;
    if (parsed.contains("payload") && !parsed["payload"].is_null()) {
        result.message.payload = parsed["payload"];
    }
    result.success = true;
    return result;
}

std::string response_command_for(const std::string &request_command) {
    static const std::map<std::string, std::string> response_names = {
        {command_names::REGISTER_ACTIVE_TARGET, command_names::RESPONSE_GENERIC_ACK},
        {command_names::REGISTER_SECONDARY, command_names::RESPONSE_GENERIC_ACK},
        {command_names::UNREGISTER_SECONDARY, command_names::RESPONSE_UNREGISTER_SECONDARY_ACK},
        {command_names::GET_FILE_TREE, "response_file_tree"},
        {command_names::GET_FILE_CONTENT, "response_file_content"},
        {command_names::GET_FOLDER_CONTENT, "response_folder_content"},
        {command_names::GET_ENTIRE_CODEBASE, "response_entire_codebase"},
        {command_names::GET_ACTIVE_FILE_INFO, "response_active_file_info"},
        {command_names::GET_OPEN_FILES, "response_open_files"},
        {command_names::GET_CONTENTS_FOR_FILES, "response_contents_for_files"},
        {command_names::SEARCH_WORKSPACE, "response_search_workspace"},
        {command_names::GET_WORKSPACE_DETAILS, "response_workspace_details"},
        {command_names::LIST_FOLDER_CONTENTS, "response_list_folder_contents"},
        {command_names::GET_FILTER_INFO, "response_filter_info"},
        {command_names::GET_WORKSPACE_PROBLEMS, "response_workspace_problems"},
    };

    auto name_iterator = response_names.find(request_command);
    if (name_iterator != response_names.end()) {
        return name_iterator->second;
    }
    return "response_" + request_command;
}

bool payload_indicates_failure(const json &payload) {
    return payload.is_object() && payload.contains("success") &&
           payload["success"].is_boolean() && !payload["success"].get<bool>();
}

std::string get_string(const json &object, const std::string &key, const std::string &fallback) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

} // namespace wire_protocol
