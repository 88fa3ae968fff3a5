#ifndef CTXBRIDGE_WIRE_PROTOCOL_HPP
#define CTXBRIDGE_WIRE_PROTOCOL_HPP

// Message envelope shared by client and server.
// One JSON object per WebSocket text frame: protocol_version, message_id, type, command, payload.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace wire_protocol {

using json = nlohmann::json;

// The single protocol version this build speaks.
constexpr const char *PROTOCOL_VERSION = "1.0";

// Standard error kinds surfaced to callers.
constexpr const char *INVALID_MESSAGE_FORMAT = "INVALID_MESSAGE_FORMAT";
constexpr const char *UNSUPPORTED_PROTOCOL_VERSION = "UNSUPPORTED_PROTOCOL_VERSION";
constexpr const char *INVALID_MESSAGE_TYPE = "INVALID_MESSAGE_TYPE";
constexpr const char *UNKNOWN_COMMAND = "UNKNOWN_COMMAND";
constexpr const char *COMMAND_EXECUTION_ERROR = "COMMAND_EXECUTION_ERROR";
constexpr const char *WORKSPACE_NOT_TRUSTED = "WORKSPACE_NOT_TRUSTED";
constexpr const char *NO_WORKSPACE_OPEN = "NO_WORKSPACE_OPEN";
constexpr const char *INVALID_PAYLOAD = "INVALID_PAYLOAD";
constexpr const char *INTERNAL_SERVER_ERROR = "INTERNAL_SERVER_ERROR";
constexpr const char *TOO_MANY_SECONDARIES = "TOO_MANY_SECONDARIES";
constexpr const char *NOT_PRIMARY = "NOT_PRIMARY";
constexpr const char *REGISTRATION_NOT_OWNED = "REGISTRATION_NOT_OWNED";
constexpr const char *NO_RESPONSES = "NO_RESPONSES";

enum class MessageType {
    Request,
    Response,
    ErrorResponse,
    Push
};

// The wire unit.
struct Message {
    std::string protocol_version = PROTOCOL_VERSION;
    std::string message_id;
    MessageType type = MessageType::Request;
    std::string command;
    json payload = json::object();
};

// Outcome of decoding one frame. When success is false, recovered_message_id is
// non-empty only if the frame carried a usable message_id.
struct DecodeResult {
    bool success = false;
    Message message;
    std::string error_code;
    std::string error_message;
    std::string recovered_message_id;
    std::string recovered_command;
};

// "request", "response", "error_response", "push".
std::string to_string(MessageType type);

// Parse a wire type name. Returns false for anything outside the four well-known values.
bool parse_message_type(const std::string &type_name, MessageType &output_type);

// Fresh random UUID v4 (lowercase, 8-4-4-4-12).
std::string generate_message_id();

// Build a request envelope with a fresh message id.
Message make_request(const std::string &command, const json &payload);

// Build a response envelope answering request_message_id.
Message make_response(const std::string &request_message_id, const std::string &command, const json &payload);

// Build an error_response envelope. An empty message_id gets a fresh one.
Message make_error_response(const std::string &message_id, const std::string &error_code,
                            const std::string &error_message, const std::string &original_command = "");

// Build a push envelope with a fresh message id.
Message make_push(const std::string &command, const json &payload);

// {success:false, error, errorCode, originalCommand}.
json build_error_payload(const std::string &error_code, const std::string &error_message,
                         const std::string &original_command = "");

// Serialize to a single text frame. Invalid UTF-8 in strings is replaced, never thrown.
std::string encode(const Message &message);

// Parse and validate a text frame. Never throws.
DecodeResult decode(const std::string &frame);

// Response-variant name paired with a request command (explicit table, default "response_<command>").
std::string response_command_for(const std::string &request_command);

// True when a response payload reports failure (payload.success == false).
bool payload_indicates_failure(const json &payload);

// String member of an object, or fallback when missing or not a string.
std::string get_string(const json &object, const std::string &key, const std::string &fallback = "");

} // namespace wire_protocol

#endif // CTXBRIDGE_WIRE_PROTOCOL_HPP
