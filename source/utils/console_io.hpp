#ifndef CTXBRIDGE_CONSOLE_IO_HPP
#define CTXBRIDGE_CONSOLE_IO_HPP

// Console framing for the executables: newline-delimited JSON objects in on stdin, one JSON
// line out on stdout.

#include <nlohmann/json.hpp>
#include <istream>
#include <string>

namespace console_io {

using json = nlohmann::json;

enum class ReadStatus {
    Message,
    Malformed,
    EndOfInput
};

struct ReadResult {
    ReadStatus status = ReadStatus::EndOfInput;
    // Set when status is Message; always an object.
    json message;
    // Set when status is Malformed.
    std::string error_message;
};

// Read the next non-blank line and parse it as a JSON object.
// A line that is not valid JSON, or not an object, is Malformed and consumed; the caller
// decides whether to keep reading.
ReadResult read_message(std::istream &input);

// Write one line to stdout. Lines from concurrent threads never interleave.
void write_message(const std::string &json_string);

} // namespace console_io

#endif // CTXBRIDGE_CONSOLE_IO_HPP
