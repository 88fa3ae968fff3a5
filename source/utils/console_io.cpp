#include "utils/console_io.hpp"

#include <iostream>
#include <mutex>

namespace console_io {

static std::mutex output_mutex;

static bool is_blank(const std::string &line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

ReadResult read_message(std::istream &input) {
    ReadResult result;
    std::string line;
    while (std::getline(input, line)) {
        if (is_blank(line)) {
            continue;
        }
        if (line.back() == '\r') {
            line.pop_back();
        }

        try {
            result.message = json::parse(line);
        } catch (const json::parse_error &error) {
            result.status = ReadStatus::Malformed;
            result.error_message = error.what();
            return result;
        }
        if (!result.message.is_object()) {
            result.status = ReadStatus::Malformed;
            result.error_message = "Expected a JSON object, got " + std::string(result.message.type_name()) + ".";
            result.message = nullptr;
            return result;
        }
        result.status = ReadStatus::Message;
        return result;
    }

    result.status = ReadStatus::EndOfInput;
    return result;
}

void write_message(const std::string &json_string) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << json_string << "\n";
    std::cout.flush();
}

} // namespace console_io
