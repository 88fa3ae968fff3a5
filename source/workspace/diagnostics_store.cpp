#include "workspace/diagnostics_store.hpp"

#include <algorithm>
#include <cctype>

namespace diagnostics_store {

std::string to_string(Severity severity) {
    switch (severity) {
    case Severity::Error:
        return "Error";
    case Severity::Warning:
        return "Warning";
    case Severity::Information:
        return "Info";
    case Severity::Hint:
        return "Hint";
    }
    return "Error";
}

bool parse_severity(const std::string &severity_name, Severity &output_severity) {
    std::string lowered = severity_name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (lowered == "error") {
        output_severity = Severity::Error;
    } else if (lowered == "warning") {
        output_severity = Severity::Warning;
    } else if (lowered == "info" || lowered == "information") {
        output_severity = Severity::Information;
    } else if (lowered == "hint") {
        output_severity = Severity::Hint;
    } else {
        return false;
    }
    return true;
}

static bool read_position(const json &entry, const char *key, int &output_value, std::string &error_message) {
    if (!entry.contains(key)) {
        return true;
    }
    if (!entry[key].is_number_integer() || entry[key].get<int>() < 1) {
        error_message = std::string("Diagnostic '") + key + "' must be a positive integer.";
        return false;
    }
    output_value = entry[key].get<int>();
    return true;
}

bool diagnostic_from_json(const json &entry, Diagnostic &output_diagnostic, std::string &error_message) {
    if (!entry.is_object()) {
        error_message = "Diagnostic must be an object.";
        return false;
    }
    if (!entry.contains("path") || !entry["path"].is_string() || entry["path"].get<std::string>().empty() ||
        entry["path"].get<std::string>()[0] != '/') {
        error_message = "Diagnostic 'path' must be an absolute path.";
        return false;
    }
    if (!entry.contains("message") || !entry["message"].is_string()) {
        error_message = "Diagnostic 'message' must be a string.";
        return false;
    }

    Diagnostic diagnostic;
    diagnostic.path = entry["path"].get<std::string>();
    diagnostic.message = entry["message"].get<std::string>();
    if (!read_position(entry, "line", diagnostic.line, error_message) ||
        !read_position(entry, "character", diagnostic.character, error_message)) {
        return false;
    }
    if (entry.contains("severity")) {
        if (!entry["severity"].is_string() || !parse_severity(entry["severity"].get<std::string>(), diagnostic.severity)) {
            error_message = "Diagnostic 'severity' must be error, warning, info or hint.";
            return false;
        }
    }
    if (entry.contains("source") && entry["source"].is_string()) {
        diagnostic.source = entry["source"].get<std::string>();
    }
    // Codes arrive as strings or numbers.
    if (entry.contains("code")) {
        if (entry["code"].is_string()) {
            diagnostic.code = entry["code"].get<std::string>();
        } else if (entry["code"].is_number_integer()) {
            diagnostic.code = std::to_string(entry["code"].get<long long>());
        }
    }

    output_diagnostic = diagnostic;
    return true;
}

void DiagnosticsStore::replace_all(std::vector<Diagnostic> diagnostics) {
    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics_ = std::move(diagnostics);
}

std::vector<Diagnostic> DiagnosticsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostics_;
}

size_t DiagnosticsStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostics_.size();
}

} // namespace diagnostics_store
