#ifndef CTXBRIDGE_DIAGNOSTICS_STORE_HPP
#define CTXBRIDGE_DIAGNOSTICS_STORE_HPP

// Problems (compiler and linter diagnostics) reported for this window's files.
// The editor side replaces the whole set at once; command handlers read snapshots.

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace diagnostics_store {

using json = nlohmann::json;

enum class Severity {
    Error,
    Warning,
    Information,
    Hint
};

// "Error", "Warning", "Info", "Hint".
std::string to_string(Severity severity);

// Accepts "error", "warning", "info", "information" and "hint" in any case.
bool parse_severity(const std::string &severity_name, Severity &output_severity);

struct Diagnostic {
    // Absolute path of the file the problem belongs to.
    std::string path;
    // 1-based position of the problem's start.
    int line = 1;
    int character = 1;
    Severity severity = Severity::Error;
    std::string message;
    std::string source;
    std::string code;
};

// Parse {path, line, character, severity, message, source?, code?}.
// Returns false with error_message when a required field is missing or out of range.
bool diagnostic_from_json(const json &entry, Diagnostic &output_diagnostic, std::string &error_message);

class DiagnosticsStore {
public:
    void replace_all(std::vector<Diagnostic> diagnostics);
    std::vector<Diagnostic> snapshot() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace diagnostics_store

#endif // CTXBRIDGE_DIAGNOSTICS_STORE_HPP
