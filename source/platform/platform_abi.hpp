#ifndef CTXBRIDGE_PLATFORM_ABI_HPP
#define CTXBRIDGE_PLATFORM_ABI_HPP

// Process and file primitives used by the workspace and the process-level tests.
// The implementation lives under platform/<os>/; only Linux is provided.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Start executable_path with arguments and stdin from /dev/null. The caller reaps it with
// wait_for_process_exit().
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Read a whole file as bytes. False when it cannot be opened or read.
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Send SIGTERM, or SIGKILL when force is set.
bool kill_process(int process_id, bool force = false);

// Reap a spawned child, waiting up to timeout_milliseconds. Returns true once it has exited.
bool wait_for_process_exit(int process_id, int timeout_milliseconds);

} // namespace platform

#endif // CTXBRIDGE_PLATFORM_ABI_HPP
