#include "platform/platform_abi.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    std::vector<std::string> command_line = {executable_path};
    command_line.insert(command_line.end(), arguments.begin(), arguments.end());
    std::vector<char *> child_argv;
    child_argv.reserve(command_line.size() + 1);
    for (auto &word : command_line) {
        child_argv.push_back(word.data());
    }
    child_argv.push_back(nullptr);

    // The child gets /dev/null as stdin so it never competes for the parent's terminal.
    posix_spawn_file_actions_t file_actions;
    int setup_status = posix_spawn_file_actions_init(&file_actions);
    if (setup_status == 0) {
        setup_status = posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    }
    if (setup_status != 0) {
        posix_spawn_file_actions_destroy(&file_actions);
        result.error_message = "Could not prepare child stdin: " + std::string(strerror(setup_status));
        return result;
    }

    pid_t child_pid = 0;
    int spawn_status =
        posix_spawn(&child_pid, executable_path.c_str(), &file_actions, nullptr, child_argv.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);
    if (spawn_status != 0) {
        result.error_message = "Could not start " + executable_path + ": " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool kill_process(int process_id, bool force) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), force ? SIGKILL : SIGTERM);
    return (kill_result == 0);
}

bool wait_for_process_exit(int process_id, int timeout_milliseconds) {
    if (process_id <= 0) {
        return false;
    }
    const int poll_interval_milliseconds = 50;
    for (int elapsed_milliseconds = 0;; elapsed_milliseconds += poll_interval_milliseconds) {
        int status = 0;
        pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (wait_result == static_cast<pid_t>(process_id)) {
            return true;
        }
        if (wait_result < 0) {
            // Not our child, or already reaped.
            return errno == ECHILD;
        }
        if (elapsed_milliseconds >= timeout_milliseconds) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
    }
}

} // namespace platform
