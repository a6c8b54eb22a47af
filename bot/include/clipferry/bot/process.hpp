#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace clipferry::bot
{

    struct ProcessResult
    {
        int exit_code{-1};
        bool timed_out{};
        std::string standard_output;
        std::string standard_error;

        bool succeeded() const noexcept { return !timed_out && exit_code == 0; }
    };

    // Runs program (looked up in PATH) with an argument vector, no shell involved. The child is
    // killed once timeout elapses. Throws std::system_error when the program cannot be launched.
    ProcessResult run_process(const std::string &program, const std::vector<std::string> &args,
                              std::chrono::milliseconds timeout);

    // Last non-empty line of a tool's diagnostic output, for user-facing messages.
    std::string last_line(const std::string &text);

} // namespace clipferry::bot
