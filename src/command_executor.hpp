#pragma once
#include <string>
#include <chrono>

namespace queuectl {

struct ExecResult {
    int exit_code = -1;         // 128 + signal when killed by a signal
    bool timed_out = false;
    std::string stdout_output;
    std::string stderr_output;

    bool succeeded() const { return exit_code == 0 && !timed_out; }
};

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // Runs the command to completion or until timeout. Throws ExecError when
    // the command could not be started at all.
    virtual ExecResult execute(const std::string& command, std::chrono::seconds timeout) = 0;
};

// Runs commands through /bin/sh -c in their own process group. On timeout the
// whole group is killed.
class ShellExecutor : public CommandExecutor {
public:
    explicit ShellExecutor(int max_output = 65536) : max_output_(max_output) {}

    ExecResult execute(const std::string& command, std::chrono::seconds timeout) override;

private:
    int max_output_;
};

} // namespace queuectl
