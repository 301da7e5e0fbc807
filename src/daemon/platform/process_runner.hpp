#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = -1;   // -1 unless the child exited normally
    int term_signal = 0;  // signal that ended the child, 0 if none
    bool timed_out = false;
    std::string out;
    std::string err;

    bool ok() const { return !timed_out && exit_code == 0; }
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs argv synchronously (argv[0] is looked up in PATH), feeding stdin_data
    // to the child's stdin and capturing stdout/stderr. A child still running at
    // the timeout is killed and reported with timed_out set. Fails only when
    // the process could not be started.
    virtual std::expected<ProcessResult, std::string>
        run(const std::vector<std::string>& argv, const std::string& stdin_data,
            std::chrono::milliseconds timeout) = 0;
};
