#pragma once

#include "platform/process_runner.hpp"

class PosixProcessRunner : public ProcessRunner {
public:
    std::expected<ProcessResult, std::string>
        run(const std::vector<std::string>& argv, const std::string& stdin_data,
            std::chrono::milliseconds timeout) override;
};
