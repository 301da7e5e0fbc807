#pragma once

#include "output/output.hpp"
#include "platform/process_runner.hpp"

// Copies text with wl-copy on Wayland, falling back to xclip and xsel.
class DesktopClipboardOutput : public OutputMethod {
public:
    explicit DesktopClipboardOutput(ProcessRunner& runner);
    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    ProcessRunner& runner_;
};
