#include "platform/linux/desktop_clipboard_output.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

DesktopClipboardOutput::DesktopClipboardOutput(ProcessRunner& runner)
    : runner_(runner) {}

std::expected<void, std::string> DesktopClipboardOutput::deliver(const std::string& text) {
    std::vector<std::vector<std::string>> commands;
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    if (wayland && *wayland) {
        commands.push_back({"wl-copy"});
    }
    commands.push_back({"xclip", "-selection", "clipboard"});
    commands.push_back({"xsel", "--clipboard", "--input"});

    std::string last_error = "no clipboard tool available";
    for (const auto& argv : commands) {
        auto res = runner_.run(argv, text, std::chrono::seconds(5));
        if (!res) {
            last_error = res.error();
            continue;
        }
        if (res->ok()) return {};
        last_error = res->timed_out
            ? argv[0] + " timed out"
            : argv[0] + " exited with code " + std::to_string(res->exit_code);
    }
    return std::unexpected(last_error);
}
