#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  toggle                  Start recording, or stop and transcribe");
    std::println(stderr, "  start                   Start recording");
    std::println(stderr, "  stop                    Stop recording and wait for the transcript");
    std::println(stderr, "  status                  Show daemon status");
    std::println(stderr, "  history [--limit N]     Show transcription history");
    std::println(stderr, "  config [KEY [VALUE]]    Show or change settings");
    std::println(stderr, "  copy                    Copy the last transcript again");
}

// VALUE is JSON when it parses as JSON, otherwise a plain string.
static json parse_value(const std::string& text) {
    auto v = json::parse(text, nullptr, false);
    if (v.is_discarded()) return text;
    return v;
}

static bool parse_limit(const std::string& text, int& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size() && out > 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        usage(argv[0]);
        return 0;
    }

    // Build command JSON
    json cmd;
    if (command == "toggle" || command == "start" || command == "stop" ||
        command == "status" || command == "copy") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        int limit = 10;
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--limit" && i + 1 < argc) {
                if (!parse_limit(argv[++i], limit)) {
                    std::println(stderr, "Error: --limit expects a positive integer");
                    return 1;
                }
            } else {
                std::println(stderr, "Unknown option: {}", arg);
                return 1;
            }
        }
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "config") {
        cmd = {{"cmd", "config"}};
        if (argc > 2) cmd["key"] = argv[2];
        if (argc > 3) cmd["value"] = parse_value(argv[3]);
        if (argc > 4) {
            std::println(stderr, "Error: config takes at most KEY and VALUE");
            return 1;
        }
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is voice-transcribe running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // A stopping toggle or stop is answered only when transcription ends,
    // which the daemon bounds by its own timeout.
    bool waits_for_cycle = command == "toggle" || command == "stop";
    json response;
    if (!client.recv(response, waits_for_cycle ? -1 : 30000)) {
        std::println(stderr, "No response from daemon");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (status == "busy") {
        std::println("Busy: {}", response.value("message", "transcription in progress"));
        return 0;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.contains("last_error")) {
            std::println("Last error: {}", response["last_error"].get<std::string>());
        }
        std::println("Hotkeys: {}", response.value("hotkeys_enabled", false) ? "on" : "off");
    } else if (command == "history") {
        if (response["entries"].empty()) {
            std::println("No transcripts yet");
        }
        for (auto& entry : response["entries"]) {
            std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
        }
    } else if (command == "config") {
        if (response.contains("config")) {
            std::println("{}", response["config"].dump(2));
        } else if (cmd.contains("value")) {
            std::println("{} = {}", response.value("key", ""), response["value"].dump());
        } else {
            std::println("{}", response["value"].dump());
        }
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (response.value("message", "") == "recording") {
        std::println("Recording started");
    } else {
        std::println("OK");
    }

    return 0;
}
