#include "platform/linux/notify_send_notifier.hpp"

#include <chrono>
#include <print>

NotifySendNotifier::NotifySendNotifier(ProcessRunner& runner)
    : runner_(runner) {}

void NotifySendNotifier::notify(const std::string& title, const std::string& message) {
    auto res = runner_.run({"notify-send",
                            "-a", "Voice Transcribe",
                            "-i", "audio-input-microphone",
                            "-t", "5000",
                            title, message},
                           {}, std::chrono::seconds(5));
    if (res && res->ok()) return;

    std::println(stderr, "[voice-transcribe] {}: {}", title, message);
}
