#include "daemon_core.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

constexpr const char* kAppTitle = "Voice Transcribe";

nlohmann::json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

DaemonCore::DaemonCore(ConfigStore& config, bool verbose,
                       AudioCapture& audio, WhisperBackend& backend, IpcServer& ipc,
                       OutputMethod& output, Notifier& notifier, HotkeyBridge& hotkeys,
                       NotifyCallback notify)
    : config_(config), verbose_(verbose),
      audio_(audio), backend_(backend), ipc_(ipc),
      output_(output), notifier_(notifier), hotkeys_(hotkeys),
      notify_(std::move(notify)),
      session_(audio_) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& history_path) {
    if (!history_db_.open(history_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    auto settings = config_.settings();
    if (settings.hotkeys_enabled) {
        if (hotkeys_.register_hotkeys(settings.hotkeys)) {
            hotkeys_registered_ = true;
            log("Hotkeys registered");
        } else {
            hotkey_registration_failed();
        }
    }

    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "config") return handle_config(cmd);
    if (cmd_str == "copy") return handle_copy(cmd);
    return error_response("unknown command");
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& /*cmd*/) {
    if (session_.state() == SessionState::Recording) {
        return error_response("already recording");
    }
    if (session_.state() == SessionState::Processing) {
        return error_response("transcription in progress");
    }

    auto settings = config_.settings();
    if (!session_.start_recording(settings.sample_rate, settings.max_seconds)) {
        last_error_ = "Could not start audio capture";
        notifier_.notify(kAppTitle, last_error_);
        return error_response(last_error_);
    }

    log(std::format("Recording started ({} Hz)", settings.sample_rate));
    state_changed();
    return {{"status", "ok"}, {"message", "recording"}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    if (session_.state() != SessionState::Recording) {
        return error_response("not recording");
    }

    auto audio = session_.stop_recording();
    state_changed();

    if (audio.empty()) {
        fail_cycle("No audio captured");
        return error_response("No audio captured");
    }

    double duration = static_cast<double>(audio.size()) / session_.sample_rate();
    log(std::format("Recording stopped, {:.1f}s audio, transcribing...", duration));

    start_transcription(std::move(audio));

    return {{"status", "transcribing"}, {"duration", duration}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    switch (session_.state()) {
        case SessionState::Idle:
            return handle_start(cmd);
        case SessionState::Recording:
            return handle_stop(cmd);
        case SessionState::Processing:
            break;
    }
    log("Toggle ignored, transcription in progress");
    return {{"status", "busy"}, {"message", "transcription in progress"}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}, {"state", to_string(session_.state())}};
    if (session_.state() == SessionState::Recording) {
        resp["duration"] = session_.recording_duration();
    }
    if (!last_error_.empty()) {
        resp["last_error"] = last_error_;
    }
    resp["hotkeys_enabled"] = hotkeys_registered_;
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = 10;
    if (cmd.contains("limit")) {
        if (!cmd["limit"].is_number_integer() || cmd["limit"].get<int64_t>() <= 0) {
            return error_response("limit must be a positive integer");
        }
        limit = static_cast<int>(std::min<int64_t>(cmd["limit"].get<int64_t>(), 1000));
    }
    if (!history_db_.is_open()) {
        return error_response("history is unavailable");
    }

    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"audio_file", e.audio_file},
            {"model", e.model},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_config(const nlohmann::json& cmd) {
    if (!cmd.contains("key")) {
        return {{"status", "ok"}, {"config", config_.all()}};
    }
    if (!cmd["key"].is_string() || cmd["key"].get<std::string>().empty()) {
        return error_response("key must be a non-empty string");
    }

    auto key = cmd["key"].get<std::string>();
    if (cmd.contains("value")) {
        return set_config(key, cmd["value"]);
    }
    return {{"status", "ok"}, {"key", key}, {"value", config_.get(key)}};
}

nlohmann::json DaemonCore::handle_copy(const nlohmann::json& /*cmd*/) {
    if (last_text_.empty()) {
        return error_response("no transcript yet");
    }
    auto res = output_.deliver(last_text_);
    if (!res) {
        return error_response("Clipboard copy failed: " + res.error());
    }
    return {{"status", "ok"}, {"text", last_text_}};
}

nlohmann::json DaemonCore::set_config(const std::string& key, const nlohmann::json& value) {
    auto before = config_.settings();

    auto res = config_.set(key, value);
    if (!res) {
        return error_response(res.error());
    }
    log(std::format("Config {} = {}", key, value.dump()));

    if (key == "hotkeys_enabled" || key == "hotkeys") {
        if (!apply_hotkeys(before, config_.settings())) {
            if (key == "hotkeys") {
                if (auto undo = config_.set("hotkeys", before.hotkeys); !undo) {
                    std::println(stderr, "config: could not restore hotkeys: {}", undo.error());
                }
            }
            return {
                {"status", "error"},
                {"kind", "hotkey_registration_failed"},
                {"message", "Hotkey registration failed; hotkeys disabled"},
            };
        }
    }

    return {{"status", "ok"}, {"key", key}, {"value", config_.get(key)}};
}

bool DaemonCore::apply_hotkeys(const Settings& before, const Settings& after) {
    if (!after.hotkeys_enabled) {
        if (hotkeys_registered_) {
            hotkeys_.unregister();
            hotkeys_registered_ = false;
            log("Hotkeys removed");
        }
        return true;
    }

    if (hotkeys_registered_ && before.hotkeys == after.hotkeys) return true;

    if (!hotkeys_.register_hotkeys(after.hotkeys)) {
        // Bindings from an earlier registration may still be installed.
        hotkeys_.unregister();
        hotkeys_registered_ = false;
        hotkey_registration_failed();
        return false;
    }
    hotkeys_registered_ = true;
    log("Hotkeys registered");
    return true;
}

void DaemonCore::hotkey_registration_failed() {
    std::println(stderr, "hotkeys: registration failed, disabling hotkeys");

    auto res = config_.set("hotkeys_enabled", false);
    if (!res) {
        std::println(stderr, "hotkeys: could not persist hotkeys_enabled=false: {}", res.error());
    }

    last_error_ = "Hotkey registration failed";
    notifier_.notify(kAppTitle, "Hotkey registration failed; hotkeys have been disabled");
}

void DaemonCore::on_trigger() {
    log("Trigger received");
    auto resp = handle_toggle({});
    if (resp.value("status", "") == "error") {
        log("Trigger toggle failed: " + resp.value("message", ""));
    }
}

void DaemonCore::start_transcription(std::vector<int16_t> audio) {
    // The worker sees one consistent settings copy for the whole cycle.
    cycle_settings_ = config_.settings();
    cycle_settings_.sample_rate = session_.sample_rate();

    worker_ = std::jthread([this, audio = std::move(audio), settings = cycle_settings_]
                           (std::stop_token) {
        worker_result_ = backend_.transcribe(audio, settings);
        notify_();
    });
}

void DaemonCore::on_transcription_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (session_.state() != SessionState::Processing) return;

    nlohmann::json response;

    if (worker_result_.has_value()) {
        auto& tr = worker_result_.value();
        log(std::format("Transcription complete: {:.1f}s processing, {} chars",
                        tr.processing_s, tr.text.size()));

        last_text_ = tr.text;
        last_error_.clear();

        auto res = output_.deliver(tr.text);
        if (!res) {
            std::println(stderr, "output: clipboard copy failed: {}", res.error());
            notifier_.notify(kAppTitle, "Clipboard copy failed: " + res.error());
        }

        if (history_db_.is_open()) {
            history_db_.insert(tr, cycle_settings_.whisper_model);
        }

        response = {
            {"status", "ok"},
            {"text", tr.text},
            {"duration", tr.duration_s},
            {"processing_time", tr.processing_s},
            {"audio_file", tr.audio_file},
        };
    } else {
        auto& err = worker_result_.error();
        log(std::format("Transcription failed ({}): {}", to_string(err.kind), err.message));

        last_error_ = err.message;
        notifier_.notify(kAppTitle, err.message);

        response = {
            {"status", "error"},
            {"kind", to_string(err.kind)},
            {"message", err.message},
        };
    }

    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();

    session_.finish();
    state_changed();
}

void DaemonCore::fail_cycle(const std::string& message) {
    last_error_ = message;
    notifier_.notify(kAppTitle, message);
    session_.finish();
    state_changed();
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    if (session_.state() == SessionState::Recording) {
        log("Discarding active recording");
        session_.stop_recording();
        session_.finish();
        state_changed();
    }

    if (session_.state() == SessionState::Processing) {
        log("Waiting for pending transcription to complete...");
        on_transcription_complete();
    } else if (worker_.joinable()) {
        worker_.join();
    }

    if (hotkeys_registered_) {
        hotkeys_.unregister();
        hotkeys_registered_ = false;
    }

    history_db_.close();
}

void DaemonCore::state_changed() {
    log(std::format("State: {}", to_string(session_.state())));
    if (observer_) observer_(session_.state());
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voice-transcribe] {}", msg);
    }
}
