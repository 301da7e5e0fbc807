#pragma once

#include "config.hpp"
#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "platform/hotkey_bridge.hpp"
#include "platform/ipc_server.hpp"
#include "platform/notifier.hpp"
#include "session.hpp"
#include "storage/history_db.hpp"
#include "whisper/backend.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

// Application context: owns the session and the transcription worker and
// applies every state change on the event loop thread.
class DaemonCore {
public:
    // Called from the worker thread once its result is ready.
    using NotifyCallback = std::function<void()>;
    using StateObserver = std::function<void(SessionState)>;

    DaemonCore(ConfigStore& config, bool verbose,
               AudioCapture& audio, WhisperBackend& backend, IpcServer& ipc,
               OutputMethod& output, Notifier& notifier, HotkeyBridge& hotkeys,
               NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the history database and installs hotkeys if enabled. A history
    // database that cannot be opened only disables history.
    bool init(const std::string& history_path);

    // A response with status "transcribing" means the reply is deferred: the
    // caller registers the client with add_waiting_client().
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Toggle from the trigger marker; there is no client to answer.
    void on_trigger();

    void on_transcription_complete();

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

    SessionState session_state() const { return session_.state(); }
    const std::string& last_text() const { return last_text_; }
    const std::string& last_error() const { return last_error_; }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_config(const nlohmann::json& cmd);
    nlohmann::json handle_copy(const nlohmann::json& cmd);

    nlohmann::json set_config(const std::string& key, const nlohmann::json& value);
    bool apply_hotkeys(const Settings& before, const Settings& after);
    void hotkey_registration_failed();

    void start_transcription(std::vector<int16_t> audio);
    void fail_cycle(const std::string& message);
    void state_changed();

    void log(const std::string& msg);

    ConfigStore& config_;
    bool verbose_;

    AudioCapture& audio_;
    WhisperBackend& backend_;
    IpcServer& ipc_;
    OutputMethod& output_;
    Notifier& notifier_;
    HotkeyBridge& hotkeys_;

    NotifyCallback notify_;
    StateObserver observer_;

    Session session_;
    HistoryDb history_db_;

    bool hotkeys_registered_ = false;
    std::string last_text_;
    std::string last_error_;
    std::vector<int> waiting_clients_;

    // Written by the worker before notify_(), read after join().
    Settings cycle_settings_;
    std::expected<TranscriptResult, TranscribeError> worker_result_;
    std::jthread worker_;
};
