#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "test_support.hpp"

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace {

class FakeBackend : public WhisperBackend {
public:
    std::expected<TranscriptResult, TranscribeError>
    transcribe(std::span<const int16_t> audio, const Settings& settings) override {
        received.assign(audio.begin(), audio.end());
        seen = settings;
        ++calls;
        return next;
    }

    std::expected<TranscriptResult, TranscribeError> next =
        TranscriptResult{.text = "hello there", .duration_s = 1.0,
                         .processing_s = 0.2, .audio_file = "/tmp/rec.wav"};
    std::vector<int16_t> received;
    Settings seen;
    int calls = 0;
};

class MockIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int, json&) override { return ReadStatus::Pending; }
    bool send_response(int fd, const json& response) override {
        sent.emplace_back(fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<std::pair<int, json>> sent;
};

class MockOutput : public OutputMethod {
public:
    std::expected<void, std::string> deliver(const std::string& text) override {
        delivered.push_back(text);
        if (fail) return std::unexpected("no clipboard");
        return {};
    }
    std::vector<std::string> delivered;
    bool fail = false;
};

class MockNotifier : public Notifier {
public:
    void notify(const std::string&, const std::string& message) override {
        messages.push_back(message);
    }
    std::vector<std::string> messages;
};

class MockHotkeys : public HotkeyBridge {
public:
    bool register_hotkeys(const std::vector<std::string>& combos) override {
        ++registers;
        last = combos;
        return !fail;
    }
    void unregister() override { ++unregisters; }

    bool fail = false;
    int registers = 0;
    int unregisters = 0;
    std::vector<std::string> last;
};

struct Fixture {
    TmpDir dir;
    ConfigStore config;
    MockAudioCapture audio;
    FakeBackend backend;
    MockIpcServer ipc;
    MockOutput output;
    MockNotifier notifier;
    MockHotkeys hotkeys;
    std::atomic<int> notified{0};
    std::vector<SessionState> transitions;
    std::unique_ptr<DaemonCore> core;

    Fixture() { config.load((dir / "config.json").string()); }

    DaemonCore& make() {
        core = std::make_unique<DaemonCore>(config, false, audio, backend, ipc,
                                            output, notifier, hotkeys,
                                            [this] { ++notified; });
        core->set_state_observer([this](SessionState s) { transitions.push_back(s); });
        REQUIRE(core->init((dir / "history.db").string()));
        return *core;
    }

    json cmd(const std::string& name, json extra = json::object()) {
        extra["cmd"] = name;
        return core->handle_command(name, extra);
    }
};

} // namespace

TEST_CASE("DaemonCore recording cycle", "[core]") {
    Fixture f;
    auto& core = f.make();

    SECTION("ToggleCyclesThroughAllStates") {
        REQUIRE(f.cmd("toggle")["message"] == "recording");
        REQUIRE(core.session_state() == SessionState::Recording);

        f.audio.feed({10, 20, 30});

        auto stop = f.cmd("toggle");
        REQUIRE(stop["status"] == "transcribing");
        REQUIRE(core.session_state() == SessionState::Processing);
        core.add_waiting_client(7);

        core.on_transcription_complete();
        REQUIRE(f.notified.load() == 1);
        REQUIRE(core.session_state() == SessionState::Idle);

        REQUIRE(f.transitions == std::vector<SessionState>{
            SessionState::Recording, SessionState::Processing, SessionState::Idle});

        REQUIRE(f.backend.received == std::vector<int16_t>{10, 20, 30});
        REQUIRE(f.output.delivered == std::vector<std::string>{"hello there"});
        REQUIRE(f.notifier.messages.empty());
        REQUIRE(core.last_text() == "hello there");

        REQUIRE(f.ipc.sent.size() == 1);
        REQUIRE(f.ipc.sent[0].first == 7);
        REQUIRE(f.ipc.sent[0].second["text"] == "hello there");
    }

    SECTION("TwoCyclesInARow") {
        for (int i = 0; i < 2; ++i) {
            f.cmd("start");
            f.audio.feed({1});
            f.cmd("stop");
            core.on_transcription_complete();
        }
        REQUIRE(f.backend.calls == 2);
        REQUIRE(core.session_state() == SessionState::Idle);
    }

    SECTION("WorkerGetsSettingsSnapshot") {
        REQUIRE(f.config.set("sample_rate", 8000));
        REQUIRE(f.config.set("whisper_model", "tiny"));
        f.cmd("start");
        REQUIRE(f.audio.rate == 8000);
        f.audio.feed({1, 2});
        f.cmd("stop");
        core.on_transcription_complete();

        REQUIRE(f.backend.seen.sample_rate == 8000);
        REQUIRE(f.backend.seen.whisper_model == "tiny");
    }

    SECTION("ToggleWhileProcessingIsBusy") {
        f.cmd("toggle");
        f.audio.feed({1});
        f.cmd("toggle");

        auto busy = f.cmd("toggle");
        REQUIRE(busy["status"] == "busy");
        REQUIRE(core.session_state() == SessionState::Processing);
        REQUIRE(f.audio.starts == 1);

        core.on_transcription_complete();
        REQUIRE(f.backend.calls == 1);
    }

    SECTION("StartAndStopRejectedInWrongState") {
        REQUIRE(f.cmd("stop")["status"] == "error");
        REQUIRE(f.cmd("start")["status"] == "ok");
        REQUIRE(f.cmd("start")["status"] == "error");
        REQUIRE(core.session_state() == SessionState::Recording);
    }

    SECTION("EmptySnapshotFailsImmediately") {
        f.cmd("start");
        auto resp = f.cmd("stop");
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "No audio captured");
        REQUIRE(core.session_state() == SessionState::Idle);
        REQUIRE(f.backend.calls == 0);
        REQUIRE(f.notifier.messages.size() == 1);
    }

    SECTION("CaptureFailureStaysIdle") {
        f.audio.fail_start = true;
        auto resp = f.cmd("toggle");
        REQUIRE(resp["status"] == "error");
        REQUIRE(core.session_state() == SessionState::Idle);
        REQUIRE(f.transitions.empty());
    }

    SECTION("BackendErrorNotifiesAndReturnsToIdle") {
        f.backend.next = std::unexpected(TranscribeError{
            TranscribeErrorKind::ModelNotFound, "Model not found at /x/ggml-base.bin"});

        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.add_waiting_client(3);
        core.on_transcription_complete();

        REQUIRE(core.session_state() == SessionState::Idle);
        REQUIRE(f.output.delivered.empty());
        REQUIRE(f.notifier.messages == std::vector<std::string>{"Model not found at /x/ggml-base.bin"});
        REQUIRE(f.ipc.sent[0].second["kind"] == "model_not_found");

        auto status = f.cmd("status");
        REQUIRE(status["state"] == "idle");
        REQUIRE(status["last_error"] == "Model not found at /x/ggml-base.bin");

        // A later success clears the error.
        f.backend.next = TranscriptResult{.text = "ok"};
        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.on_transcription_complete();
        REQUIRE_FALSE(f.cmd("status").contains("last_error"));
    }

    SECTION("ClipboardFailureIsReported") {
        f.output.fail = true;
        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.on_transcription_complete();
        REQUIRE(f.notifier.messages.size() == 1);
        REQUIRE(core.last_text() == "hello there");
    }

    SECTION("DisconnectedClientIsNotAnswered") {
        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.add_waiting_client(5);
        core.remove_waiting_client(5);
        core.on_transcription_complete();
        REQUIRE(f.ipc.sent.empty());
    }

    SECTION("StatusWhileRecording") {
        f.cmd("start");
        auto status = f.cmd("status");
        REQUIRE(status["state"] == "recording");
        REQUIRE(status.contains("duration"));
    }

    SECTION("TriggerToggles") {
        core.on_trigger();
        REQUIRE(core.session_state() == SessionState::Recording);
        f.audio.feed({4});
        core.on_trigger();
        REQUIRE(core.session_state() == SessionState::Processing);
        core.on_trigger();
        REQUIRE(core.session_state() == SessionState::Processing);
        core.on_transcription_complete();
        REQUIRE(core.session_state() == SessionState::Idle);
    }

    SECTION("ShutdownWaitsForWorker") {
        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.shutdown();
        REQUIRE(core.session_state() == SessionState::Idle);
        REQUIRE(f.output.delivered.size() == 1);
    }

    SECTION("ShutdownDiscardsRecording") {
        f.cmd("start");
        core.shutdown();
        REQUIRE(core.session_state() == SessionState::Idle);
        REQUIRE(f.backend.calls == 0);
        REQUIRE_FALSE(f.audio.is_capturing());
    }

    SECTION("UnknownCommand") {
        REQUIRE(f.cmd("dance")["status"] == "error");
    }
}

TEST_CASE("DaemonCore history and copy", "[core]") {
    Fixture f;
    auto& core = f.make();

    SECTION("CopyBeforeAnyTranscript") {
        REQUIRE(f.cmd("copy")["status"] == "error");
    }

    SECTION("CopyRepeatsLastTranscript") {
        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.on_transcription_complete();

        REQUIRE(f.cmd("copy")["status"] == "ok");
        REQUIRE(f.output.delivered == std::vector<std::string>{"hello there", "hello there"});
    }

    SECTION("HistoryRecordsSuccessesOnly") {
        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.on_transcription_complete();

        f.backend.next = std::unexpected(TranscribeError{TranscribeErrorKind::NoSpeechDetected,
                                                         "No speech detected"});
        f.cmd("start");
        f.audio.feed({1});
        f.cmd("stop");
        core.on_transcription_complete();

        auto hist = f.cmd("history", {{"limit", 5}});
        REQUIRE(hist["status"] == "ok");
        REQUIRE(hist["entries"].size() == 1);
        REQUIRE(hist["entries"][0]["text"] == "hello there");
        REQUIRE(hist["entries"][0]["model"] == "base");
    }

    SECTION("HistoryRejectsBadLimit") {
        REQUIRE(f.cmd("history", {{"limit", "ten"}})["status"] == "error");
        REQUIRE(f.cmd("history", {{"limit", 0}})["status"] == "error");
    }
}

TEST_CASE("DaemonCore config and hotkeys", "[core]") {
    Fixture f;

    SECTION("GetAllAndOneKey") {
        f.make();
        auto all = f.cmd("config");
        REQUIRE(all["config"]["whisper_model"] == "base");

        auto one = f.cmd("config", {{"key", "max_recordings"}});
        REQUIRE(one["value"] == 5);
    }

    SECTION("SetValidatesAndPersists") {
        f.make();
        REQUIRE(f.cmd("config", {{"key", "max_seconds"}, {"value", 60}})["status"] == "ok");
        REQUIRE(f.cmd("config", {{"key", "max_seconds"}, {"value", -1}})["status"] == "error");

        ConfigStore reloaded;
        reloaded.load(f.config.path());
        REQUIRE(reloaded.settings().max_seconds == 60);
    }

    SECTION("EnablingRegistersHotkeys") {
        f.make();
        auto resp = f.cmd("config", {{"key", "hotkeys_enabled"}, {"value", true}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(f.hotkeys.registers == 1);
        REQUIRE(f.hotkeys.last == std::vector<std::string>{"Ctrl+Shift+R"});

        REQUIRE(f.cmd("config", {{"key", "hotkeys"}, {"value", json::array({"F9"})}})["status"] == "ok");
        REQUIRE(f.hotkeys.registers == 2);
        REQUIRE(f.hotkeys.last == std::vector<std::string>{"F9"});

        REQUIRE(f.cmd("config", {{"key", "hotkeys_enabled"}, {"value", false}})["status"] == "ok");
        REQUIRE(f.hotkeys.unregisters == 1);
    }

    SECTION("ChangingHotkeysWhileDisabledDoesNotRegister") {
        f.make();
        REQUIRE(f.cmd("config", {{"key", "hotkeys"}, {"value", json::array({"F9"})}})["status"] == "ok");
        REQUIRE(f.hotkeys.registers == 0);
    }

    SECTION("FailedRegistrationDisablesHotkeys") {
        f.make();
        f.hotkeys.fail = true;
        auto resp = f.cmd("config", {{"key", "hotkeys_enabled"}, {"value", true}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "hotkey_registration_failed");
        REQUIRE(f.config.settings().hotkeys_enabled == false);
        REQUIRE(f.notifier.messages.size() == 1);

        ConfigStore reloaded;
        reloaded.load(f.config.path());
        REQUIRE_FALSE(reloaded.settings().hotkeys_enabled);
    }

    SECTION("FailedReplacementRemovesOldBindings") {
        f.make();
        REQUIRE(f.cmd("config", {{"key", "hotkeys_enabled"}, {"value", true}})["status"] == "ok");
        REQUIRE(f.hotkeys.unregisters == 0);

        f.hotkeys.fail = true;
        auto resp = f.cmd("config", {{"key", "hotkeys"}, {"value", json::array({"Bad+"})}});
        REQUIRE(resp["kind"] == "hotkey_registration_failed");
        REQUIRE(f.hotkeys.unregisters == 1);
        REQUIRE_FALSE(f.config.settings().hotkeys_enabled);

        // Disabled now, so shutdown has nothing left to remove.
        f.core->shutdown();
        REQUIRE(f.hotkeys.unregisters == 1);
    }

    SECTION("FailedReplacementRestoresHotkeyList") {
        f.make();
        REQUIRE(f.cmd("config", {{"key", "hotkeys_enabled"}, {"value", true}})["status"] == "ok");

        f.hotkeys.fail = true;
        REQUIRE(f.cmd("config", {{"key", "hotkeys"}, {"value", json::array({"Hyper+X"})}})["status"] == "error");
        REQUIRE(f.config.get("hotkeys") == json::array({"Ctrl+Shift+R"}));

        ConfigStore reloaded;
        reloaded.load(f.config.path());
        REQUIRE(reloaded.settings().hotkeys == std::vector<std::string>{"Ctrl+Shift+R"});
    }

    SECTION("StartupRegistersWhenEnabled") {
        REQUIRE(f.config.set("hotkeys_enabled", true));
        auto& core = f.make();
        REQUIRE(f.hotkeys.registers == 1);

        core.shutdown();
        REQUIRE(f.hotkeys.unregisters == 1);
    }

    SECTION("StartupFailureDisables") {
        REQUIRE(f.config.set("hotkeys_enabled", true));
        f.hotkeys.fail = true;
        f.make();
        REQUIRE_FALSE(f.config.settings().hotkeys_enabled);
        REQUIRE(f.cmd("status")["last_error"] == "Hotkey registration failed");
    }

    SECTION("ShutdownWithoutHotkeysDoesNotTouchBridge") {
        auto& core = f.make();
        core.shutdown();
        REQUIRE(f.hotkeys.unregisters == 0);
    }
}
