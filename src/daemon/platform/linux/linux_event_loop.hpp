#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/desktop_clipboard_output.hpp"
#include "platform/linux/gnome_hotkey_bridge.hpp"
#include "platform/linux/inotify_watch.hpp"
#include "platform/linux/notify_send_notifier.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/posix_process_runner.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "storage/recording_store.hpp"
#include "trigger_marker.hpp"
#include "whisper/cli_backend.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    LinuxEventLoop(ConfigStore& config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void check_trigger();
    void log(const std::string& msg);

    ConfigStore& config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PosixProcessRunner runner_;
    PipeWireCapture audio_capture_;
    RecordingStore recordings_;
    CliBackend backend_;
    DesktopClipboardOutput clipboard_;
    NotifySendNotifier notifier_;
    TriggerMarker trigger_;
    GnomeHotkeyBridge hotkeys_;
    UnixSocketServer ipc_server_;
    InotifyWatch trigger_watch_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int poll_timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
