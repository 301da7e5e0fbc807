#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kTriggerName = "toggle.trigger";
constexpr long kTriggerPollMs = 500;

std::string config_dir_or_tmp() {
    auto dir = platform::config_dir();
    return dir.empty() ? "/tmp/voice-transcribe" : dir;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(ConfigStore& config, bool verbose)
    : config_(config), verbose_(verbose),
      recordings_(fs::path(config_dir_or_tmp()) / "recordings"),
      backend_(runner_, recordings_),
      clipboard_(runner_),
      notifier_(runner_),
      trigger_(fs::path(config_dir_or_tmp()) / kTriggerName),
      hotkeys_(runner_, trigger_.path().string()),
      core_(config_, verbose_, audio_capture_, backend_, ipc_server_,
            clipboard_, notifier_, hotkeys_,
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) != sizeof(val)) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (poll_timer_fd_ >= 0) ::close(poll_timer_fd_);
}

bool LinuxEventLoop::init() {
    // Child processes report a closed pipe as EPIPE, not as a signal.
    ::signal(SIGPIPE, SIG_IGN);

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Trigger marker: stale markers from a previous run never toggle.
    if (!trigger_.prepare()) return false;
    if (trigger_.consume()) {
        log("Discarded stale trigger marker");
    }
    if (!trigger_watch_.watch(trigger_.path().parent_path().string(), kTriggerName)) {
        log("inotify unavailable, relying on polling for the trigger marker");
    }

    // Core init (history db, hotkeys)
    auto data = platform::data_dir();
    auto db_path = (data.empty() ? std::string("/tmp/voice-transcribe") : data) + "/history.db";
    if (!core_.init(db_path)) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Trigger poll timer
    poll_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (poll_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec period{};
    period.it_interval.tv_nsec = kTriggerPollMs * 1000000L;
    period.it_value = period.it_interval;
    if (timerfd_settime(poll_timer_fd_, 0, &period, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(poll_timer_fd_, EPOLLIN)) {
        return false;
    }

    if (trigger_watch_.fd() >= 0 && !add_fd(trigger_watch_.fd(), EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) == sizeof(val)) {
                    core_.on_transcription_complete();
                }
                continue;
            }

            if (fd == trigger_watch_.fd()) {
                if (trigger_watch_.read_events()) check_trigger();
                continue;
            }

            if (fd == poll_timer_fd_) {
                uint64_t expirations;
                if (::read(poll_timer_fd_, &expirations, sizeof(expirations)) == sizeof(expirations)) {
                    check_trigger();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    nlohmann::json cmd;
    ReadStatus status;
    while ((status = ipc_server_.read_command(fd, cmd)) != ReadStatus::Pending) {
        if (status == ReadStatus::Closed) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            core_.remove_waiting_client(fd);
            ipc_server_.close_client(fd);
            return;
        }

        if (status == ReadStatus::Invalid) {
            ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid JSON command"}});
            continue;
        }

        std::string cmd_str;
        if (cmd.contains("cmd") && cmd["cmd"].is_string()) cmd_str = cmd["cmd"].get<std::string>();
        auto response = core_.handle_command(cmd_str, cmd);

        if (response.value("status", "") == "transcribing") {
            core_.add_waiting_client(fd);
        } else {
            ipc_server_.send_response(fd, response);
        }
    }
}

void LinuxEventLoop::check_trigger() {
    if (trigger_.consume()) {
        core_.on_trigger();
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voice-transcribe] {}", msg);
    }
}
