#include "platform/linux/inotify_watch.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/inotify.h>
#include <unistd.h>

InotifyWatch::InotifyWatch() = default;

InotifyWatch::~InotifyWatch() {
    if (fd_ >= 0) ::close(fd_);
}

bool InotifyWatch::watch(const std::string& dir, const std::string& name) {
    if (fd_ < 0) {
        fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (fd_ < 0) {
            std::println(stderr, "inotify: init failed: {}", std::strerror(errno));
            return false;
        }
    }

    wd_ = inotify_add_watch(fd_, dir.c_str(), IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO);
    if (wd_ < 0) {
        std::println(stderr, "inotify: cannot watch {}: {}", dir, std::strerror(errno));
        return false;
    }
    name_ = name;
    return true;
}

bool InotifyWatch::read_events() {
    alignas(inotify_event) char buf[4096];
    bool matched = false;

    while (true) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN) {
                std::println(stderr, "inotify: read failed: {}", std::strerror(errno));
            }
            break;
        }
        if (n == 0) break;

        for (ssize_t off = 0; off < n;) {
            auto* ev = reinterpret_cast<const inotify_event*>(buf + off);
            if (ev->wd == wd_ && ev->len > 0 && name_ == ev->name) matched = true;
            if (ev->mask & IN_Q_OVERFLOW) matched = true;
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
        }
    }
    return matched;
}
