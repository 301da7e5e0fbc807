#pragma once

#include <string>

// Watches one directory for a single file name being created or written.
class InotifyWatch {
public:
    InotifyWatch();
    ~InotifyWatch();

    InotifyWatch(const InotifyWatch&) = delete;
    InotifyWatch& operator=(const InotifyWatch&) = delete;

    bool watch(const std::string& dir, const std::string& name);
    int fd() const { return fd_; }

    // Drains pending events. True if any of them named the watched file.
    bool read_events();

private:
    int fd_ = -1;
    int wd_ = -1;
    std::string name_;
};
