#pragma once

#include <string>

// Best-effort user-visible message; never fails the caller.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& title, const std::string& message) = 0;
};
