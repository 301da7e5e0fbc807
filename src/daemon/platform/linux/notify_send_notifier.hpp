#pragma once

#include "platform/notifier.hpp"
#include "platform/process_runner.hpp"

// Desktop notification through notify-send; the daemon log when that fails.
class NotifySendNotifier : public Notifier {
public:
    explicit NotifySendNotifier(ProcessRunner& runner);
    void notify(const std::string& title, const std::string& message) override;

private:
    ProcessRunner& runner_;
};
