#include "session.hpp"

#include <print>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Processing: return "processing";
    }
    return "unknown";
}

Session::Session(AudioCapture& capture)
    : capture_(capture) {}

bool Session::start_recording(uint32_t sample_rate, uint32_t max_seconds) {
    if (state_ != SessionState::Idle) {
        std::println(stderr, "session: cannot start, state is {}", to_string(state_));
        return false;
    }

    size_t capacity = static_cast<size_t>(max_seconds) * sample_rate;
    if (capacity == 0) {
        std::println(stderr, "session: capture buffer would be empty");
        return false;
    }

    if (!ring_buf_ || ring_buf_->capacity() != capacity) {
        ring_buf_ = std::make_unique<RingBuffer>(capacity);
    } else {
        ring_buf_->reset();
    }
    sample_rate_ = sample_rate;

    if (!capture_.start(*this, sample_rate)) {
        std::println(stderr, "session: failed to start audio capture");
        return false;
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return true;
}

std::vector<int16_t> Session::stop_recording() {
    if (state_ != SessionState::Recording) {
        return {};
    }

    capture_.stop();
    state_ = SessionState::Processing;

    if (ring_buf_->dropped() > 0) {
        std::println(stderr, "session: buffer full, dropped {} samples",
                     ring_buf_->dropped());
    }
    return ring_buf_->drain_all();
}

bool Session::finish() {
    if (state_ != SessionState::Processing) return false;
    state_ = SessionState::Idle;
    return true;
}

void Session::push(std::span<const int16_t> chunk) {
    // Chunks arriving after stop_recording() never reach the snapshot; the
    // next start_recording() resets them away.
    if (ring_buf_) ring_buf_->write(chunk);
}

double Session::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}
