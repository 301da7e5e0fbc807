#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

enum class SessionState { Idle, Recording, Processing };

const char* to_string(SessionState state);

// One capture-transcribe cycle at a time: Idle -> Recording -> Processing -> Idle.
// All methods except push() run on the event loop thread; push() runs on the
// audio driver thread and only touches the ring buffer.
class Session : public AudioSink {
public:
    explicit Session(AudioCapture& capture);

    bool start_recording(uint32_t sample_rate, uint32_t max_seconds);
    // Stops capture, then snapshots the buffer. Moves to Processing.
    // Returns empty if recording was not active.
    std::vector<int16_t> stop_recording();
    // Processing -> Idle. Returns false in any other state.
    bool finish();

    void push(std::span<const int16_t> chunk) override;

    SessionState state() const { return state_; }
    double recording_duration() const;
    uint32_t sample_rate() const { return sample_rate_; }
    size_t dropped_samples() const { return ring_buf_ ? ring_buf_->dropped() : 0; }

private:
    AudioCapture& capture_;
    std::unique_ptr<RingBuffer> ring_buf_;
    uint32_t sample_rate_ = 0;
    SessionState state_ = SessionState::Idle;
    std::chrono::steady_clock::time_point record_start_;
};
