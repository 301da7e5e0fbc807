#pragma once

#include <cstdint>
#include <span>

// Receives sample chunks from the audio driver thread. push() must not block.
class AudioSink {
public:
    virtual ~AudioSink() = default;
    virtual void push(std::span<const int16_t> chunk) = 0;
};

class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    // Both calls are idempotent: start() on a running capture returns true,
    // stop() on a stopped capture does nothing.
    virtual bool start(AudioSink& sink, uint32_t sample_rate) = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
