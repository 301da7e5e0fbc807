#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer buffer of PCM samples.
// Producer (audio thread) calls write(). Consumer (event loop) calls drain_all()
// only after the producer has been stopped.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: append samples. Samples that do not fit are dropped and counted.
    // Returns the number of samples stored.
    size_t write(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(samples.size(), avail);
        if (to_write < samples.size()) {
            dropped_.fetch_add(samples.size() - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + static_cast<std::ptrdiff_t>(offset));
        if (first < to_write) {
            std::copy_n(samples.begin() + static_cast<std::ptrdiff_t>(first),
                        to_write - first, buf_.begin());
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: move every stored sample out, in write order.
    std::vector<int16_t> drain_all() {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t avail = w - r;
        if (avail == 0) return {};

        std::vector<int16_t> out(avail);
        size_t offset = r % capacity_;
        size_t first = std::min(avail, capacity_ - offset);
        std::copy_n(buf_.begin() + static_cast<std::ptrdiff_t>(offset), first, out.begin());
        if (first < avail) {
            std::copy_n(buf_.begin(), avail - first,
                        out.begin() + static_cast<std::ptrdiff_t>(first));
        }

        read_pos_.store(r + avail, std::memory_order_release);
        return out;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Only valid while no producer is running.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
