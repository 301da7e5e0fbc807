#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

struct RecordingInfo {
    std::filesystem::path path;
    std::filesystem::file_time_type mtime;
};

// Audio artifacts of past cycles, named recording_<YYYYMMDD_HHMMSS>.wav.
class RecordingStore {
public:
    explicit RecordingStore(std::filesystem::path dir);

    const std::filesystem::path& dir() const { return dir_; }

    // Writes samples as WAV under a fresh timestamped name.
    std::expected<std::filesystem::path, std::string>
        save(std::span<const int16_t> samples, uint32_t sample_rate,
             std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    // Oldest first by modification time, then by name.
    std::vector<RecordingInfo> list() const;

    // Deletes the oldest recordings until at most max_count remain.
    // Failures are logged and skipped. Returns how many were deleted.
    size_t prune(size_t max_count);

    // recording_<local YYYYMMDD_HHMMSS>.wav; _2, _3, ... appended while taken.
    std::filesystem::path next_path(std::chrono::system_clock::time_point when) const;

    static bool is_recording_name(const std::string& filename);

private:
    std::filesystem::path dir_;
};
