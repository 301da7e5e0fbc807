#include "recording_store.hpp"

#include "../wav_encoder.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kPrefix = "recording_";
constexpr std::string_view kExtension = ".wav";

std::string timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

} // namespace

RecordingStore::RecordingStore(fs::path dir)
    : dir_(std::move(dir)) {}

bool RecordingStore::is_recording_name(const std::string& filename) {
    return filename.size() > kPrefix.size() + kExtension.size() &&
           filename.starts_with(kPrefix) && filename.ends_with(kExtension);
}

fs::path RecordingStore::next_path(std::chrono::system_clock::time_point when) const {
    auto stem = std::string(kPrefix) + timestamp(when);
    auto candidate = dir_ / (stem + std::string(kExtension));

    std::error_code ec;
    for (int n = 2; fs::exists(candidate, ec); ++n) {
        candidate = dir_ / std::format("{}_{}{}", stem, n, kExtension);
    }
    return candidate;
}

std::expected<fs::path, std::string>
RecordingStore::save(std::span<const int16_t> samples, uint32_t sample_rate,
                     std::chrono::system_clock::time_point when) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", dir_.string(), ec.message()));
    }

    auto path = next_path(when);
    auto bytes = wav::encode(samples, sample_rate);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot write " + path.string());
    }
    f.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    f.close();
    if (!f) {
        fs::remove(path, ec);
        return std::unexpected("write failed for " + path.string());
    }
    return path;
}

std::vector<RecordingInfo> RecordingStore::list() const {
    std::vector<RecordingInfo> out;

    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) return out;

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        if (!is_recording_name(entry.path().filename().string())) continue;

        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec) continue;
        out.push_back({entry.path(), mtime});
    }

    std::ranges::sort(out, [](const RecordingInfo& a, const RecordingInfo& b) {
        if (a.mtime != b.mtime) return a.mtime < b.mtime;
        return a.path.filename() < b.path.filename();
    });
    return out;
}

size_t RecordingStore::prune(size_t max_count) {
    auto recordings = list();
    if (recordings.size() <= max_count) return 0;

    size_t excess = recordings.size() - max_count;
    size_t deleted = 0;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        if (fs::remove(recordings[i].path, ec)) {
            ++deleted;
        } else if (ec) {
            std::println(stderr, "recordings: could not delete {}: {}",
                         recordings[i].path.string(), ec.message());
        }
    }
    return deleted;
}
