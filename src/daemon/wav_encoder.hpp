#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// 16-bit mono PCM WAV, as whisper.cpp expects it.
namespace wav {

inline constexpr size_t kHeaderSize = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    const uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    const uint16_t block_align = channels * bits_per_sample / 8;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + data_size);

    auto tag = [&out](const char (&t)[5]) { out.insert(out.end(), t, t + 4); };
    auto le16 = [&out](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xff));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto le32 = [&le16](uint32_t v) {
        le16(static_cast<uint16_t>(v & 0xffff));
        le16(static_cast<uint16_t>(v >> 16));
    };

    tag("RIFF");
    le32(36 + data_size);
    tag("WAVE");
    tag("fmt ");
    le32(16);               // fmt chunk size
    le16(1);                // PCM
    le16(channels);
    le32(sample_rate);
    le32(byte_rate);
    le16(block_align);
    le16(bits_per_sample);
    tag("data");
    le32(data_size);
    for (int16_t s : samples) le16(static_cast<uint16_t>(s));

    return out;
}

} // namespace wav
