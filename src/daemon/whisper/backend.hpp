#pragma once

#include "../config.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

enum class TranscribeErrorKind {
    PersistenceError,
    BinaryNotFound,
    ModelNotFound,
    NoSpeechDetected,
    TranscriptionFailed,
    TranscriptionTimeout,
};

const char* to_string(TranscribeErrorKind kind);

struct TranscribeError {
    TranscribeErrorKind kind;
    std::string message;
};

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
    std::string audio_file;
};

class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    // Blocking; runs on the transcription worker with a settings snapshot.
    virtual std::expected<TranscriptResult, TranscribeError>
        transcribe(std::span<const int16_t> audio, const Settings& settings) = 0;
};
