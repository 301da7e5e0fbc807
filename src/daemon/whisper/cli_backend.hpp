#pragma once

#include "backend.hpp"
#include "../platform/process_runner.hpp"
#include "../storage/recording_store.hpp"

#include <filesystem>
#include <string>

// Runs a locally built whisper.cpp command-line binary over a WAV file.
class CliBackend : public WhisperBackend {
public:
    CliBackend(ProcessRunner& runner, RecordingStore& recordings);

    std::expected<TranscriptResult, TranscribeError>
        transcribe(std::span<const int16_t> audio, const Settings& settings) override;

    // First existing of build/bin/whisper-cli, build/bin/main, main under root.
    static std::expected<std::filesystem::path, TranscribeError>
        resolve_binary(const std::filesystem::path& root);
    static std::expected<std::filesystem::path, TranscribeError>
        resolve_model(const std::filesystem::path& root, const std::string& model);

private:
    std::expected<TranscriptResult, TranscribeError>
        run_whisper(const std::filesystem::path& audio_file, const Settings& settings);

    ProcessRunner& runner_;
    RecordingStore& recordings_;
};
