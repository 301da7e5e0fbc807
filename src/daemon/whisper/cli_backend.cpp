#include "cli_backend.hpp"
#include "output_parser.hpp"

#include <array>
#include <chrono>
#include <format>

namespace fs = std::filesystem;

namespace {

std::unexpected<TranscribeError> fail(TranscribeErrorKind kind, std::string message) {
    return std::unexpected(TranscribeError{kind, std::move(message)});
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

const char* to_string(TranscribeErrorKind kind) {
    switch (kind) {
        case TranscribeErrorKind::PersistenceError: return "persistence_error";
        case TranscribeErrorKind::BinaryNotFound: return "binary_not_found";
        case TranscribeErrorKind::ModelNotFound: return "model_not_found";
        case TranscribeErrorKind::NoSpeechDetected: return "no_speech_detected";
        case TranscribeErrorKind::TranscriptionFailed: return "transcription_failed";
        case TranscribeErrorKind::TranscriptionTimeout: return "transcription_timeout";
    }
    return "unknown";
}

CliBackend::CliBackend(ProcessRunner& runner, RecordingStore& recordings)
    : runner_(runner), recordings_(recordings) {}

std::expected<fs::path, TranscribeError> CliBackend::resolve_binary(const fs::path& root) {
    const std::array<fs::path, 3> candidates = {
        root / "build" / "bin" / "whisper-cli",
        root / "build" / "bin" / "main",
        root / "main",
    };

    std::error_code ec;
    for (const auto& c : candidates) {
        if (fs::is_regular_file(c, ec)) return c;
    }
    return fail(TranscribeErrorKind::BinaryNotFound,
                "Whisper binary not found at " + candidates.back().string());
}

std::expected<fs::path, TranscribeError>
CliBackend::resolve_model(const fs::path& root, const std::string& model) {
    auto path = root / "models" / std::format("ggml-{}.bin", model);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return fail(TranscribeErrorKind::ModelNotFound, "Model not found at " + path.string());
    }
    return path;
}

std::expected<TranscriptResult, TranscribeError>
CliBackend::transcribe(std::span<const int16_t> audio, const Settings& settings) {
    if (audio.empty()) {
        return fail(TranscribeErrorKind::NoSpeechDetected, "No audio captured");
    }

    std::expected<TranscriptResult, TranscribeError> result;
    auto saved = recordings_.save(audio, settings.sample_rate);
    if (saved) {
        result = run_whisper(*saved, settings);
    } else {
        result = fail(TranscribeErrorKind::PersistenceError,
                      "Could not save recording: " + saved.error());
    }

    // Retention holds whatever the outcome of this cycle.
    recordings_.prune(settings.max_recordings);

    if (result) {
        result->duration_s = static_cast<double>(audio.size()) / settings.sample_rate;
    }
    return result;
}

std::expected<TranscriptResult, TranscribeError>
CliBackend::run_whisper(const fs::path& audio_file, const Settings& settings) {
    fs::path root(settings.whisper_path);

    auto binary = resolve_binary(root);
    if (!binary) return std::unexpected(binary.error());

    auto model = resolve_model(root, settings.whisper_model);
    if (!model) return std::unexpected(model.error());

    auto start = std::chrono::steady_clock::now();

    // -nt: no per-segment timestamps. parse_output strips them anyway for
    // builds that ignore the flag.
    auto run = runner_.run({binary->string(), "-m", model->string(),
                            "-f", audio_file.string(), "-nt"},
                           {}, std::chrono::seconds(settings.transcribe_timeout));

    auto end = std::chrono::steady_clock::now();

    if (!run) {
        return fail(TranscribeErrorKind::TranscriptionFailed,
                    "Transcription failed: " + run.error());
    }
    if (run->timed_out) {
        return fail(TranscribeErrorKind::TranscriptionTimeout,
                    std::format("Transcription timed out after {}s",
                                settings.transcribe_timeout));
    }
    if (run->exit_code != 0) {
        auto detail = trim(run->err);
        if (detail.empty()) {
            detail = run->term_signal != 0
                ? std::format("killed by signal {}", run->term_signal)
                : std::format("exit code {}", run->exit_code);
        }
        return fail(TranscribeErrorKind::TranscriptionFailed, "Transcription failed: " + detail);
    }

    auto text = whisper::parse_output(run->out);
    if (text.empty()) {
        return fail(TranscribeErrorKind::NoSpeechDetected, "No speech detected");
    }

    return TranscriptResult{
        .text = std::move(text),
        .duration_s = 0.0,
        .processing_s = std::chrono::duration<double>(end - start).count(),
        .audio_file = audio_file.string(),
    };
}
