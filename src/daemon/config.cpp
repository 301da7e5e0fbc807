#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr uint32_t kMaxSampleRate = 384000;
constexpr uint32_t kMaxCaptureSeconds = 3600;
// One hour at 48 kHz; the capture buffer is allocated up front.
constexpr uint64_t kMaxCaptureSamples = 48000ull * 3600;

bool is_uint(const json& v) {
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
}

} // namespace

std::string Settings::default_whisper_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "whisper.cpp";
    return (fs::path(home) / "whisper.cpp").string();
}

json Settings::to_json() const {
    return {
        {"hotkeys_enabled", hotkeys_enabled},
        {"hotkeys", hotkeys},
        {"sample_rate", sample_rate},
        {"whisper_model", whisper_model},
        {"whisper_path", whisper_path},
        {"max_recordings", max_recordings},
        {"max_seconds", max_seconds},
        {"transcribe_timeout", transcribe_timeout},
    };
}

Settings Settings::from_json(const json& j) {
    Settings s;
    if (!j.is_object()) return s;

    auto valid = [&j](const char* key) {
        if (!j.contains(key)) return false;
        auto res = ConfigStore::validate(key, j[key]);
        if (!res) {
            std::println(stderr, "config: {}, using default", res.error());
            return false;
        }
        return true;
    };

    if (valid("hotkeys_enabled")) s.hotkeys_enabled = j["hotkeys_enabled"].get<bool>();
    if (valid("hotkeys")) s.hotkeys = j["hotkeys"].get<std::vector<std::string>>();
    if (valid("sample_rate")) s.sample_rate = j["sample_rate"].get<uint32_t>();
    if (valid("whisper_model")) s.whisper_model = j["whisper_model"].get<std::string>();
    if (valid("whisper_path")) s.whisper_path = j["whisper_path"].get<std::string>();
    if (valid("max_recordings")) s.max_recordings = j["max_recordings"].get<uint32_t>();
    if (valid("max_seconds")) s.max_seconds = j["max_seconds"].get<uint32_t>();
    if (valid("transcribe_timeout")) s.transcribe_timeout = j["transcribe_timeout"].get<uint32_t>();
    return s;
}

ConfigStore::ConfigStore()
    : values_(Settings{}.to_json()) {}

void ConfigStore::load(const std::string& path) {
    std::lock_guard lock(mu_);
    path_ = path;
    values_ = Settings{}.to_json();

    std::ifstream f(path);
    if (!f.is_open()) {
        if (fs::exists(path)) {
            std::println(stderr, "config: could not open {}, using defaults", path);
            return;
        }
        save_locked();
        return;
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error in {}: {}, using defaults", path, e.what());
        return;
    }
    if (!j.is_object()) {
        std::println(stderr, "config: {} is not a JSON object, using defaults", path);
        return;
    }

    // Migration first, so defaults never shadow a migrated value.
    bool changed = migrate(j);

    for (auto& [key, value] : values_.items()) {
        if (!j.contains(key)) {
            j[key] = value;
            changed = true;
        } else if (auto res = validate(key, j[key]); !res) {
            std::println(stderr, "config: {}, using default", res.error());
            j[key] = value;
            changed = true;
        }
    }
    if (j["sample_rate"].get<uint64_t>() * j["max_seconds"].get<uint64_t>() > kMaxCaptureSamples) {
        std::println(stderr, "config: max_seconds too long for sample_rate, using default");
        j["max_seconds"] = values_["max_seconds"];
        changed = true;
    }
    values_ = std::move(j);

    if (changed) save_locked();
}

void ConfigStore::load_default() {
    load(default_path());
}

bool ConfigStore::migrate(json& j) {
    bool changed = false;

    if (j.contains("hotkey")) {
        auto legacy = j["hotkey"];
        j.erase("hotkey");
        changed = true;
        if (!j.contains("hotkeys") && legacy.is_string() &&
            !legacy.get<std::string>().empty()) {
            j["hotkeys"] = json::array({legacy});
        }
    }

    if (j.contains("hotkey_enabled")) {
        auto legacy = j["hotkey_enabled"];
        j.erase("hotkey_enabled");
        changed = true;
        if (!j.contains("hotkeys_enabled") && legacy.is_boolean()) {
            j["hotkeys_enabled"] = legacy;
        }
    }

    return changed;
}

std::expected<void, std::string> ConfigStore::validate(const std::string& key,
                                                       const json& value) {
    auto bad = [&key](const char* why) {
        return std::unexpected(std::format("invalid value for {}: {}", key, why));
    };

    if (key == "hotkeys_enabled") {
        if (!value.is_boolean()) return bad("expected true or false");
    } else if (key == "hotkeys") {
        if (!value.is_array()) return bad("expected a list of key combinations");
        for (auto& v : value) {
            if (!v.is_string() || v.get<std::string>().empty()) {
                return bad("key combinations must be non-empty strings");
            }
        }
    } else if (key == "sample_rate") {
        if (!is_uint(value)) return bad("expected a positive integer");
        auto rate = value.get<uint64_t>();
        if (rate == 0 || rate > kMaxSampleRate) return bad("out of range");
    } else if (key == "whisper_model") {
        if (!value.is_string() || value.get<std::string>().empty()) {
            return bad("expected a model name");
        }
    } else if (key == "whisper_path") {
        if (!value.is_string()) return bad("expected a path");
    } else if (key == "max_recordings") {
        if (!is_uint(value) || value.get<uint64_t>() > UINT32_MAX) {
            return bad("expected an integer >= 0");
        }
    } else if (key == "max_seconds") {
        if (!is_uint(value)) return bad("expected a positive integer");
        auto secs = value.get<uint64_t>();
        if (secs == 0 || secs > kMaxCaptureSeconds) return bad("out of range");
    } else if (key == "transcribe_timeout") {
        if (!is_uint(value)) return bad("expected a positive integer");
        auto secs = value.get<uint64_t>();
        if (secs == 0 || secs > UINT32_MAX) return bad("out of range");
    }
    return {};
}

bool ConfigStore::save() const {
    std::lock_guard lock(mu_);
    return save_locked();
}

bool ConfigStore::save_locked() const {
    if (path_.empty()) return true;

    fs::path p(path_);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            std::println(stderr, "config: could not write {}", tmp.string());
            return false;
        }
        f << values_.dump(2) << '\n';
        if (!f.good()) {
            std::println(stderr, "config: write to {} failed", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        std::println(stderr, "config: could not replace {}: {}", path_, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

json ConfigStore::get(const std::string& key) const {
    std::lock_guard lock(mu_);
    auto it = values_.find(key);
    return it != values_.end() ? *it : json();
}

json ConfigStore::all() const {
    std::lock_guard lock(mu_);
    return values_;
}

std::expected<void, std::string> ConfigStore::set(const std::string& key, const json& value) {
    if (key.empty()) return std::unexpected("empty key");
    if (auto res = validate(key, value); !res) return res;

    std::lock_guard lock(mu_);
    if (key == "sample_rate" || key == "max_seconds") {
        const auto& other = values_[key == "sample_rate" ? "max_seconds" : "sample_rate"];
        if (value.get<uint64_t>() * other.get<uint64_t>() > kMaxCaptureSamples) {
            return std::unexpected(std::format(
                "invalid value for {}: capture buffer would exceed {} samples",
                key, kMaxCaptureSamples));
        }
    }

    auto previous = values_.find(key) != values_.end()
        ? std::optional<json>(values_[key]) : std::nullopt;

    values_[key] = value;
    if (!save_locked()) {
        if (previous) values_[key] = *previous;
        else values_.erase(key);
        return std::unexpected("could not write " + path_);
    }
    return {};
}

Settings ConfigStore::settings() const {
    std::lock_guard lock(mu_);
    return Settings::from_json(values_);
}

std::string ConfigStore::path() const {
    std::lock_guard lock(mu_);
    return path_;
}

std::string ConfigStore::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return "config.json";
    return (fs::path(dir) / "config.json").string();
}
