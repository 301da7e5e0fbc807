#pragma once

#include <cstdint>
#include <expected>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Typed view of the configuration, handed by value to whoever needs a
// consistent copy (the transcription worker in particular).
struct Settings {
    bool hotkeys_enabled = false;
    std::vector<std::string> hotkeys = {"Ctrl+Shift+R"};
    uint32_t sample_rate = 16000;
    std::string whisper_model = "base";
    std::string whisper_path = default_whisper_path();
    uint32_t max_recordings = 5;
    // Capture buffer length; audio beyond it is dropped.
    uint32_t max_seconds = 300;
    // Upper bound on one run of the external transcriber.
    uint32_t transcribe_timeout = 300;

    nlohmann::json to_json() const;
    // Reads known keys; missing or invalid values keep their defaults.
    static Settings from_json(const nlohmann::json& j);

    static std::string default_whisper_path();
};

// Owner of the persisted key-value configuration. Unknown keys survive a
// load/save cycle. Every method is safe to call from any thread.
class ConfigStore {
public:
    ConfigStore();

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    // Reads the file at path, migrating legacy keys and filling defaults.
    // A missing file is created with defaults; an unparsable file is left
    // untouched and defaults are used in memory.
    void load(const std::string& path);
    void load_default();

    bool save() const;

    nlohmann::json get(const std::string& key) const;
    nlohmann::json all() const;
    std::expected<void, std::string> set(const std::string& key, const nlohmann::json& value);

    Settings settings() const;
    std::string path() const;

    static std::string default_path();

    // Renames hotkey -> hotkeys and hotkey_enabled -> hotkeys_enabled.
    // Returns true if anything changed.
    static bool migrate(nlohmann::json& j);
    static std::expected<void, std::string> validate(const std::string& key,
                                                     const nlohmann::json& value);

private:
    bool save_locked() const;

    mutable std::mutex mu_;
    std::string path_;
    nlohmann::json values_;
};
