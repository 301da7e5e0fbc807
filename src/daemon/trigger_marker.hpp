#pragma once

#include <filesystem>

// A file whose creation means "toggle now". Whoever removes it owns the
// trigger, so a marker seen by both the watch and the poll fires once.
class TriggerMarker {
public:
    explicit TriggerMarker(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

    // Creates the parent directory so the hotkey command can write the marker.
    bool prepare() const;

    // True only for the call that actually removed the marker.
    bool consume() const;

private:
    std::filesystem::path path_;
};
