#include "trigger_marker.hpp"

#include <print>

namespace fs = std::filesystem;

TriggerMarker::TriggerMarker(fs::path path)
    : path_(std::move(path)) {}

bool TriggerMarker::prepare() const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        std::println(stderr, "trigger: cannot create {}: {}",
                     path_.parent_path().string(), ec.message());
        return false;
    }
    return true;
}

bool TriggerMarker::consume() const {
    std::error_code ec;
    bool removed = fs::remove(path_, ec);
    if (ec) {
        std::println(stderr, "trigger: cannot remove {}: {}", path_.string(), ec.message());
        return false;
    }
    return removed;
}
