#pragma once

#include <string>
#include <vector>

// Global key bindings owned by the desktop environment. A pressed binding
// creates the trigger marker; the daemon never sees the key event itself.
class HotkeyBridge {
public:
    virtual ~HotkeyBridge() = default;
    // Replaces any bindings installed earlier. On failure nothing stays installed.
    virtual bool register_hotkeys(const std::vector<std::string>& combos) = 0;
    virtual void unregister() = 0;
};
