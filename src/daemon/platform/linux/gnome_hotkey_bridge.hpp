#pragma once

#include "platform/hotkey_bridge.hpp"
#include "platform/process_runner.hpp"

#include <optional>
#include <string>
#include <vector>

// GNOME custom keybindings, written with the gsettings tool. Each binding runs
// `touch <trigger>`.
class GnomeHotkeyBridge : public HotkeyBridge {
public:
    GnomeHotkeyBridge(ProcessRunner& runner, std::string trigger_path);

    bool register_hotkeys(const std::vector<std::string>& combos) override;
    void unregister() override;

    // "Ctrl+Shift+R" -> "<Control><Shift>r". nullopt for unusable combinations.
    static std::optional<std::string> to_accelerator(const std::string& combo);

    // GVariant "as" text as printed by `gsettings get`.
    static std::optional<std::vector<std::string>> parse_path_list(const std::string& text);
    static std::string format_path_list(const std::vector<std::string>& paths);
    static std::string quote(const std::string& s);

    static std::string binding_path(size_t index);
    static bool is_own_path(const std::string& path);

private:
    std::optional<std::vector<std::string>> read_paths();
    bool write_paths(const std::vector<std::string>& paths);
    bool set_binding_key(const std::string& path, const std::string& key, const std::string& value);
    void reset_binding(const std::string& path);
    bool gsettings(const std::vector<std::string>& args, std::string* out = nullptr);

    ProcessRunner& runner_;
    std::string trigger_path_;
};
