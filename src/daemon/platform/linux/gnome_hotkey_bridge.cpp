#include "platform/linux/gnome_hotkey_bridge.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <print>
#include <string_view>
#include <utility>

namespace {

constexpr const char* kListSchema = "org.gnome.settings-daemon.plugins.media-keys";
constexpr const char* kListKey = "custom-keybindings";
constexpr const char* kBindingSchema = "org.gnome.settings-daemon.plugins.media-keys.custom-keybinding";
constexpr std::string_view kBasePath = "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings/";
constexpr std::string_view kOwnPrefix = "voice-transcribe";

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

// Quoting understood by g_shell_parse_argv, which GNOME uses for the command.
std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::optional<std::string> key_name(const std::string& key) {
    if (key.size() == 1) {
        unsigned char c = static_cast<unsigned char>(key[0]);
        if (!std::isgraph(c)) return std::nullopt;
        return std::string(1, static_cast<char>(std::tolower(c)));
    }

    auto k = lower(key);
    if (k.size() >= 2 && k[0] == 'f' &&
        std::all_of(k.begin() + 1, k.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return "F" + k.substr(1);
    }

    static const std::pair<std::string_view, std::string_view> named[] = {
        {"space", "space"}, {"enter", "Return"}, {"return", "Return"},
        {"tab", "Tab"}, {"esc", "Escape"}, {"escape", "Escape"},
        {"backspace", "BackSpace"}, {"delete", "Delete"}, {"del", "Delete"},
        {"insert", "Insert"}, {"home", "Home"}, {"end", "End"},
        {"pageup", "Page_Up"}, {"pagedown", "Page_Down"}, {"print", "Print"},
        {"up", "Up"}, {"down", "Down"}, {"left", "Left"}, {"right", "Right"},
        {"pause", "Pause"},
    };
    for (auto& [from, to] : named) {
        if (k == from) return std::string(to);
    }

    // Anything else must at least look like an X keysym name.
    bool keysym = std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
    if (keysym) return key;
    return std::nullopt;
}

} // namespace

GnomeHotkeyBridge::GnomeHotkeyBridge(ProcessRunner& runner, std::string trigger_path)
    : runner_(runner), trigger_path_(std::move(trigger_path)) {}

std::optional<std::string> GnomeHotkeyBridge::to_accelerator(const std::string& combo) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto plus = combo.find('+', start);
        auto part = trim(combo.substr(start, plus == std::string::npos ? std::string::npos : plus - start));
        // "Ctrl++" names the plus key itself.
        if (part.empty() && plus != std::string::npos && plus + 1 == combo.size()) {
            parts.push_back("plus");
            break;
        }
        if (part.empty()) return std::nullopt;
        parts.push_back(part);
        if (plus == std::string::npos) break;
        start = plus + 1;
    }

    std::string accel;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto m = lower(parts[i]);
        if (m == "ctrl" || m == "control") accel += "<Control>";
        else if (m == "shift") accel += "<Shift>";
        else if (m == "alt") accel += "<Alt>";
        else if (m == "super" || m == "meta" || m == "win") accel += "<Super>";
        else return std::nullopt;
    }

    auto key = lower(parts.back());
    if (key == "ctrl" || key == "control" || key == "shift" || key == "alt" ||
        key == "super" || key == "meta" || key == "win") {
        return std::nullopt;
    }
    auto name = key_name(parts.back());
    if (!name) return std::nullopt;
    return accel + *name;
}

std::optional<std::vector<std::string>> GnomeHotkeyBridge::parse_path_list(const std::string& text) {
    auto s = trim(text);
    if (s.starts_with("@as")) s = trim(s.substr(3));
    if (s.size() < 2 || s.front() != '[' || s.back() != ']') return std::nullopt;

    std::vector<std::string> out;
    size_t i = 1;
    const size_t end = s.size() - 1;
    while (i < end) {
        char c = s[i];
        if (c == ' ' || c == ',') {
            ++i;
            continue;
        }
        if (c != '\'' && c != '"') return std::nullopt;

        char q = c;
        std::string item;
        ++i;
        while (i < end && s[i] != q) {
            if (s[i] == '\\' && i + 1 < end) ++i;
            item += s[i++];
        }
        if (i >= end) return std::nullopt;
        ++i;
        out.push_back(std::move(item));
    }
    return out;
}

std::string GnomeHotkeyBridge::format_path_list(const std::vector<std::string>& paths) {
    std::string out = "[";
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote(paths[i]);
    }
    out += "]";
    return out;
}

std::string GnomeHotkeyBridge::quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string GnomeHotkeyBridge::binding_path(size_t index) {
    return std::format("{}{}{}/", kBasePath, kOwnPrefix, index);
}

// Only voice-transcribe<N>/ is ours, not every path sharing the prefix.
bool GnomeHotkeyBridge::is_own_path(const std::string& path) {
    std::string_view p = path;
    if (!p.starts_with(kBasePath)) return false;
    p.remove_prefix(kBasePath.size());
    if (!p.starts_with(kOwnPrefix)) return false;
    p.remove_prefix(kOwnPrefix.size());
    if (p.size() < 2 || p.back() != '/') return false;
    p.remove_suffix(1);
    return std::all_of(p.begin(), p.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool GnomeHotkeyBridge::register_hotkeys(const std::vector<std::string>& combos) {
    if (combos.empty()) {
        std::println(stderr, "hotkeys: no key combinations configured");
        unregister();
        return false;
    }

    std::vector<std::string> accels;
    for (const auto& combo : combos) {
        auto accel = to_accelerator(combo);
        if (!accel) {
            std::println(stderr, "hotkeys: cannot use key combination '{}'", combo);
            unregister();
            return false;
        }
        accels.push_back(*accel);
    }

    auto current = read_paths();
    if (!current) return false;

    std::vector<std::string> others;
    for (const auto& p : *current) {
        if (is_own_path(p)) reset_binding(p);
        else others.push_back(p);
    }

    const auto command = "touch " + shell_quote(trigger_path_);
    std::vector<std::string> installed;
    bool ok = true;
    for (size_t i = 0; i < accels.size() && ok; ++i) {
        auto path = binding_path(i);
        installed.push_back(path);
        ok = set_binding_key(path, "name", quote("Voice Transcribe (" + combos[i] + ")")) &&
             set_binding_key(path, "command", quote(command)) &&
             set_binding_key(path, "binding", quote(accels[i]));
    }

    if (ok) {
        auto all = others;
        all.insert(all.end(), installed.begin(), installed.end());
        ok = write_paths(all);
    }

    if (!ok) {
        for (const auto& p : installed) reset_binding(p);
        if (!write_paths(others)) {
            std::println(stderr, "hotkeys: could not restore the custom keybinding list");
        }
        return false;
    }
    return true;
}

void GnomeHotkeyBridge::unregister() {
    auto current = read_paths();
    if (!current) return;

    std::vector<std::string> others;
    bool had_own = false;
    for (const auto& p : *current) {
        if (is_own_path(p)) {
            reset_binding(p);
            had_own = true;
        } else {
            others.push_back(p);
        }
    }

    if (had_own && !write_paths(others)) {
        std::println(stderr, "hotkeys: could not remove bindings from the keybinding list");
    }
}

std::optional<std::vector<std::string>> GnomeHotkeyBridge::read_paths() {
    std::string out;
    if (!gsettings({"get", kListSchema, kListKey}, &out)) return std::nullopt;

    auto paths = parse_path_list(out);
    if (!paths) {
        std::println(stderr, "hotkeys: unexpected {} value: {}", kListKey, trim(out));
    }
    return paths;
}

bool GnomeHotkeyBridge::write_paths(const std::vector<std::string>& paths) {
    return gsettings({"set", kListSchema, kListKey, format_path_list(paths)});
}

bool GnomeHotkeyBridge::set_binding_key(const std::string& path, const std::string& key,
                                        const std::string& value) {
    return gsettings({"set", std::string(kBindingSchema) + ":" + path, key, value});
}

void GnomeHotkeyBridge::reset_binding(const std::string& path) {
    gsettings({"reset-recursively", std::string(kBindingSchema) + ":" + path});
}

bool GnomeHotkeyBridge::gsettings(const std::vector<std::string>& args, std::string* out) {
    std::vector<std::string> argv = {"gsettings"};
    argv.insert(argv.end(), args.begin(), args.end());

    auto res = runner_.run(argv, {}, std::chrono::seconds(5));
    if (!res) {
        std::println(stderr, "hotkeys: {}", res.error());
        return false;
    }
    if (!res->ok()) {
        std::println(stderr, "hotkeys: gsettings {} failed: {}", args.front(), trim(res->err));
        return false;
    }
    if (out) *out = std::move(res->out);
    return true;
}
