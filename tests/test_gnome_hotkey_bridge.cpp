#include <catch2/catch_test_macros.hpp>

#include "platform/linux/gnome_hotkey_bridge.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace {

constexpr const char* kList = "org.gnome.settings-daemon.plugins.media-keys";

// Keeps gsettings state in memory and can fail a chosen call.
struct FakeGsettings {
    std::string list = "@as []";
    std::map<std::string, std::string> keys;
    std::string fail_on;
    ScriptedRunner runner;

    FakeGsettings() {
        runner.handler = [this](const ScriptedRunner::Call& c) {
            ProcessResult r;
            r.exit_code = 0;
            const auto& a = c.argv;
            std::string joined;
            for (auto& s : a) joined += s + " ";
            if (!fail_on.empty() && joined.find(fail_on) != std::string::npos) {
                r.exit_code = 1;
                r.err = "No such schema";
                return r;
            }
            if (a[1] == "get" && a[2] == kList) {
                r.out = list + "\n";
            } else if (a[1] == "set" && a[2] == kList) {
                list = a[4];
            } else if (a[1] == "set") {
                keys[a[2] + " " + a[3]] = a[4];
            } else if (a[1] == "reset-recursively") {
                std::erase_if(keys, [&](const auto& kv) { return kv.first.starts_with(a[2]); });
            }
            return r;
        };
    }
};

} // namespace

TEST_CASE("GnomeHotkeyBridge accelerators", "[hotkeys]") {

    SECTION("ModifiersAndLetter") {
        REQUIRE(GnomeHotkeyBridge::to_accelerator("Ctrl+Shift+R") == "<Control><Shift>r");
        REQUIRE(GnomeHotkeyBridge::to_accelerator("control+alt+v") == "<Control><Alt>v");
        REQUIRE(GnomeHotkeyBridge::to_accelerator("Super+Space") == "<Super>space");
        REQUIRE(GnomeHotkeyBridge::to_accelerator("Meta+F5") == "<Super>F5");
        REQUIRE(GnomeHotkeyBridge::to_accelerator("Win+PageUp") == "<Super>Page_Up");
    }

    SECTION("SpacesAroundParts") {
        REQUIRE(GnomeHotkeyBridge::to_accelerator(" Ctrl + r ") == "<Control>r");
    }

    SECTION("BareKey") {
        REQUIRE(GnomeHotkeyBridge::to_accelerator("F12") == "F12");
        REQUIRE(GnomeHotkeyBridge::to_accelerator("Esc") == "Escape");
    }

    SECTION("PlusKey") {
        REQUIRE(GnomeHotkeyBridge::to_accelerator("Ctrl++") == "<Control>plus");
    }

    SECTION("Invalid") {
        REQUIRE_FALSE(GnomeHotkeyBridge::to_accelerator(""));
        REQUIRE_FALSE(GnomeHotkeyBridge::to_accelerator("Ctrl+"));
        REQUIRE_FALSE(GnomeHotkeyBridge::to_accelerator("Ctrl+Shift"));
        REQUIRE_FALSE(GnomeHotkeyBridge::to_accelerator("Hyper+R"));
        REQUIRE_FALSE(GnomeHotkeyBridge::to_accelerator("Ctrl+no way"));
    }
}

TEST_CASE("GnomeHotkeyBridge path lists", "[hotkeys]") {

    SECTION("Parse") {
        REQUIRE(GnomeHotkeyBridge::parse_path_list("@as []\n") == std::vector<std::string>{});
        REQUIRE(GnomeHotkeyBridge::parse_path_list("['/a/', '/b/']\n") ==
                std::vector<std::string>{"/a/", "/b/"});
        REQUIRE(GnomeHotkeyBridge::parse_path_list("[\"/x/\"]") == std::vector<std::string>{"/x/"});
        REQUIRE(GnomeHotkeyBridge::parse_path_list(R"(['it\'s'])") ==
                std::vector<std::string>{"it's"});
    }

    SECTION("ParseRejectsGarbage") {
        REQUIRE_FALSE(GnomeHotkeyBridge::parse_path_list("No such key"));
        REQUIRE_FALSE(GnomeHotkeyBridge::parse_path_list("['/a/'"));
        REQUIRE_FALSE(GnomeHotkeyBridge::parse_path_list("[/a/]"));
    }

    SECTION("FormatQuotes") {
        REQUIRE(GnomeHotkeyBridge::format_path_list({}) == "[]");
        REQUIRE(GnomeHotkeyBridge::format_path_list({"/a/", "/b/"}) == "['/a/', '/b/']");
        REQUIRE(GnomeHotkeyBridge::quote("it's") == R"('it\'s')");
    }

    SECTION("OwnPaths") {
        auto p = GnomeHotkeyBridge::binding_path(0);
        REQUIRE(p == "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings/voice-transcribe0/");
        REQUIRE(GnomeHotkeyBridge::is_own_path(p));
        REQUIRE_FALSE(GnomeHotkeyBridge::is_own_path(
            "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings/custom0/"));
        REQUIRE(GnomeHotkeyBridge::is_own_path(GnomeHotkeyBridge::binding_path(12)));
        REQUIRE_FALSE(GnomeHotkeyBridge::is_own_path(
            "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings/voice-transcribe-extra/"));
        REQUIRE_FALSE(GnomeHotkeyBridge::is_own_path(
            "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings/voice-transcribe/"));
    }
}

TEST_CASE("GnomeHotkeyBridge registration", "[hotkeys]") {
    FakeGsettings gs;
    const std::string other = "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings/custom0/";
    gs.list = "['" + other + "']";
    GnomeHotkeyBridge bridge(gs.runner, "/home/u/.config/voice-transcribe/toggle.trigger");

    SECTION("RegisterAppendsAndSetsKeys") {
        REQUIRE(bridge.register_hotkeys({"Ctrl+Shift+R", "F9"}));

        auto paths = GnomeHotkeyBridge::parse_path_list(gs.list);
        REQUIRE(paths);
        REQUIRE(paths->size() == 3);
        REQUIRE(paths->front() == other);

        auto schema = std::string(kList) + ".custom-keybinding:" + GnomeHotkeyBridge::binding_path(0);
        REQUIRE(gs.keys[schema + " binding"] == "'<Control><Shift>r'");
        REQUIRE(gs.keys[schema + " command"] ==
                "'touch \\'/home/u/.config/voice-transcribe/toggle.trigger\\''");
    }

    SECTION("ReRegisterReplacesOwnEntries") {
        REQUIRE(bridge.register_hotkeys({"Ctrl+Shift+R", "F9"}));
        REQUIRE(bridge.register_hotkeys({"F10"}));

        auto paths = GnomeHotkeyBridge::parse_path_list(gs.list);
        REQUIRE(paths == std::vector<std::string>{other, GnomeHotkeyBridge::binding_path(0)});
    }

    SECTION("InvalidComboInstallsNothing") {
        REQUIRE_FALSE(bridge.register_hotkeys({"Ctrl+Shift+R", "Hyper+X"}));
        REQUIRE(GnomeHotkeyBridge::parse_path_list(gs.list) == std::vector<std::string>{other});
        REQUIRE(gs.keys.empty());
    }

    SECTION("InvalidComboRemovesEarlierBindings") {
        REQUIRE(bridge.register_hotkeys({"Ctrl+Shift+R"}));
        REQUIRE_FALSE(bridge.register_hotkeys({"Ctrl+Foo+"}));

        REQUIRE(GnomeHotkeyBridge::parse_path_list(gs.list) == std::vector<std::string>{other});
        REQUIRE(gs.keys.empty());
    }

    SECTION("EmptyListRemovesEarlierBindings") {
        REQUIRE(bridge.register_hotkeys({"F9"}));
        REQUIRE_FALSE(bridge.register_hotkeys({}));

        REQUIRE(GnomeHotkeyBridge::parse_path_list(gs.list) == std::vector<std::string>{other});
        REQUIRE(gs.keys.empty());
    }

    SECTION("FailureRollsBack") {
        gs.fail_on = " binding '<Super>";
        REQUIRE_FALSE(bridge.register_hotkeys({"Ctrl+Shift+R", "Super+V"}));

        REQUIRE(GnomeHotkeyBridge::parse_path_list(gs.list) == std::vector<std::string>{other});
        REQUIRE(gs.keys.empty());
    }

    SECTION("UnreadableListFails") {
        gs.list = "garbage";
        REQUIRE_FALSE(bridge.register_hotkeys({"F9"}));
    }

    SECTION("SimilarForeignPathSurvives") {
        const std::string similar =
            "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings/voice-transcribe-extra/";
        gs.list = "['" + other + "', '" + similar + "']";
        REQUIRE(bridge.register_hotkeys({"F9"}));
        bridge.unregister();

        REQUIRE(GnomeHotkeyBridge::parse_path_list(gs.list) == std::vector<std::string>{other, similar});
    }

    SECTION("UnregisterKeepsForeignBindings") {
        REQUIRE(bridge.register_hotkeys({"F9"}));
        bridge.unregister();

        REQUIRE(GnomeHotkeyBridge::parse_path_list(gs.list) == std::vector<std::string>{other});
        REQUIRE(gs.keys.empty());
    }
}
