#include "config.h"
#include "core/errors.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace gcm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

const char* kAppDirName = "gemini-cli-manager";

std::string envOr(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    if (value && *value) return value;
    return fallback;
}

fs::path homeDir() {
    return fs::path(envOr("HOME", "."));
}

}  // namespace

const KeyMap& Config::keymap(const std::string& mode) const {
    static const KeyMap empty;
    auto it = keybindings.find(mode);
    return it != keybindings.end() ? it->second : empty;
}

KeyMap Config::defaultKeymap() {
    KeyMap keymap;
    keymap[{KeyEvent::character("q")}] = ActionType::Quit;
    keymap[{KeyEvent::ctrlChar('c')}] = ActionType::Quit;
    keymap[{KeyEvent::ctrlChar('d')}] = ActionType::Quit;
    keymap[{KeyEvent::ctrlChar('z')}] = ActionType::Suspend;
    keymap[{KeyEvent::character("?")}] = ActionType::Help;
    return keymap;
}

fs::path expandHome(const std::string& path) {
    if (path == "~") return homeDir();
    if (path.rfind("~/", 0) == 0) return homeDir() / path.substr(2);
    return fs::path(path);
}

fs::path defaultDataDir() {
    std::string dir = envOr("GCM_DATA");
    if (!dir.empty()) return expandHome(dir);
    std::string xdg = envOr("XDG_DATA_HOME");
    if (!xdg.empty()) return fs::path(xdg) / kAppDirName;
    return homeDir() / ".local" / "share" / kAppDirName;
}

fs::path defaultConfigDir() {
    std::string dir = envOr("GCM_CONFIG");
    if (!dir.empty()) return expandHome(dir);
    std::string xdg = envOr("XDG_CONFIG_HOME");
    if (!xdg.empty()) return fs::path(xdg) / kAppDirName;
    return homeDir() / ".config" / kAppDirName;
}

fs::path defaultWorkspaceDir() {
    std::string dir = envOr("GCM_WORKSPACE");
    if (!dir.empty()) return expandHome(dir);
    return homeDir() / ".gemini-workspace";
}

void mergeConfigFile(Config& config, const fs::path& file) {
    if (!fs::exists(file)) {
        return;
    }

    json doc;
    try {
        std::ifstream in(file);
        std::stringstream buffer;
        buffer << in.rdbuf();
        doc = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError("Failed to parse " + file.string() + ": " + e.what());
    }

    if (!doc.contains("keybindings")) return;
    const json& modes = doc.at("keybindings");
    if (!modes.is_object()) {
        throw ConfigError(file.string() + ": \"keybindings\" must be an object");
    }

    for (const auto& modeItem : modes.items()) {
        const std::string& mode = modeItem.key();
        const json& bindings = modeItem.value();
        if (!bindings.is_object()) {
            throw ConfigError(file.string() + ": keybindings." + mode + " must be an object");
        }
        KeyMap& keymap = config.keybindings[mode];
        for (const auto& binding : bindings.items()) {
            const std::string& sequence = binding.key();
            const json& actionName = binding.value();
            auto keys = parseKeySequence(sequence);
            if (!keys) {
                throw ConfigError(file.string() + ": invalid key sequence '" + sequence + "'");
            }
            if (!actionName.is_string()) {
                throw ConfigError(file.string() + ": action for '" + sequence + "' must be a string");
            }
            auto action = parseAction(actionName.get<std::string>());
            if (!action) {
                throw ConfigError(file.string() + ": unknown action '" +
                                  actionName.get<std::string>() + "'");
            }
            keymap[*keys] = *action;
        }
    }
    spdlog::info("Loaded config from {}", file.string());
}

Config loadConfig() {
    Config config;
    config.dataDir = defaultDataDir();
    config.configDir = defaultConfigDir();
    config.workspaceDir = defaultWorkspaceDir();
    config.keybindings["Normal"] = Config::defaultKeymap();
    mergeConfigFile(config, config.configDir / "config.json");
    return config;
}

}  // namespace gcm
