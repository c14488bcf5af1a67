#ifndef GCM_TUI_CONFIG_H
#define GCM_TUI_CONFIG_H

#include "action.h"
#include "event.h"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gcm {

using KeySequence = std::vector<KeyEvent>;
using KeyMap = std::map<KeySequence, Action>;

struct Config {
    std::filesystem::path dataDir;       // records, settings.json, log
    std::filesystem::path configDir;     // config.json
    std::filesystem::path workspaceDir;  // launch workspaces
    std::map<std::string, KeyMap> keybindings;  // mode -> keymap

    std::filesystem::path settingsFile() const { return dataDir / "settings.json"; }

    // Keymap for `mode`, empty when the mode is not configured
    const KeyMap& keymap(const std::string& mode) const;

    // Built-in "Normal" keymap
    static KeyMap defaultKeymap();
};

// Directory resolution:
//   data:      $GCM_DATA,      $XDG_DATA_HOME/gemini-cli-manager,   ~/.local/share/gemini-cli-manager
//   config:    $GCM_CONFIG,    $XDG_CONFIG_HOME/gemini-cli-manager, ~/.config/gemini-cli-manager
//   workspace: $GCM_WORKSPACE, ~/.gemini-workspace
std::filesystem::path defaultDataDir();
std::filesystem::path defaultConfigDir();
std::filesystem::path defaultWorkspaceDir();

// Expands a leading "~" using $HOME
std::filesystem::path expandHome(const std::string& path);

// Resolves directories and merges <configDir>/config.json over the
// default keymap. Throws ConfigError on malformed files or entries.
Config loadConfig();

// Same, for an explicit config file (missing file means defaults)
void mergeConfigFile(Config& config, const std::filesystem::path& file);

}  // namespace gcm

#endif  // GCM_TUI_CONFIG_H
