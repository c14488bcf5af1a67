#ifndef GCM_TUI_CORE_MODELS_H
#define GCM_TUI_CORE_MODELS_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gcm {

// One MCP server entry of an extension
struct McpServerConfig {
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::string> cwd;
    std::optional<std::map<std::string, std::string>> env;  // values may use $VAR
    std::optional<uint64_t> timeout;                         // milliseconds
    std::optional<bool> trust;

    bool operator==(const McpServerConfig&) const = default;
};

struct ExtensionMetadata {
    std::string importedAt;  // RFC 3339
    std::optional<std::string> sourcePath;
    std::vector<std::string> tags;

    bool operator==(const ExtensionMetadata&) const = default;
};

struct Extension {
    std::string id;
    std::string name;
    std::string version;
    std::optional<std::string> description;
    std::map<std::string, McpServerConfig> mcpServers;
    std::optional<std::string> contextFileName;
    std::optional<std::string> contextContent;
    ExtensionMetadata metadata;

    bool operator==(const Extension&) const = default;
};

struct LaunchConfig {
    bool cleanLaunch = false;
    bool cleanupOnExit = true;
    std::vector<std::string> preserveExtensions;

    bool operator==(const LaunchConfig&) const = default;
};

struct ProfileMetadata {
    std::string createdAt;
    std::string updatedAt;
    std::vector<std::string> tags;
    bool isDefault = false;
    std::optional<std::string> icon;

    bool operator==(const ProfileMetadata&) const = default;
};

struct Profile {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::vector<std::string> extensionIds;
    std::map<std::string, std::string> environmentVariables;
    std::optional<std::string> workingDirectory;
    LaunchConfig launchConfig;
    ProfileMetadata metadata;

    // "<icon> <name>" when an icon is set
    std::string displayName() const;
    // "2 extensions, 1 env var"
    std::string summary() const;
    bool referencesExtension(const std::string& extensionId) const;

    bool operator==(const Profile&) const = default;
};

void to_json(nlohmann::json& j, const McpServerConfig& s);
void from_json(const nlohmann::json& j, McpServerConfig& s);
void to_json(nlohmann::json& j, const Extension& e);
void from_json(const nlohmann::json& j, Extension& e);
void to_json(nlohmann::json& j, const LaunchConfig& c);
void from_json(const nlohmann::json& j, LaunchConfig& c);
void to_json(nlohmann::json& j, const Profile& p);
void from_json(const nlohmann::json& j, Profile& p);

// Random RFC 4122 version 4 id
std::string generateId();

// "My Profile!" -> "my-profile"
std::string slugify(const std::string& name);

// Current UTC time as RFC 3339, e.g. "2024-05-01T12:30:00Z"
std::string currentTimestamp();

// "a, b ,c" -> {"a", "b", "c"}; empty items dropped
std::vector<std::string> splitList(const std::string& text, char sep = ',');

std::string joinList(const std::vector<std::string>& items, const std::string& sep = ", ");

// "KEY=VALUE, K2=V2" -> map; items without a key are dropped.
// Values keep everything after the first '='.
std::map<std::string, std::string> parseKeyValueList(const std::string& text);
std::string formatKeyValueList(const std::map<std::string, std::string>& values);

}  // namespace gcm

#endif  // GCM_TUI_CORE_MODELS_H
