#include "models.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>

namespace gcm {

using nlohmann::json;

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    if (!value) return nullptr;
    return json(*value);
}

template <typename T>
void optionalFromJson(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->get<T>();
}

std::string pluralize(size_t n, const std::string& word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // namespace

void to_json(json& j, const McpServerConfig& s) {
    j = json{
        {"command", optionalToJson(s.command)},
        {"args", optionalToJson(s.args)},
        {"cwd", optionalToJson(s.cwd)},
        {"env", optionalToJson(s.env)},
        {"timeout", optionalToJson(s.timeout)},
        {"trust", optionalToJson(s.trust)},
    };
}

void from_json(const json& j, McpServerConfig& s) {
    optionalFromJson(j, "command", s.command);
    optionalFromJson(j, "args", s.args);
    optionalFromJson(j, "cwd", s.cwd);
    optionalFromJson(j, "env", s.env);
    optionalFromJson(j, "timeout", s.timeout);
    optionalFromJson(j, "trust", s.trust);
}

void to_json(json& j, const Extension& e) {
    j = json{
        {"id", e.id},
        {"name", e.name},
        {"version", e.version},
        {"description", optionalToJson(e.description)},
        {"mcp_servers", e.mcpServers},
        {"context_file_name", optionalToJson(e.contextFileName)},
        {"context_content", optionalToJson(e.contextContent)},
        {"metadata", {
            {"imported_at", e.metadata.importedAt},
            {"source_path", optionalToJson(e.metadata.sourcePath)},
            {"tags", e.metadata.tags},
        }},
    };
}

void from_json(const json& j, Extension& e) {
    j.at("id").get_to(e.id);
    j.at("name").get_to(e.name);
    j.at("version").get_to(e.version);
    optionalFromJson(j, "description", e.description);
    e.mcpServers.clear();
    if (j.contains("mcp_servers") && !j.at("mcp_servers").is_null()) {
        j.at("mcp_servers").get_to(e.mcpServers);
    }
    optionalFromJson(j, "context_file_name", e.contextFileName);
    optionalFromJson(j, "context_content", e.contextContent);

    const json& meta = j.at("metadata");
    meta.at("imported_at").get_to(e.metadata.importedAt);
    optionalFromJson(meta, "source_path", e.metadata.sourcePath);
    e.metadata.tags = meta.value("tags", std::vector<std::string>{});
}

void to_json(json& j, const LaunchConfig& c) {
    j = json{
        {"clean_launch", c.cleanLaunch},
        {"cleanup_on_exit", c.cleanupOnExit},
        {"preserve_extensions", c.preserveExtensions},
    };
}

void from_json(const json& j, LaunchConfig& c) {
    LaunchConfig defaults;
    c.cleanLaunch = j.value("clean_launch", defaults.cleanLaunch);
    c.cleanupOnExit = j.value("cleanup_on_exit", defaults.cleanupOnExit);
    c.preserveExtensions = j.value("preserve_extensions", defaults.preserveExtensions);
}

void to_json(json& j, const Profile& p) {
    j = json{
        {"id", p.id},
        {"name", p.name},
        {"description", optionalToJson(p.description)},
        {"extension_ids", p.extensionIds},
        {"environment_variables", p.environmentVariables},
        {"working_directory", optionalToJson(p.workingDirectory)},
        {"launch_config", p.launchConfig},
        {"metadata", {
            {"created_at", p.metadata.createdAt},
            {"updated_at", p.metadata.updatedAt},
            {"tags", p.metadata.tags},
            {"is_default", p.metadata.isDefault},
            {"icon", optionalToJson(p.metadata.icon)},
        }},
    };
}

void from_json(const json& j, Profile& p) {
    j.at("id").get_to(p.id);
    j.at("name").get_to(p.name);
    optionalFromJson(j, "description", p.description);
    p.extensionIds = j.value("extension_ids", std::vector<std::string>{});
    p.environmentVariables = j.value("environment_variables", std::map<std::string, std::string>{});
    optionalFromJson(j, "working_directory", p.workingDirectory);
    if (j.contains("launch_config") && !j.at("launch_config").is_null()) {
        j.at("launch_config").get_to(p.launchConfig);
    } else {
        p.launchConfig = LaunchConfig{};
    }

    const json& meta = j.at("metadata");
    meta.at("created_at").get_to(p.metadata.createdAt);
    meta.at("updated_at").get_to(p.metadata.updatedAt);
    p.metadata.tags = meta.value("tags", std::vector<std::string>{});
    p.metadata.isDefault = meta.value("is_default", false);
    optionalFromJson(meta, "icon", p.metadata.icon);
}

std::string Profile::displayName() const {
    if (metadata.icon) {
        return *metadata.icon + " " + name;
    }
    return name;
}

std::string Profile::summary() const {
    return pluralize(extensionIds.size(), "extension") + ", " +
           pluralize(environmentVariables.size(), "env var");
}

bool Profile::referencesExtension(const std::string& extensionId) const {
    for (const auto& id : extensionIds) {
        if (id == extensionId) return true;
    }
    return false;
}

std::string generateId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

std::string slugify(const std::string& name) {
    std::string slug;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            slug += static_cast<char>(std::tolower(c));
        } else if (c == ' ' || c == '-' || c == '_' || c == '.') {
            if (!slug.empty() && slug.back() != '-') slug += '-';
        }
    }
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
    return slug;
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::vector<std::string> splitList(const std::string& text, char sep) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(sep, start);
        if (end == std::string::npos) end = text.size();
        std::string item = trim(text.substr(start, end - start));
        if (!item.empty()) items.push_back(item);
        start = end + 1;
    }
    return items;
}

std::string joinList(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::map<std::string, std::string> parseKeyValueList(const std::string& text) {
    std::map<std::string, std::string> values;
    for (const auto& item : splitList(text)) {
        auto eq = item.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(item.substr(0, eq));
        if (key.empty()) continue;
        values[key] = item.substr(eq + 1);
    }
    return values;
}

std::string formatKeyValueList(const std::map<std::string, std::string>& values) {
    std::vector<std::string> items;
    for (const auto& [key, value] : values) items.push_back(key + "=" + value);
    return joinList(items);
}

}  // namespace gcm
