#include "storage.h"
#include "errors.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace gcm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

void writeJsonFile(const fs::path& path, const json& doc) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("Failed to create " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw StorageError("Failed to open " + path.string() + " for writing");
    }
    out << doc.dump(2) << "\n";
    if (!out) {
        throw StorageError("Failed to write " + path.string());
    }
}

json readJsonFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw StorageError("Failed to open " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw StorageError("Failed to parse " + path.string() + ": " + e.what());
    }
}

template <typename T>
T readRecord(const fs::path& path, const char* kind, const std::string& id) {
    if (!fs::exists(path)) {
        throw NotFoundError(kind, id);
    }
    json doc = readJsonFile(path);
    try {
        return doc.get<T>();
    } catch (const json::exception& e) {
        throw StorageError("Invalid " + std::string(kind) + " record " + path.string() + ": " + e.what());
    }
}

template <typename T>
std::vector<T> listRecords(const fs::path& dir, const char* kind) {
    std::vector<T> records;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return records;
    }

    std::vector<fs::path> paths;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            paths.push_back(entry.path());
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + dir.string() + ": " + ec.message());
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        try {
            records.push_back(readJsonFile(path).get<T>());
        } catch (const std::exception& e) {
            spdlog::warn("Skipping unreadable {} {}: {}", kind, path.string(), e.what());
        }
    }
    return records;
}

void removeRecord(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw StorageError("Failed to delete " + path.string() + ": " + ec.message());
    }
}

}  // namespace

Storage::Storage(fs::path root) : root_(std::move(root)) {}

void Storage::init() {
    for (const auto& dir : {extensionsDir(), profilesDir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw StorageError("Failed to create " + dir.string() + ": " + ec.message());
        }
    }
    spdlog::debug("Storage ready at {}", root_.string());
}

fs::path Storage::recordPath(const fs::path& dir, const std::string& id) const {
    if (id.empty() || id.find('/') != std::string::npos ||
        id.find('\\') != std::string::npos || id == "." || id == "..") {
        throw StorageError("Invalid record id: '" + id + "'");
    }
    return dir / (id + ".json");
}

void Storage::saveExtension(const Extension& extension) {
    writeJsonFile(recordPath(extensionsDir(), extension.id), json(extension));
    spdlog::info("Saved extension {} ({})", extension.id, extension.name);
}

Extension Storage::loadExtension(const std::string& id) const {
    return readRecord<Extension>(recordPath(extensionsDir(), id), "Extension", id);
}

std::vector<Extension> Storage::listExtensions() const {
    return listRecords<Extension>(extensionsDir(), "extension");
}

void Storage::deleteExtension(const std::string& id) {
    removeRecord(recordPath(extensionsDir(), id));
    spdlog::info("Deleted extension {}", id);
}

void Storage::saveProfile(const Profile& profile) {
    writeJsonFile(recordPath(profilesDir(), profile.id), json(profile));
    spdlog::info("Saved profile {} ({})", profile.id, profile.name);
}

Profile Storage::loadProfile(const std::string& id) const {
    return readRecord<Profile>(recordPath(profilesDir(), id), "Profile", id);
}

std::vector<Profile> Storage::listProfiles() const {
    return listRecords<Profile>(profilesDir(), "profile");
}

void Storage::deleteProfile(const std::string& id) {
    removeRecord(recordPath(profilesDir(), id));
    spdlog::info("Deleted profile {}", id);
}

std::optional<Profile> Storage::defaultProfile() const {
    for (auto& profile : listProfiles()) {
        if (profile.metadata.isDefault) return profile;
    }
    return std::nullopt;
}

void Storage::setDefaultProfile(const std::string& id) {
    // Make sure the target exists before touching the others
    Profile target = loadProfile(id);

    for (auto& profile : listProfiles()) {
        if (profile.id != id && profile.metadata.isDefault) {
            profile.metadata.isDefault = false;
            saveProfile(profile);
        }
    }
    target.metadata.isDefault = true;
    target.metadata.updatedAt = currentTimestamp();
    saveProfile(target);
}

}  // namespace gcm
