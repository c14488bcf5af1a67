#ifndef GCM_TUI_CORE_STORAGE_H
#define GCM_TUI_CORE_STORAGE_H

#include "models.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gcm {

// JSON file store for extensions and profiles:
//   <root>/extensions/<id>.json
//   <root>/profiles/<id>.json
// Every save overwrites the whole record file.
class Storage {
public:
    explicit Storage(std::filesystem::path root);

    // Create the record directories. Throws StorageError.
    void init();

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path extensionsDir() const { return root_ / "extensions"; }
    std::filesystem::path profilesDir() const { return root_ / "profiles"; }

    void saveExtension(const Extension& extension);
    Extension loadExtension(const std::string& id) const;
    // Sorted by file name. Unreadable records are skipped with a warning.
    std::vector<Extension> listExtensions() const;
    // Deleting a missing record is not an error
    void deleteExtension(const std::string& id);

    void saveProfile(const Profile& profile);
    Profile loadProfile(const std::string& id) const;
    std::vector<Profile> listProfiles() const;
    void deleteProfile(const std::string& id);

    std::optional<Profile> defaultProfile() const;
    // Marks `id` as the only default profile. Throws NotFoundError.
    void setDefaultProfile(const std::string& id);

private:
    std::filesystem::path recordPath(const std::filesystem::path& dir, const std::string& id) const;

    std::filesystem::path root_;
};

}  // namespace gcm

#endif  // GCM_TUI_CORE_STORAGE_H
