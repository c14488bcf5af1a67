#ifndef GCM_TUI_CORE_LAUNCHER_H
#define GCM_TUI_CORE_LAUNCHER_H

#include "storage.h"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gcm {

using Environment = std::map<std::string, std::string>;

// Runs the Gemini CLI for a profile. Blocks until the child exits.
class ProfileLauncher {
public:
    virtual ~ProfileLauncher() = default;

    // Throws LaunchError (and StorageError while installing extensions)
    virtual void launch(const Profile& profile) = 0;
};

// Launch sequence:
//   1. <workspace>/<profile id>/.gemini/extensions is created (emptied
//      first with clean_launch, except preserved extensions)
//   2. every referenced extension is written there as
//      <id>/gemini-extension.json plus its context file
//   3. gemini runs in the foreground with the profile's environment and
//      working directory
//   4. with cleanup_on_exit the extensions directory is removed again
class GeminiLauncher : public ProfileLauncher {
public:
    GeminiLauncher(std::shared_ptr<Storage> storage, std::filesystem::path workspaceDir,
                   std::string program = "gemini");

    void launch(const Profile& profile) override;

    std::filesystem::path workspaceFor(const Profile& profile) const;
    std::filesystem::path extensionsDirFor(const Profile& profile) const;

    // Steps 1 and 2. Returns the ids that were installed; missing
    // extensions are skipped with a warning.
    std::filesystem::path prepareWorkspace(const Profile& profile) const;
    std::vector<std::string> installExtensions(const Profile& profile,
                                               const std::filesystem::path& extensionsDir) const;

    // `base` plus the profile variables ("$VAR" and "${VAR}" values are
    // looked up in `base`, kept literally when unset), GEMINI_PROFILE and
    // GEMINI_EXTENSIONS_DIR
    Environment buildEnvironment(const Profile& profile, const std::filesystem::path& extensionsDir,
                                 const Environment& base) const;

    // Profile directory with "~" expanded (created when missing), or the
    // current directory
    std::filesystem::path resolveWorkingDirectory(const Profile& profile) const;

    // Shell script that exports the profile's variables and runs gemini
    void createLaunchScript(const Profile& profile, const std::filesystem::path& output) const;

    static Environment processEnvironment();

    // First executable `name` in the ':' separated `searchPath`
    static std::optional<std::filesystem::path> findExecutable(const std::string& name,
                                                               const std::string& searchPath);

private:
    int run(const std::filesystem::path& executable, const std::filesystem::path& workingDir,
            const Environment& env) const;

    std::shared_ptr<Storage> storage_;
    std::filesystem::path workspaceDir_;
    std::string program_;
};

}  // namespace gcm

#endif  // GCM_TUI_CORE_LAUNCHER_H
