#include "core/errors.h"
#include "core/launcher.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sys/stat.h>

using namespace gcm;
using namespace gcm::test;
using nlohmann::json;

namespace {

struct LauncherFixture : ::testing::Test {
    TempDir dir;
    std::shared_ptr<Storage> storage = makeStorage(dir);
    GeminiLauncher launcher{storage, dir / "workspace"};

    void SetUp() override {
        Extension ext = makeExtension("files", "File Tools");
        McpServerConfig server;
        server.command = "node";
        server.args = std::vector<std::string>{"index.js"};
        ext.mcpServers["fs"] = server;
        ext.contextContent = "Use the fs server.";
        storage->saveExtension(ext);
    }
};

}  // namespace

TEST_F(LauncherFixture, WorkspaceLayout) {
    Profile profile = makeProfile("dev", "Dev");
    EXPECT_EQ(launcher.workspaceFor(profile), dir / "workspace" / "dev");
    EXPECT_EQ(launcher.extensionsDirFor(profile), dir / "workspace" / "dev" / ".gemini" / "extensions");
}

TEST_F(LauncherFixture, InstallsReferencedExtensions) {
    Profile profile = makeProfile("dev", "Dev", {"files", "ghost"});
    auto extDir = launcher.prepareWorkspace(profile);

    auto manifestPath = extDir / "files" / "gemini-extension.json";
    ASSERT_TRUE(std::filesystem::exists(manifestPath));
    json manifest = json::parse(readFile(manifestPath));
    EXPECT_EQ(manifest["name"], "File Tools");
    EXPECT_EQ(manifest["version"], "1.0.0");
    EXPECT_EQ(manifest["contextFileName"], "GEMINI.md");
    EXPECT_EQ(manifest["mcpServers"]["fs"]["command"], "node");
    // unset optional fields are left out
    EXPECT_FALSE(manifest["mcpServers"]["fs"].contains("cwd"));

    EXPECT_EQ(readFile(extDir / "files" / "GEMINI.md"), "Use the fs server.");
    EXPECT_FALSE(std::filesystem::exists(extDir / "ghost"));
}

TEST_F(LauncherFixture, CleanLaunchKeepsPreservedEntries) {
    Profile profile = makeProfile("dev", "Dev", {"files"});
    auto extDir = launcher.extensionsDirFor(profile);
    writeFile(extDir / "stale" / "gemini-extension.json", "{}");
    writeFile(extDir / "pinned" / "gemini-extension.json", "{}");

    profile.launchConfig.cleanLaunch = true;
    profile.launchConfig.preserveExtensions = {"pinned"};
    launcher.prepareWorkspace(profile);

    EXPECT_FALSE(std::filesystem::exists(extDir / "stale"));
    EXPECT_TRUE(std::filesystem::exists(extDir / "pinned"));
    EXPECT_TRUE(std::filesystem::exists(extDir / "files"));
}

TEST_F(LauncherFixture, WithoutCleanLaunchOldEntriesStay) {
    Profile profile = makeProfile("dev", "Dev");
    auto extDir = launcher.extensionsDirFor(profile);
    writeFile(extDir / "stale" / "gemini-extension.json", "{}");
    launcher.prepareWorkspace(profile);
    EXPECT_TRUE(std::filesystem::exists(extDir / "stale"));
}

TEST_F(LauncherFixture, EnvironmentExpandsReferences) {
    Profile profile = makeProfile("dev", "Dev");
    profile.environmentVariables = {
        {"PLAIN", "value"},
        {"FROM_HOME", "$HOME"},
        {"BRACED", "${USER}"},
        {"UNSET", "$NOT_DEFINED_ANYWHERE"},
    };
    Environment base = {{"HOME", "/home/me"}, {"USER", "me"}, {"PATH", "/bin"}};

    Environment env = launcher.buildEnvironment(profile, "/ws/ext", base);
    EXPECT_EQ(env["PLAIN"], "value");
    EXPECT_EQ(env["FROM_HOME"], "/home/me");
    EXPECT_EQ(env["BRACED"], "me");
    EXPECT_EQ(env["UNSET"], "$NOT_DEFINED_ANYWHERE");
    EXPECT_EQ(env["PATH"], "/bin");
    EXPECT_EQ(env["GEMINI_PROFILE"], "dev");
    EXPECT_EQ(env["GEMINI_EXTENSIONS_DIR"], "/ws/ext");
}

TEST_F(LauncherFixture, WorkingDirectoryIsCreated) {
    Profile profile = makeProfile("dev", "Dev");
    EXPECT_EQ(launcher.resolveWorkingDirectory(profile), std::filesystem::current_path());

    profile.workingDirectory = (dir / "project").string();
    EXPECT_EQ(launcher.resolveWorkingDirectory(profile), dir / "project");
    EXPECT_TRUE(std::filesystem::is_directory(dir / "project"));
}

TEST_F(LauncherFixture, FindsExecutablesOnSearchPath) {
    writeFile(dir / "bin" / "gemini", "#!/bin/sh\n");
    std::filesystem::permissions(dir / "bin" / "gemini", std::filesystem::perms::owner_all);
    writeFile(dir / "other" / "gemini", "not executable");

    std::string searchPath = (dir / "other").string() + ":" + (dir / "bin").string();
    auto found = GeminiLauncher::findExecutable("gemini", searchPath);
    ASSERT_TRUE(found);
    EXPECT_EQ(*found, dir / "bin" / "gemini");

    EXPECT_FALSE(GeminiLauncher::findExecutable("gemini", (dir / "other").string()));
    EXPECT_FALSE(GeminiLauncher::findExecutable("gemini", ""));
}

TEST_F(LauncherFixture, MissingProgramIsALaunchError) {
    GeminiLauncher missing(storage, dir / "workspace", "gcm-test-no-such-program");
    EXPECT_THROW(missing.launch(makeProfile("dev", "Dev")), LaunchError);
}

TEST_F(LauncherFixture, LaunchScriptExportsProfile) {
    Profile profile = makeProfile("dev", "Dev");
    profile.environmentVariables = {{"TOKEN", "it's"}, {"HOME_COPY", "$HOME"}};
    profile.workingDirectory = "/srv/app";
    auto script = dir / "launch.sh";
    launcher.createLaunchScript(profile, script);

    std::string text = readFile(script);
    EXPECT_EQ(text.rfind("#!/bin/sh\n", 0), 0u);
    EXPECT_NE(text.find("export GEMINI_PROFILE='dev'"), std::string::npos);
    EXPECT_NE(text.find("export TOKEN='it'\\''s'"), std::string::npos);
    EXPECT_NE(text.find("export HOME_COPY=\"$HOME\""), std::string::npos);
    EXPECT_NE(text.find("cd '/srv/app' || exit 1"), std::string::npos);
    EXPECT_NE(text.find("exec gemini \"$@\""), std::string::npos);

    struct stat st {};
    ASSERT_EQ(::stat(script.c_str(), &st), 0);
    EXPECT_TRUE(st.st_mode & S_IXUSR);
}
