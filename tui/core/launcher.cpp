#include "launcher.h"
#include "errors.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace gcm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

void writeFile(const fs::path& file, const std::string& content) {
    std::ofstream out(file, std::ios::trunc | std::ios::binary);
    if (!out) {
        throw LaunchError("Failed to open " + file.string() + " for writing");
    }
    out << content;
    if (!out) {
        throw LaunchError("Failed to write " + file.string());
    }
}

void createDirectories(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw LaunchError("Failed to create " + dir.string() + ": " + ec.message());
    }
}

// "$HOME" or "${HOME}" -> the variable name, otherwise empty
std::string referencedVariable(const std::string& value) {
    if (value.size() > 3 && value.rfind("${", 0) == 0 && value.back() == '}') {
        return value.substr(2, value.size() - 3);
    }
    if (value.size() > 1 && value[0] == '$') return value.substr(1);
    return "";
}

std::string shellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    return out + "'";
}

fs::path homeDirectory() {
    const char* home = std::getenv("HOME");
    return home ? fs::path(home) : fs::current_path();
}

// Ignores SIGINT/SIGQUIT while a foreground child owns the terminal,
// the way system(3) does
class IgnoreInteractiveSignals {
public:
    IgnoreInteractiveSignals() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &oldInt_);
        sigaction(SIGQUIT, &ignore, &oldQuit_);
    }
    ~IgnoreInteractiveSignals() {
        sigaction(SIGINT, &oldInt_, nullptr);
        sigaction(SIGQUIT, &oldQuit_, nullptr);
    }

    IgnoreInteractiveSignals(const IgnoreInteractiveSignals&) = delete;
    IgnoreInteractiveSignals& operator=(const IgnoreInteractiveSignals&) = delete;

private:
    struct sigaction oldInt_ {};
    struct sigaction oldQuit_ {};
};

}  // namespace

GeminiLauncher::GeminiLauncher(std::shared_ptr<Storage> storage, fs::path workspaceDir, std::string program)
    : storage_(std::move(storage)), workspaceDir_(std::move(workspaceDir)), program_(std::move(program)) {}

fs::path GeminiLauncher::workspaceFor(const Profile& profile) const {
    return workspaceDir_ / profile.id;
}

fs::path GeminiLauncher::extensionsDirFor(const Profile& profile) const {
    return workspaceFor(profile) / ".gemini" / "extensions";
}

fs::path GeminiLauncher::prepareWorkspace(const Profile& profile) const {
    fs::path extensionsDir = extensionsDirFor(profile);
    createDirectories(extensionsDir);

    if (profile.launchConfig.cleanLaunch) {
        const auto& keep = profile.launchConfig.preserveExtensions;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(extensionsDir, ec)) {
            std::string name = entry.path().filename().string();
            if (std::find(keep.begin(), keep.end(), name) != keep.end()) continue;
            std::error_code removeEc;
            fs::remove_all(entry.path(), removeEc);
            if (removeEc) {
                throw LaunchError("Failed to clean " + entry.path().string() + ": " + removeEc.message());
            }
        }
        if (ec) {
            throw LaunchError("Failed to list " + extensionsDir.string() + ": " + ec.message());
        }
    }

    installExtensions(profile, extensionsDir);
    return extensionsDir;
}

std::vector<std::string> GeminiLauncher::installExtensions(const Profile& profile,
                                                           const fs::path& extensionsDir) const {
    std::vector<std::string> installed;
    for (const auto& id : profile.extensionIds) {
        Extension ext;
        try {
            ext = storage_->loadExtension(id);
        } catch (const NotFoundError&) {
            spdlog::warn("Profile {} references missing extension {}, skipping", profile.id, id);
            continue;
        }

        fs::path dir = extensionsDir / ext.id;
        createDirectories(dir);

        json manifest = {
            {"name", ext.name},
            {"version", ext.version},
            {"mcpServers", json::object()},
        };
        for (const auto& [name, server] : ext.mcpServers) {
            json full = server;
            json entry = json::object();
            // Gemini rejects explicit nulls, so only set fields are written
            for (const auto& item : full.items()) {
                if (!item.value().is_null()) entry[item.key()] = item.value();
            }
            manifest["mcpServers"][name] = entry;
        }
        if (ext.contextContent) {
            // The context is always installed as GEMINI.md
            manifest["contextFileName"] = "GEMINI.md";
            writeFile(dir / "GEMINI.md", *ext.contextContent);
        }
        writeFile(dir / "gemini-extension.json", manifest.dump(2) + "\n");

        spdlog::info("Installed extension {} into {}", ext.name, dir.string());
        installed.push_back(ext.id);
    }
    return installed;
}

Environment GeminiLauncher::buildEnvironment(const Profile& profile, const fs::path& extensionsDir,
                                             const Environment& base) const {
    Environment env = base;
    for (const auto& [key, value] : profile.environmentVariables) {
        std::string name = referencedVariable(value);
        auto it = name.empty() ? base.end() : base.find(name);
        env[key] = it != base.end() ? it->second : value;
    }
    env["GEMINI_PROFILE"] = profile.id;
    env["GEMINI_EXTENSIONS_DIR"] = extensionsDir.string();
    return env;
}

fs::path GeminiLauncher::resolveWorkingDirectory(const Profile& profile) const {
    if (!profile.workingDirectory || profile.workingDirectory->empty()) {
        return fs::current_path();
    }

    const std::string& dir = *profile.workingDirectory;
    fs::path path;
    if (dir == "~") {
        path = homeDirectory();
    } else if (dir.rfind("~/", 0) == 0) {
        path = homeDirectory() / dir.substr(2);
    } else {
        path = dir;
    }
    createDirectories(path);
    return path;
}

Environment GeminiLauncher::processEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq == std::string::npos) continue;
        env.emplace(item.substr(0, eq), item.substr(eq + 1));
    }
    return env;
}

std::optional<fs::path> GeminiLauncher::findExecutable(const std::string& name, const std::string& searchPath) {
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return fs::path(name);
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= searchPath.size()) {
        size_t end = searchPath.find(':', start);
        if (end == std::string::npos) end = searchPath.size();
        std::string dir = searchPath.substr(start, end - start);
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

int GeminiLauncher::run(const fs::path& executable, const fs::path& workingDir, const Environment& env) const {
    std::vector<std::string> envStrings;
    envStrings.reserve(env.size());
    for (const auto& [key, value] : env) envStrings.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& s : envStrings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string program = executable.string();
    std::vector<char*> argv = {program.data(), nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
        throw LaunchError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        if (::chdir(workingDir.c_str()) != 0) {
            std::perror("chdir");
            ::_exit(126);
        }
        ::execve(program.c_str(), argv.data(), envp.data());
        std::perror("execve");
        ::_exit(127);
    }

    IgnoreInteractiveSignals ignore;
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw LaunchError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFSIGNALED(status)) {
        throw LaunchError(program_ + " terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void GeminiLauncher::launch(const Profile& profile) {
    spdlog::info("Launching {} with profile {}", program_, profile.id);

    const char* pathVar = std::getenv("PATH");
    auto executable = findExecutable(program_, pathVar ? pathVar : "");
    if (!executable) {
        throw LaunchError("Gemini CLI not found. Please ensure '" + program_ +
                          "' is installed and in your PATH.");
    }

    fs::path extensionsDir = prepareWorkspace(profile);
    Environment env = buildEnvironment(profile, extensionsDir, processEnvironment());
    fs::path workingDir = resolveWorkingDirectory(profile);

    std::cout << "Launching Gemini CLI with profile: " << profile.displayName() << "\n"
              << "Working directory: " << workingDir.string() << "\n"
              << "Extensions: " << joinList(profile.extensionIds) << "\n"
              << std::endl;

    auto cleanup = [&] {
        if (!profile.launchConfig.cleanupOnExit) return;
        std::error_code ec;
        fs::remove_all(extensionsDir, ec);
        if (ec) spdlog::warn("Failed to clean up {}: {}", extensionsDir.string(), ec.message());
    };

    int code = 0;
    try {
        code = run(*executable, workingDir, env);
    } catch (const LaunchError&) {
        cleanup();
        throw;
    }
    cleanup();

    if (code != 0) {
        throw LaunchError(program_ + " exited with status " + std::to_string(code));
    }
    spdlog::info("{} exited normally", program_);
}

void GeminiLauncher::createLaunchScript(const Profile& profile, const fs::path& output) const {
    std::string script;
    script += "#!/bin/sh\n";
    script += "# Launch script for Gemini CLI profile: " + profile.name + "\n\n";
    script += "export GEMINI_PROFILE=" + shellQuote(profile.id) + "\n";
    script += "export GEMINI_EXTENSIONS_DIR=" + shellQuote(extensionsDirFor(profile).string()) + "\n";
    for (const auto& [key, value] : profile.environmentVariables) {
        // Variable references stay unquoted so the shell expands them
        if (!referencedVariable(value).empty()) {
            script += "export " + key + "=\"" + value + "\"\n";
        } else {
            script += "export " + key + "=" + shellQuote(value) + "\n";
        }
    }
    script += "\n";
    if (profile.workingDirectory && !profile.workingDirectory->empty()) {
        const std::string& dir = *profile.workingDirectory;
        if (dir.rfind("~/", 0) == 0) {
            script += "cd \"$HOME\"/" + shellQuote(dir.substr(2)) + " || exit 1\n";
        } else {
            script += "cd " + shellQuote(dir) + " || exit 1\n";
        }
    }
    script += "exec " + program_ + " \"$@\"\n";

    writeFile(output, script);
    std::error_code ec;
    fs::permissions(output,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw LaunchError("Failed to make " + output.string() + " executable: " + ec.message());
    }
}

}  // namespace gcm
