#include "app.h"
#include "config.h"
#include "ftxui_terminal.h"
#include "logging.h"
#include "core/launcher.h"
#include "core/settings.h"
#include "core/storage.h"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
    gcm::App* g_app = nullptr;

    constexpr const char* kVersion = "0.3.0";
}

void signalHandler(int signal) {
    (void)signal;
    if (g_app) {
        g_app->quit();
    }
}

void printUsage() {
    std::cout << "gcm-tui v" << kVersion << " - Manage Gemini CLI extensions and profiles\n\n";
    std::cout << "Usage: gcm-tui [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "  -v, --version           Show version\n";
    std::cout << "  --list-storage          Print stored extensions and profiles and exit\n";
    std::cout << "  -t, --tick-rate <hz>    Tick rate (default 4)\n";
    std::cout << "  -f, --frame-rate <hz>   Frame rate (default 60)\n";
}

double parseRate(const char* option, const char* value) {
    if (!value) {
        throw std::invalid_argument(std::string("Missing value for ") + option);
    }
    double rate = 0;
    try {
        rate = std::stod(value);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("Invalid value for ") + option + ": " + value);
    }
    if (rate <= 0 || rate > 1000) {
        throw std::invalid_argument(std::string(option) + " must be between 0 and 1000");
    }
    return rate;
}

void listStorage(const gcm::Storage& storage) {
    auto extensions = storage.listExtensions();
    std::cout << "Extensions (" << extensions.size() << "):\n";
    for (const auto& ext : extensions) {
        std::cout << "  " << ext.id << "  " << ext.name << " v" << ext.version << "\n";
    }

    auto profiles = storage.listProfiles();
    std::cout << "\nProfiles (" << profiles.size() << "):\n";
    for (const auto& profile : profiles) {
        std::cout << "  " << profile.id << "  " << profile.displayName() << " - " << profile.summary();
        if (profile.metadata.isDefault) std::cout << " (default)";
        std::cout << "\n";
    }
    std::cout << "\nData directory: " << storage.root().string() << "\n";
}

int main(int argc, char* argv[]) {
    double tickRate = 4.0;
    double frameRate = 60.0;
    bool listOnly = false;

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--version") == 0 || std::strcmp(argv[i], "-v") == 0) {
                std::cout << "gcm-tui v" << kVersion << "\n";
                return 0;
            }
            if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                printUsage();
                return 0;
            }
            if (std::strcmp(argv[i], "--list-storage") == 0) {
                listOnly = true;
            } else if (std::strcmp(argv[i], "--tick-rate") == 0 || std::strcmp(argv[i], "-t") == 0) {
                tickRate = parseRate(argv[i], i + 1 < argc ? argv[i + 1] : nullptr);
                ++i;
            } else if (std::strcmp(argv[i], "--frame-rate") == 0 || std::strcmp(argv[i], "-f") == 0) {
                frameRate = parseRate(argv[i], i + 1 < argc ? argv[i + 1] : nullptr);
                ++i;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        gcm::initLogging(gcm::defaultDataDir());
        spdlog::info("gcm-tui v{} starting", kVersion);

        gcm::Config config = gcm::loadConfig();

        auto storage = std::make_shared<gcm::Storage>(config.dataDir);
        storage->init();

        if (listOnly) {
            listStorage(*storage);
            return 0;
        }

        auto settings = gcm::SettingsStore::load(config.settingsFile());
        auto terminal = std::make_unique<gcm::FtxuiTerminal>(tickRate, frameRate);
        auto launcher = std::make_unique<gcm::GeminiLauncher>(storage, config.workspaceDir);

        gcm::App app(std::move(config), storage, settings, std::move(terminal), std::move(launcher));
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        app.run();
        g_app = nullptr;

        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
