#include "importer.h"
#include "errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace gcm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::string readText(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw ImportError("Cannot read " + file.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

int contextPriority(const std::string& name) {
    if (name == "GEMINI.md") return 0;
    if (name == "CONTEXT.md") return 2;
    if (name == "README.md") return 3;
    return 1;
}

std::string directoryName(const fs::path& dir) {
    // "foo/" has an empty filename
    fs::path clean = dir.has_filename() ? dir : dir.parent_path();
    std::string name = clean.filename().string();
    return name.empty() ? "imported-context" : name;
}

}  // namespace

std::vector<fs::path> findContextFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (entry.path().extension() != ".md") continue;
        files.push_back(entry.path());
    }
    if (ec) {
        spdlog::warn("Cannot list {}: {}", dir.string(), ec.message());
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        int pa = contextPriority(a.filename().string());
        int pb = contextPriority(b.filename().string());
        if (pa != pb) return pa < pb;
        return a.filename() < b.filename();
    });
    return files;
}

ExtensionImporter::ExtensionImporter(std::shared_ptr<Storage> storage)
    : storage_(std::move(storage)) {}

ExtensionImporter::Result ExtensionImporter::importPath(const fs::path& path) {
    if (path.empty()) {
        throw ImportError("Please enter a path");
    }
    if (!fs::exists(path)) {
        throw ImportError("Path does not exist: " + path.string());
    }

    if (fs::is_directory(path)) return importDirectory(path);
    if (path.extension() == ".json") return importJsonFile(path);
    if (path.extension() == ".md") return importContextFile(path, directoryName(path.parent_path()));

    throw ImportError("Please select a .json, .md file, or a directory");
}

ExtensionImporter::Result ExtensionImporter::importDirectory(const fs::path& dir) {
    for (const char* name : {"extension.json", "gemini-extension.json"}) {
        if (fs::exists(dir / name)) return importJsonFile(dir / name);
    }

    auto contextFiles = findContextFiles(dir);
    if (contextFiles.empty()) {
        throw ImportError("No extension.json or context files found in directory");
    }
    return importContextFile(contextFiles.front(), directoryName(dir));
}

Extension ExtensionImporter::parseExtensionFile(const fs::path& file) const {
    json doc;
    try {
        doc = json::parse(readText(file));
    } catch (const json::parse_error& e) {
        throw ImportError(std::string("Failed to parse extension: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ImportError("Failed to parse extension: expected a JSON object");
    }

    Extension ext;
    try {
        doc.at("name").get_to(ext.name);
        doc.at("version").get_to(ext.version);
        if (doc.contains("description") && !doc["description"].is_null()) {
            ext.description = doc["description"].get<std::string>();
        }
        if (doc.contains("mcpServers") && !doc["mcpServers"].is_null()) {
            doc["mcpServers"].get_to(ext.mcpServers);
        }
        if (doc.contains("contextFileName") && !doc["contextFileName"].is_null()) {
            ext.contextFileName = doc["contextFileName"].get<std::string>();
        }
        if (doc.contains("contextContent") && !doc["contextContent"].is_null()) {
            ext.contextContent = doc["contextContent"].get<std::string>();
        }
        if (doc.contains("metadata") && doc["metadata"].is_object()) {
            ext.metadata.tags = doc["metadata"].value("tags", std::vector<std::string>{});
        }
    } catch (const json::exception& e) {
        throw ImportError(std::string("Failed to parse extension: ") + e.what());
    }
    if (ext.name.empty() || ext.version.empty()) {
        throw ImportError("Failed to parse extension: name and version are required");
    }

    // A fresh id every time, so importing twice never overwrites
    ext.id = generateId();
    ext.metadata.importedAt = currentTimestamp();
    ext.metadata.sourcePath = fs::absolute(file).string();
    return ext;
}

ExtensionImporter::Result ExtensionImporter::importJsonFile(const fs::path& file) {
    Extension ext = parseExtensionFile(file);

    if (!ext.contextContent) {
        fs::path dir = file.parent_path();
        for (const auto& name : {upper(ext.name) + ".md", ext.name + ".md",
                                 std::string("GEMINI.md"), std::string("CONTEXT.md"),
                                 std::string("README.md")}) {
            if (!fs::is_regular_file(dir / name)) continue;
            ext.contextFileName = name;
            ext.contextContent = readText(dir / name);
            break;
        }
    }

    storage_->saveExtension(ext);
    spdlog::info("Imported extension {} ({}) from {}", ext.name, ext.id, file.string());
    return Result{ext, false};
}

ExtensionImporter::Result ExtensionImporter::importContextFile(const fs::path& file,
                                                               const std::string& extensionName) {
    std::string fileName = file.filename().string();

    Extension ext;
    ext.id = generateId();
    ext.name = extensionName;
    ext.version = "1.0.0";
    ext.description = "Context-only extension imported from " + fileName;
    ext.contextFileName = fileName;
    ext.contextContent = readText(file);
    ext.metadata.importedAt = currentTimestamp();
    ext.metadata.sourcePath = fs::absolute(file).string();
    ext.metadata.tags = {"context-only"};

    storage_->saveExtension(ext);
    spdlog::info("Imported context {} as extension {} ({})", fileName, ext.name, ext.id);
    return Result{ext, true};
}

}  // namespace gcm
