#ifndef GCM_TUI_CORE_IMPORTER_H
#define GCM_TUI_CORE_IMPORTER_H

#include "storage.h"
#include <filesystem>
#include <memory>
#include <string>

namespace gcm {

// Turns a path typed by the user into a stored extension.
//
//   dir with extension.json / gemini-extension.json -> JSON import
//   dir with *.md files                             -> context-only import
//   *.json                                          -> JSON import (+ sibling context file)
//   *.md                                            -> context-only import
//
// Every imported record gets a fresh id. Problems the user can fix
// (bad path, malformed JSON) throw ImportError; store failures throw
// StorageError.
class ExtensionImporter {
public:
    struct Result {
        Extension extension;
        bool contextOnly = false;
    };

    explicit ExtensionImporter(std::shared_ptr<Storage> storage);

    Result importPath(const std::filesystem::path& path);

    Extension parseExtensionFile(const std::filesystem::path& file) const;

private:
    Result importDirectory(const std::filesystem::path& dir);
    Result importJsonFile(const std::filesystem::path& file);
    Result importContextFile(const std::filesystem::path& file, const std::string& extensionName);

    std::shared_ptr<Storage> storage_;
};

// Context-file candidates in a directory, best first:
// GEMINI.md, other *.md, CONTEXT.md, README.md. Hidden files are ignored.
std::vector<std::filesystem::path> findContextFiles(const std::filesystem::path& dir);

}  // namespace gcm

#endif  // GCM_TUI_CORE_IMPORTER_H
