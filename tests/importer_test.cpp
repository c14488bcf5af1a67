#include "components/import_dialog.h"
#include "core/errors.h"
#include "core/importer.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace gcm;
using namespace gcm::test;

namespace {

const char* kManifest = R"({
    "name": "weather",
    "version": "2.1.0",
    "description": "Forecasts",
    "mcpServers": {
        "api": {"command": "python", "args": ["-m", "weather"], "env": {"KEY": "$WEATHER_KEY"}, "timeout": 5000}
    },
    "metadata": {"tags": ["net"]}
})";

}  // namespace

TEST(ImporterTest, ImportsJsonManifest) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "src" / "weather.json", kManifest);

    ExtensionImporter importer(storage);
    auto result = importer.importPath(dir / "src" / "weather.json");
    EXPECT_FALSE(result.contextOnly);

    const Extension& ext = result.extension;
    EXPECT_EQ(ext.name, "weather");
    EXPECT_EQ(ext.version, "2.1.0");
    ASSERT_EQ(ext.mcpServers.count("api"), 1u);
    EXPECT_EQ(ext.mcpServers.at("api").command, "python");
    EXPECT_EQ(ext.mcpServers.at("api").timeout, 5000u);
    EXPECT_EQ(ext.metadata.tags, std::vector<std::string>{"net"});
    EXPECT_TRUE(ext.metadata.sourcePath);
    EXPECT_FALSE(ext.contextContent);

    EXPECT_EQ(storage->loadExtension(ext.id), ext);
}

TEST(ImporterTest, JsonImportPicksUpSiblingContext) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "src" / "manifest.json", kManifest);
    writeFile(dir / "src" / "README.md", "readme");
    writeFile(dir / "src" / "WEATHER.md", "# Weather");

    auto result = ExtensionImporter(storage).importPath(dir / "src" / "manifest.json");
    EXPECT_EQ(result.extension.contextFileName, "WEATHER.md");
    EXPECT_EQ(result.extension.contextContent, "# Weather");
}

TEST(ImporterTest, DirectoryWithManifest) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "ext" / "gemini-extension.json", kManifest);

    auto result = ExtensionImporter(storage).importPath(dir / "ext");
    EXPECT_EQ(result.extension.name, "weather");
}

TEST(ImporterTest, DirectoryWithOnlyContextFiles) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "notes" / "README.md", "readme");
    writeFile(dir / "notes" / "GEMINI.md", "gemini context");

    auto result = ExtensionImporter(storage).importPath(dir / "notes");
    EXPECT_TRUE(result.contextOnly);
    EXPECT_EQ(result.extension.name, "notes");
    EXPECT_EQ(result.extension.version, "1.0.0");
    EXPECT_EQ(result.extension.contextFileName, "GEMINI.md");
    EXPECT_EQ(result.extension.contextContent, "gemini context");
    EXPECT_EQ(result.extension.metadata.tags, std::vector<std::string>{"context-only"});
}

TEST(ImporterTest, ContextFileOrdering) {
    TempDir dir;
    writeFile(dir / "README.md", "");
    writeFile(dir / "CONTEXT.md", "");
    writeFile(dir / "guide.md", "");
    writeFile(dir / "GEMINI.md", "");
    writeFile(dir / ".hidden.md", "");
    writeFile(dir / "notes.txt", "");

    auto files = findContextFiles(dir.path());
    ASSERT_EQ(files.size(), 4u);
    EXPECT_EQ(files[0].filename(), "GEMINI.md");
    EXPECT_EQ(files[1].filename(), "guide.md");
    EXPECT_EQ(files[2].filename(), "CONTEXT.md");
    EXPECT_EQ(files[3].filename(), "README.md");
}

TEST(ImporterTest, ImportingTwiceCreatesTwoRecords) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "weather.json", kManifest);

    ExtensionImporter importer(storage);
    auto first = importer.importPath(dir / "weather.json");
    auto second = importer.importPath(dir / "weather.json");
    EXPECT_NE(first.extension.id, second.extension.id);
    EXPECT_EQ(storage->listExtensions().size(), 2u);
}

TEST(ImporterTest, ReportsUserErrors) {
    TempDir dir;
    auto storage = makeStorage(dir);
    ExtensionImporter importer(storage);

    EXPECT_THROW(importer.importPath(""), ImportError);
    EXPECT_THROW(importer.importPath(dir / "missing.json"), ImportError);

    writeFile(dir / "notes.txt", "text");
    EXPECT_THROW(importer.importPath(dir / "notes.txt"), ImportError);

    writeFile(dir / "broken.json", "{");
    EXPECT_THROW(importer.importPath(dir / "broken.json"), ImportError);

    writeFile(dir / "noversion.json", R"({"name": "x"})");
    EXPECT_THROW(importer.importPath(dir / "noversion.json"), ImportError);

    std::filesystem::create_directories(dir / "empty");
    EXPECT_THROW(importer.importPath(dir / "empty"), ImportError);

    EXPECT_TRUE(storage->listExtensions().empty());
}

TEST(ImportDialogTest, ImportsTypedPath) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "src" / "weather.json", kManifest);
    ActionChannel channel;

    components::ImportDialog dialog(storage);
    dialog.registerActionHandler(channel.sender());
    dialog.setPath((dir / "src" / "weather.json").string());

    auto result = dialog.handleKeyEvent(KeyEvent::special(KeyCode::Enter));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::Render);
    EXPECT_TRUE(dialog.error().empty());
    EXPECT_TRUE(dialog.path().empty());
    EXPECT_EQ(storage->listExtensions().size(), 1u);

    auto sent = drain(channel);
    ASSERT_NE(findType(sent, ActionType::Success), nullptr);
    EXPECT_EQ(findType(sent, ActionType::Success)->text, "Successfully imported: weather");
    EXPECT_TRUE(containsType(sent, ActionType::RefreshExtensions));
    EXPECT_TRUE(containsType(sent, ActionType::NavigateBack));
}

TEST(ImportDialogTest, ErrorsStayInDialog) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "notes.txt", "hello");
    ActionChannel channel;

    components::ImportDialog dialog(storage);
    dialog.registerActionHandler(channel.sender());
    dialog.setPath((dir / "notes.txt").string());
    dialog.handleKeyEvent(KeyEvent::special(KeyCode::Enter));

    EXPECT_EQ(dialog.error(), "Please select a .json, .md file, or a directory");
    EXPECT_TRUE(drain(channel).empty());

    // Typing clears the error
    dialog.handleKeyEvent(KeyEvent::special(KeyCode::Backspace));
    EXPECT_TRUE(dialog.error().empty());
}

TEST(ImportDialogTest, TabCompletesPath) {
    TempDir dir;
    auto storage = makeStorage(dir);
    writeFile(dir / "src" / "weather.json", kManifest);

    components::ImportDialog dialog(storage);
    dialog.setPath((dir / "src").string() + "/wea");
    dialog.handleKeyEvent(KeyEvent::special(KeyCode::Tab));
    EXPECT_EQ(dialog.path(), (dir / "src" / "weather.json").string());

    auto result = dialog.handleKeyEvent(KeyEvent::special(KeyCode::Esc));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::NavigateBack);
    EXPECT_TRUE(dialog.path().empty());
}
