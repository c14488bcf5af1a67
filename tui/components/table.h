#ifndef GCM_TUI_COMPONENTS_TABLE_H
#define GCM_TUI_COMPONENTS_TABLE_H

#include "theme.h"
#include <ftxui/dom/elements.hpp>
#include <string>
#include <vector>

namespace gcm {
namespace components {

// Column definition for table
struct TableColumn {
    std::string header;
    int width;  // 0 = flexible
    enum class Align { Left, Center, Right } align = Align::Left;
};

// Truncate ("...") or pad string to width
std::string fitToWidth(const std::string& str, int width, TableColumn::Align align);

// Render a table as an Element (non-interactive)
// - rows: vector of rows, each row is a vector of cell strings
// - selected: highlighted row, -1 for none
ftxui::Element TableElement(
    const std::vector<std::vector<std::string>>& rows,
    const std::vector<TableColumn>& columns,
    const ColorTheme& theme,
    int selected = -1,
    bool showHeader = true,
    const std::string& emptyText = "(empty)"
);

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_TABLE_H
