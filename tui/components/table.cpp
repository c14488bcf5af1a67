#include "table.h"
#include <algorithm>

namespace gcm {
namespace components {

using namespace ftxui;

std::string fitToWidth(const std::string& str, int width, TableColumn::Align align) {
    if (width <= 0) return str;

    if ((int)str.length() > width) {
        if (width > 3) {
            return str.substr(0, width - 3) + "...";
        }
        return str.substr(0, width);
    }

    int padding = width - str.length();
    switch (align) {
        case TableColumn::Align::Left:
            return str + std::string(padding, ' ');
        case TableColumn::Align::Right:
            return std::string(padding, ' ') + str;
        case TableColumn::Align::Center: {
            int left = padding / 2;
            int right = padding - left;
            return std::string(left, ' ') + str + std::string(right, ' ');
        }
    }
    return str;
}

namespace {

Element cell(const std::string& value, const TableColumn& column) {
    auto el = text(fitToWidth(value, column.width, column.align));
    return column.width > 0 ? el : el | flex;
}

}  // namespace

Element TableElement(
    const std::vector<std::vector<std::string>>& rows,
    const std::vector<TableColumn>& columns,
    const ColorTheme& theme,
    int selected,
    bool showHeader,
    const std::string& emptyText
) {
    Elements rowElements;

    if (showHeader && !columns.empty()) {
        Elements headerCells;
        headerCells.push_back(text("  "));
        for (const auto& col : columns) {
            headerCells.push_back(cell(col.header, col) | bold | color(theme.accent));
            headerCells.push_back(text(" "));
        }
        rowElements.push_back(hbox(headerCells));
        rowElements.push_back(separatorLight() | color(theme.muted));
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        Elements cells;

        // Selection indicator
        if ((int)i == selected) {
            cells.push_back(text("▸ ") | color(theme.accent));
        } else {
            cells.push_back(text("  "));
        }

        for (size_t j = 0; j < row.size() && j < columns.size(); ++j) {
            cells.push_back(cell(row[j], columns[j]));
            cells.push_back(text(" "));
        }

        Element rowElem = hbox(cells);
        if ((int)i == selected) {
            rowElem = rowElem | bgcolor(theme.primary) | color(theme.primaryFg) | focus;
        }
        rowElements.push_back(rowElem);
    }

    if (rows.empty()) {
        rowElements.push_back(text("  " + emptyText) | color(theme.muted));
    }

    return vbox(rowElements) | vscroll_indicator | yframe;
}

}  // namespace components
}  // namespace gcm
