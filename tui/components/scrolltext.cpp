#include "scrolltext.h"
#include <algorithm>

namespace gcm {
namespace components {

using namespace ftxui;

int maxScrollOffset(int totalLines, int visibleLines) {
    return std::max(0, totalLines - visibleLines);
}

Element ScrollTextElement(
    const std::vector<TextLine>& lines,
    int scrollOffset,
    int visibleLines
) {
    if (lines.empty()) {
        return text("(nothing to show)") | dim | center;
    }

    Elements lineElements;
    int totalLines = lines.size();
    visibleLines = std::max(1, visibleLines);

    int startIdx = std::clamp(scrollOffset, 0, maxScrollOffset(totalLines, visibleLines));
    int endIdx = std::min(totalLines, startIdx + visibleLines);

    if (startIdx > 0) {
        lineElements.push_back(
            text("── " + std::to_string(startIdx) + " more above ──") | dim | center
        );
    }

    for (int i = startIdx; i < endIdx; ++i) {
        const auto& line = lines[i];
        Elements parts;

        auto prefix = text(line.prefix);
        if (line.prefixColor != Color::Default) {
            prefix = prefix | color(line.prefixColor);
        }
        parts.push_back(prefix);

        auto content = text(line.content);
        if (line.dim) {
            content = content | dim;
        }
        if (line.heading) {
            content = content | bold;
        }
        parts.push_back(content);

        lineElements.push_back(hbox(parts));
    }

    if (endIdx < totalLines) {
        lineElements.push_back(
            text("── " + std::to_string(totalLines - endIdx) + " more below ──") | dim | center
        );
    }

    return vbox(lineElements);
}

}  // namespace components
}  // namespace gcm
