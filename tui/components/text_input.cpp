#include "text_input.h"

namespace gcm {
namespace components {

using namespace ftxui;

namespace {

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

TextInput::TextInput(std::string value, bool multiline)
    : value_(std::move(value)), cursor_(value_.size()), multiline_(multiline) {}

void TextInput::setValue(std::string value) {
    value_ = std::move(value);
    cursor_ = value_.size();
}

size_t TextInput::prevBoundary(size_t pos) const {
    if (pos == 0) return 0;
    --pos;
    while (pos > 0 && isContinuation(static_cast<unsigned char>(value_[pos]))) --pos;
    return pos;
}

size_t TextInput::nextBoundary(size_t pos) const {
    if (pos >= value_.size()) return value_.size();
    ++pos;
    while (pos < value_.size() && isContinuation(static_cast<unsigned char>(value_[pos]))) ++pos;
    return pos;
}

void TextInput::insert(const std::string& text) {
    value_.insert(cursor_, text);
    cursor_ += text.size();
}

bool TextInput::handleKey(const KeyEvent& key) {
    if (key.ctrl || key.alt) {
        // Ctrl+U clears the line
        if (key.ctrl && key.code == KeyCode::Char && key.ch == "u") {
            clear();
            return true;
        }
        return false;
    }

    switch (key.code) {
        case KeyCode::Char:
            insert(key.ch);
            return true;
        case KeyCode::Enter:
            if (!multiline_) return false;
            insert("\n");
            return true;
        case KeyCode::Backspace:
            if (cursor_ > 0) {
                size_t start = prevBoundary(cursor_);
                value_.erase(start, cursor_ - start);
                cursor_ = start;
            }
            return true;
        case KeyCode::Delete:
            if (cursor_ < value_.size()) {
                value_.erase(cursor_, nextBoundary(cursor_) - cursor_);
            }
            return true;
        case KeyCode::Left:
            cursor_ = prevBoundary(cursor_);
            return true;
        case KeyCode::Right:
            cursor_ = nextBoundary(cursor_);
            return true;
        case KeyCode::Home:
            cursor_ = 0;
            return true;
        case KeyCode::End:
            cursor_ = value_.size();
            return true;
        default:
            return false;
    }
}

Element TextInput::render(bool focused, const ColorTheme& theme,
                          const std::string& placeholder) const {
    if (value_.empty() && !focused) {
        return text(placeholder.empty() ? " " : placeholder) | color(theme.muted);
    }

    if (!multiline_) {
        if (!focused) return text(value_);
        return hbox({
            text(value_.substr(0, cursor_)),
            text(cursor_ < value_.size() ? value_.substr(cursor_, nextBoundary(cursor_) - cursor_) : " ")
                | inverted,
            text(cursor_ < value_.size() ? value_.substr(nextBoundary(cursor_)) : ""),
        });
    }

    // Multiline: one text() per line, cursor shown as a bar on a focused
    // line so an enclosing yframe scrolls to it
    std::string shown = value_;
    if (focused) shown.insert(cursor_, "▏");
    Elements lines;
    size_t start = 0;
    while (true) {
        size_t end = shown.find('\n', start);
        size_t stop = end == std::string::npos ? shown.size() : end;
        auto line = text(shown.substr(start, stop - start));
        if (focused && cursor_ >= start && cursor_ <= stop) line = line | focus;
        lines.push_back(line);
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return vbox(std::move(lines));
}

}  // namespace components
}  // namespace gcm
