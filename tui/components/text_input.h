#ifndef GCM_TUI_COMPONENTS_TEXT_INPUT_H
#define GCM_TUI_COMPONENTS_TEXT_INPUT_H

#include "event.h"
#include "theme.h"
#include <ftxui/dom/elements.hpp>
#include <string>

namespace gcm {
namespace components {

// Editable text buffer with a byte cursor (UTF-8 aware for movement).
// Multiline inputs take Enter as a newline.
class TextInput {
public:
    explicit TextInput(std::string value = "", bool multiline = false);

    const std::string& value() const { return value_; }
    void setValue(std::string value);
    void clear() { setValue(""); }
    bool empty() const { return value_.empty(); }
    size_t cursor() const { return cursor_; }
    bool multiline() const { return multiline_; }

    // Returns true when the key edited the buffer or moved the cursor
    bool handleKey(const KeyEvent& key);

    void insert(const std::string& text);

    ftxui::Element render(bool focused, const ColorTheme& theme,
                          const std::string& placeholder = "") const;

private:
    size_t prevBoundary(size_t pos) const;
    size_t nextBoundary(size_t pos) const;

    std::string value_;
    size_t cursor_ = 0;
    bool multiline_ = false;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_TEXT_INPUT_H
