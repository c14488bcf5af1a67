#ifndef GCM_TUI_KEY_CHORD_RESOLVER_H
#define GCM_TUI_KEY_CHORD_RESOLVER_H

#include "config.h"
#include <optional>
#include <vector>

namespace gcm {

// Resolves key presses to actions through a keymap of single keys and
// multi-key sequences. Keys accumulate in a pending buffer that is only
// cleared by clearBuffer() (once per Tick), so a sequence has to be
// completed within one tick interval.
class KeyChordResolver {
public:
    KeyChordResolver() = default;
    explicit KeyChordResolver(KeyMap keymap) : keymap_(std::move(keymap)) {}


    std::optional<Action> resolve(const KeyEvent& key);
    void clearBuffer() { buffer_.clear(); }

    const std::vector<KeyEvent>& buffer() const { return buffer_; }

private:
    KeyMap keymap_;
    std::vector<KeyEvent> buffer_;
};

}  // namespace gcm

#endif  // GCM_TUI_KEY_CHORD_RESOLVER_H
