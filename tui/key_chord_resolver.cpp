#include "key_chord_resolver.h"

namespace gcm {

std::optional<Action> KeyChordResolver::resolve(const KeyEvent& key) {
    if (auto it = keymap_.find({key}); it != keymap_.end()) {
        return it->second;
    }

    buffer_.push_back(key);
    if (auto it = keymap_.find(buffer_); it != keymap_.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace gcm
