#include "key_chord_resolver.h"

#include <gtest/gtest.h>

using namespace gcm;

namespace {

KeyEvent ch(const char* c) { return KeyEvent::character(c); }

KeyMap chordMap() {
    KeyMap keymap;
    keymap[{ch("q")}] = ActionType::Quit;
    keymap[{ch("a"), ch("b")}] = ActionType::NavigateToProfiles;
    return keymap;
}

}  // namespace

TEST(KeyChordResolverTest, SingleKeyMatchesImmediately) {
    KeyChordResolver resolver(chordMap());
    auto action = resolver.resolve(ch("q"));
    ASSERT_TRUE(action);
    EXPECT_EQ(action->type, ActionType::Quit);
    EXPECT_TRUE(resolver.buffer().empty());
}

TEST(KeyChordResolverTest, ChordWithinOneTickResolves) {
    KeyChordResolver resolver(chordMap());
    EXPECT_FALSE(resolver.resolve(ch("a")));
    auto action = resolver.resolve(ch("b"));
    ASSERT_TRUE(action);
    EXPECT_EQ(action->type, ActionType::NavigateToProfiles);
}

TEST(KeyChordResolverTest, TickBetweenKeysBreaksTheChord) {
    KeyChordResolver resolver(chordMap());
    EXPECT_FALSE(resolver.resolve(ch("a")));
    resolver.clearBuffer();
    EXPECT_FALSE(resolver.resolve(ch("b")));
}

TEST(KeyChordResolverTest, UnmatchedKeysAccumulateUntilCleared) {
    KeyChordResolver resolver(chordMap());
    EXPECT_FALSE(resolver.resolve(ch("x")));
    EXPECT_FALSE(resolver.resolve(ch("a")));
    // buffer is [x, a, b], not [a, b]
    EXPECT_FALSE(resolver.resolve(ch("b")));
    EXPECT_EQ(resolver.buffer().size(), 3u);

    resolver.clearBuffer();
    EXPECT_TRUE(resolver.buffer().empty());
}
