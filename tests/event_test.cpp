#include "event.h"

#include <gtest/gtest.h>

using namespace gcm;

TEST(EventTest, ParsesSingleCharacters) {
    auto q = parseKey("q");
    ASSERT_TRUE(q);
    EXPECT_EQ(*q, KeyEvent::character("q"));

    auto upper = parseKey("Q");
    ASSERT_TRUE(upper);
    EXPECT_TRUE(upper->shift);
    EXPECT_EQ(upper->ch, "Q");
}

TEST(EventTest, ParsesModifiersInAnyCase) {
    auto ctrl = parseKey("Ctrl-C");
    ASSERT_TRUE(ctrl);
    EXPECT_EQ(*ctrl, KeyEvent::ctrlChar('c'));

    auto altEnter = parseKey("alt-enter");
    ASSERT_TRUE(altEnter);
    EXPECT_EQ(altEnter->code, KeyCode::Enter);
    EXPECT_TRUE(altEnter->alt);
    EXPECT_FALSE(altEnter->ctrl);
}

TEST(EventTest, ParsesNamedKeys) {
    EXPECT_EQ(parseKey("esc")->code, KeyCode::Esc);
    EXPECT_EQ(parseKey("PageDown")->code, KeyCode::PageDown);
    EXPECT_EQ(parseKey("backtab")->code, KeyCode::BackTab);
    EXPECT_EQ(parseKey("space")->ch, " ");
    auto f5 = parseKey("f5");
    ASSERT_TRUE(f5);
    EXPECT_EQ(f5->code, KeyCode::F);
    EXPECT_EQ(f5->fn, 5);

    EXPECT_FALSE(parseKey("f13"));
    EXPECT_FALSE(parseKey("nonsense"));
    EXPECT_FALSE(parseKey(""));
}

TEST(EventTest, ParsesSequences) {
    auto gg = parseKeySequence("<g><g>");
    ASSERT_TRUE(gg);
    ASSERT_EQ(gg->size(), 2u);
    EXPECT_EQ((*gg)[0], KeyEvent::character("g"));

    auto ctrlD = parseKeySequence("<Ctrl-d>");
    ASSERT_TRUE(ctrlD);
    EXPECT_EQ(ctrlD->front(), KeyEvent::ctrlChar('d'));

    auto gt = parseKeySequence("<>>");
    ASSERT_TRUE(gt);
    EXPECT_EQ(gt->front().ch, ">");
}

TEST(EventTest, RejectsMalformedSequences) {
    EXPECT_FALSE(parseKeySequence(""));
    EXPECT_FALSE(parseKeySequence("q"));
    EXPECT_FALSE(parseKeySequence("<q"));
    EXPECT_FALSE(parseKeySequence("<q>x"));
    EXPECT_FALSE(parseKeySequence("<bogus>"));
}

TEST(EventTest, IsCharIgnoresModifiedKeys) {
    EXPECT_TRUE(KeyEvent::character("x").isChar('x'));
    EXPECT_FALSE(KeyEvent::ctrlChar('x').isChar('x'));
    EXPECT_FALSE(KeyEvent::special(KeyCode::Enter).isChar('\n'));
}
