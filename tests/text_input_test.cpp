#include "components/confirm_dialog.h"
#include "components/text_input.h"

#include <gtest/gtest.h>

using namespace gcm;
using namespace gcm::components;

namespace {

void type(TextInput& input, const std::string& text) {
    for (char c : text) input.handleKey(KeyEvent::character(std::string(1, c)));
}

}  // namespace

TEST(TextInputTest, TypingAndEditing) {
    TextInput input;
    type(input, "helo");
    input.handleKey(KeyEvent::special(KeyCode::Left));
    type(input, "l");
    EXPECT_EQ(input.value(), "hello");
    EXPECT_EQ(input.cursor(), 4u);

    input.handleKey(KeyEvent::special(KeyCode::End));
    input.handleKey(KeyEvent::special(KeyCode::Backspace));
    EXPECT_EQ(input.value(), "hell");

    input.handleKey(KeyEvent::special(KeyCode::Home));
    input.handleKey(KeyEvent::special(KeyCode::Delete));
    EXPECT_EQ(input.value(), "ell");
    EXPECT_EQ(input.cursor(), 0u);
}

TEST(TextInputTest, MovesOverWholeUtf8Characters) {
    TextInput input("aé");
    input.handleKey(KeyEvent::special(KeyCode::Left));
    EXPECT_EQ(input.cursor(), 1u);
    input.handleKey(KeyEvent::special(KeyCode::End));
    input.handleKey(KeyEvent::special(KeyCode::Backspace));
    EXPECT_EQ(input.value(), "a");
}

TEST(TextInputTest, EnterOnlyEditsMultiline) {
    TextInput single("x");
    EXPECT_FALSE(single.handleKey(KeyEvent::special(KeyCode::Enter)));
    EXPECT_EQ(single.value(), "x");

    TextInput multi("x", true);
    EXPECT_TRUE(multi.handleKey(KeyEvent::special(KeyCode::Enter)));
    EXPECT_EQ(multi.value(), "x\n");
}

TEST(TextInputTest, CtrlUClearsAndOtherModifiersAreIgnored) {
    TextInput input("some text");
    EXPECT_FALSE(input.handleKey(KeyEvent::ctrlChar('s')));
    EXPECT_EQ(input.value(), "some text");
    EXPECT_TRUE(input.handleKey(KeyEvent::ctrlChar('u')));
    EXPECT_TRUE(input.empty());
}

TEST(ConfirmDialogTest, StartsOnCancel) {
    ConfirmDialog dialog("Delete", "Sure?");
    EXPECT_FALSE(dialog.confirmSelected());
    EXPECT_EQ(dialog.handleKeyEvent(KeyEvent::special(KeyCode::Enter))->type, ActionType::CancelDelete);
}

TEST(ConfirmDialogTest, KeysResolveToActions) {
    ConfirmDialog dialog("Delete", "Sure?");
    EXPECT_EQ(dialog.handleKeyEvent(KeyEvent::character("y"))->type, ActionType::ConfirmDelete);
    EXPECT_EQ(dialog.handleKeyEvent(KeyEvent::character("n"))->type, ActionType::CancelDelete);
    EXPECT_EQ(dialog.handleKeyEvent(KeyEvent::special(KeyCode::Esc))->type, ActionType::CancelDelete);

    dialog.handleKeyEvent(KeyEvent::special(KeyCode::Tab));
    EXPECT_TRUE(dialog.confirmSelected());
    EXPECT_EQ(dialog.handleKeyEvent(KeyEvent::special(KeyCode::Enter))->type, ActionType::ConfirmDelete);
    EXPECT_FALSE(dialog.handleKeyEvent(KeyEvent::character("z")));
}
