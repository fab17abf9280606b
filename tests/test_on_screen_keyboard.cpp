#include "focus_registry.h"
#include "on_screen_keyboard.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <memory>

using testing_support::FakeFeedback;
using testing_support::FakeTarget;
using testing_support::FakeUiTree;

namespace
{

class OnScreenKeyboardTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // One fake widget per layout key, wired like the scene wires them
        for (const OskKey& key : OnScreenKeyboard::layout())
        {
            Rect box{40.0f + key.column * 58.0f, 400.0f + key.row * 58.0f, key.wide ? 110.0f : 52.0f, 52.0f};
            auto target = std::make_unique<FakeTarget>(key.label, box);
            OskKey copy = key;
            target->onActivate = [this, copy]() { keyboard.pressKey(copy); };
            keys.push_back(std::move(target));
        }
        tree.keyboard = testing_support::pointers(keys);

        keyboard.setFeedback(&feedback);
        keyboard.setRestoreFocusCallback([this]() { ++restoreCalls; });
        keyboard.setSubmitHandler(OskMode::Search, [this](const std::string& text) { searches.push_back(text); });
        keyboard.setSubmitHandler(OskMode::ContentInput,
                                  [this](const std::string& text) { contentInputs.push_back(text); });
    }

    InputFrame framePressing(std::initializer_list<LogicalInput> inputs) const
    {
        InputFrame frame;
        frame.connected = true;
        frame.pressed = inputs;
        return frame;
    }

    std::vector<std::unique_ptr<FakeTarget>> keys;
    FakeUiTree tree;
    NavigationState navigation;
    FocusRegistry registry{tree, navigation};
    OskState state;
    OnScreenKeyboard keyboard{state, registry};
    FakeFeedback feedback;

    int restoreCalls = 0;
    std::vector<std::string> searches;
    std::vector<std::string> contentInputs;
};

} // namespace

TEST_F(OnScreenKeyboardTest, OpenScopesFocusToKeys)
{
    keyboard.open(OskMode::Search);

    EXPECT_TRUE(keyboard.isVisible());
    EXPECT_EQ(keyboard.getPhase(), OskPhase::Open);
    EXPECT_EQ(navigation.mode, NavigationMode::Keyboard);
    EXPECT_EQ(registry.size(), static_cast<int>(keys.size()));
    EXPECT_EQ(registry.focusedTarget(), keys[0].get());
    EXPECT_STREQ(keyboard.getLabel(), "Search or enter URL");
}

TEST_F(OnScreenKeyboardTest, BackspaceRemovesLastCharacter)
{
    keyboard.open();
    for (const char* c : {"h", "e", "l", "l", "o"})
    {
        keyboard.appendText(c);
    }
    keyboard.backspace();

    EXPECT_EQ(keyboard.getBuffer(), "hell");
    EXPECT_EQ(keyboard.getPhase(), OskPhase::Editing);
}

TEST_F(OnScreenKeyboardTest, BackspaceRemovesWholeMultibyteCharacter)
{
    keyboard.open();
    keyboard.appendText("caf\xC3\xA9");
    keyboard.backspace();
    EXPECT_EQ(keyboard.getBuffer(), "caf");
}

TEST_F(OnScreenKeyboardTest, ClearEmptiesBuffer)
{
    keyboard.open();
    keyboard.appendText("abc");
    keyboard.clear();
    EXPECT_TRUE(keyboard.getBuffer().empty());
    EXPECT_TRUE(keyboard.isVisible());
}

TEST_F(OnScreenKeyboardTest, BlankSubmitIsNoOp)
{
    keyboard.open();
    keyboard.appendText("  ");

    EXPECT_FALSE(keyboard.submit());
    EXPECT_TRUE(keyboard.isVisible());
    EXPECT_EQ(keyboard.getBuffer(), "  ");
    EXPECT_TRUE(searches.empty());
    EXPECT_EQ(restoreCalls, 0);
}

TEST_F(OnScreenKeyboardTest, SubmitDispatchesAndCloses)
{
    keyboard.open(OskMode::Search);
    keyboard.appendText("cats");

    EXPECT_TRUE(keyboard.submit());
    ASSERT_EQ(searches.size(), 1u);
    EXPECT_EQ(searches[0], "cats");
    EXPECT_FALSE(keyboard.isVisible());
    EXPECT_EQ(state.lastOutcome, OskOutcome::Submitted);
    EXPECT_EQ(keyboard.getPhase(), OskPhase::Closed);
    EXPECT_EQ(restoreCalls, 1);
}

TEST_F(OnScreenKeyboardTest, SearchSubmitIsTrimmedContentInputIsNot)
{
    keyboard.open(OskMode::Search);
    keyboard.appendText("  dogs ");
    keyboard.submit();
    ASSERT_EQ(searches.size(), 1u);
    EXPECT_EQ(searches[0], "dogs");

    keyboard.open(OskMode::ContentInput);
    EXPECT_STREQ(keyboard.getLabel(), "Type your text");
    keyboard.appendText(" hi ");
    keyboard.submit();
    ASSERT_EQ(contentInputs.size(), 1u);
    EXPECT_EQ(contentInputs[0], " hi ");
    EXPECT_EQ(searches.size(), 1u);
}

TEST_F(OnScreenKeyboardTest, CloseCancelsWithoutDispatch)
{
    keyboard.open();
    keyboard.appendText("abc");
    keyboard.close();

    EXPECT_FALSE(keyboard.isVisible());
    EXPECT_EQ(state.lastOutcome, OskOutcome::Cancelled);
    EXPECT_TRUE(searches.empty());
    EXPECT_EQ(restoreCalls, 1);

    // Already closed: nothing happens
    keyboard.close();
    EXPECT_EQ(restoreCalls, 1);
}

TEST_F(OnScreenKeyboardTest, ReopeningStartsWithEmptyBuffer)
{
    keyboard.open();
    keyboard.appendText("abc");
    keyboard.close();
    keyboard.open();
    EXPECT_TRUE(keyboard.getBuffer().empty());
    EXPECT_EQ(keyboard.getPhase(), OskPhase::Open);
}

TEST_F(OnScreenKeyboardTest, EditingWhileClosedIsIgnored)
{
    keyboard.appendText("x");
    keyboard.backspace();
    keyboard.clear();
    EXPECT_FALSE(keyboard.submit());
    EXPECT_TRUE(keyboard.getBuffer().empty());
    EXPECT_EQ(feedback.navSounds, 0);
}

TEST_F(OnScreenKeyboardTest, ControllerButtonsEditTheBuffer)
{
    keyboard.open();

    // Focus starts on "1"; A types it, Y adds a space, X removes it again
    keyboard.handleInput(framePressing({LogicalInput::A}));
    keyboard.handleInput(framePressing({LogicalInput::Y}));
    EXPECT_EQ(keyboard.getBuffer(), "1 ");
    keyboard.handleInput(framePressing({LogicalInput::X}));
    EXPECT_EQ(keyboard.getBuffer(), "1");
    EXPECT_EQ(feedback.selectSounds, 1);

    keyboard.handleInput(framePressing({LogicalInput::Right}));
    keyboard.handleInput(framePressing({LogicalInput::A}));
    EXPECT_EQ(keyboard.getBuffer(), "12");

    keyboard.handleInput(framePressing({LogicalInput::LB}));
    EXPECT_TRUE(keyboard.getBuffer().empty());
}

TEST_F(OnScreenKeyboardTest, DownMovesToNextKeyRow)
{
    keyboard.open();
    keyboard.handleInput(framePressing({LogicalInput::Down}));
    keyboard.handleInput(framePressing({LogicalInput::A}));
    EXPECT_EQ(keyboard.getBuffer(), "q");
}

TEST_F(OnScreenKeyboardTest, RightBumperSubmitsAndStopsFrame)
{
    keyboard.open();
    keyboard.appendText("news");

    // A after RB in the same frame must not reach the keys
    keyboard.handleInput(framePressing({LogicalInput::RB, LogicalInput::A}));
    ASSERT_EQ(searches.size(), 1u);
    EXPECT_EQ(searches[0], "news");
    EXPECT_EQ(keys[0]->activations, 0);
}

TEST_F(OnScreenKeyboardTest, BButtonCloses)
{
    keyboard.open();
    keyboard.handleInput(framePressing({LogicalInput::B}));
    EXPECT_FALSE(keyboard.isVisible());
    EXPECT_EQ(state.lastOutcome, OskOutcome::Cancelled);
}

TEST_F(OnScreenKeyboardTest, PhysicalKeysMirrorTheKeyboard)
{
    keyboard.open();
    EXPECT_TRUE(keyboard.handleKey(KeyPress{KeyCode::Character, "a"}));
    EXPECT_TRUE(keyboard.handleKey(KeyPress{KeyCode::Space, ""}));
    EXPECT_TRUE(keyboard.handleKey(KeyPress{KeyCode::Character, "b"}));
    EXPECT_TRUE(keyboard.handleKey(KeyPress{KeyCode::Backspace, ""}));
    EXPECT_EQ(keyboard.getBuffer(), "a ");

    EXPECT_TRUE(keyboard.handleKey(KeyPress{KeyCode::Enter, ""}));
    ASSERT_EQ(searches.size(), 1u);
    EXPECT_EQ(searches[0], "a");

    EXPECT_FALSE(keyboard.handleKey(KeyPress{KeyCode::Character, "z"}));
}

TEST_F(OnScreenKeyboardTest, EscapeClosesFromPhysicalKeyboard)
{
    keyboard.open();
    keyboard.handleKey(KeyPress{KeyCode::Escape, ""});
    EXPECT_FALSE(keyboard.isVisible());
}

TEST_F(OnScreenKeyboardTest, LayoutKeysCoverEveryAction)
{
    const auto& layout = OnScreenKeyboard::layout();
    int actions = 0;
    for (const OskKey& key : layout)
    {
        if (key.kind != OskKeyKind::Character)
            ++actions;
    }
    EXPECT_EQ(actions, 5);
    EXPECT_EQ(layout.front().label, "1");

    keyboard.open();
    for (const OskKey& key : layout)
    {
        if (key.label == ".com")
            keyboard.pressKey(key);
    }
    EXPECT_EQ(keyboard.getBuffer(), ".com");
}
