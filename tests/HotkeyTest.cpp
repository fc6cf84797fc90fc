#include <linux/input-event-codes.h>

#include <gtest/gtest.h>

#include "HotkeyListener.h"

using Edge = HotkeyState::Edge;

TEST(Hotkey, parsesDefaultChord) {
    const auto hotkey = parseHotkey("shift+meta+space");
    ASSERT_TRUE(hotkey);
    EXPECT_EQ(hotkey->text, QString{"SHIFT+META+SPACE"});
    ASSERT_EQ(hotkey->parts.size(), 3u);
    EXPECT_EQ(hotkey->parts[0], (Hotkey::part_t{KEY_LEFTSHIFT, KEY_RIGHTSHIFT}));
    EXPECT_EQ(hotkey->parts[2], (Hotkey::part_t{KEY_SPACE}));
}

TEST(Hotkey, parsesLettersDigitsAndFunctionKeys) {
    const auto hotkey = parseHotkey("CTRL + ALT + F9");
    ASSERT_TRUE(hotkey);
    EXPECT_EQ(hotkey->parts[2], (Hotkey::part_t{KEY_F9}));

    EXPECT_EQ(parseHotkey("Q")->parts[0], (Hotkey::part_t{KEY_Q}));
    EXPECT_EQ(parseHotkey("1")->parts[0], (Hotkey::part_t{KEY_1}));
    EXPECT_EQ(parseHotkey("0")->parts[0], (Hotkey::part_t{KEY_0}));
}

TEST(Hotkey, rejectsUnknownKeys) {
    EXPECT_FALSE(parseHotkey(""));
    EXPECT_FALSE(parseHotkey("CTRL+"));
    EXPECT_FALSE(parseHotkey("HYPER+SPACE"));
}

TEST(HotkeyState, pressAndReleaseEdges) {
    HotkeyState state{*parseHotkey("SHIFT+META+SPACE")};

    EXPECT_EQ(state.onKey(KEY_LEFTSHIFT, true), Edge::None);
    EXPECT_EQ(state.onKey(KEY_LEFTMETA, true), Edge::None);
    EXPECT_EQ(state.onKey(KEY_SPACE, true), Edge::Pressed);
    EXPECT_TRUE(state.isHeld());

    // Unrelated keys change nothing while held
    EXPECT_EQ(state.onKey(KEY_A, true), Edge::None);
    EXPECT_EQ(state.onKey(KEY_A, false), Edge::None);

    EXPECT_EQ(state.onKey(KEY_SPACE, false), Edge::Released);
    EXPECT_FALSE(state.isHeld());
    EXPECT_EQ(state.onKey(KEY_LEFTMETA, false), Edge::None);
    EXPECT_EQ(state.onKey(KEY_LEFTSHIFT, false), Edge::None);
}

TEST(HotkeyState, releasingAModifierReleasesTheChord) {
    HotkeyState state{*parseHotkey("SHIFT+META+SPACE")};

    state.onKey(KEY_RIGHTSHIFT, true);
    state.onKey(KEY_RIGHTMETA, true);
    EXPECT_EQ(state.onKey(KEY_SPACE, true), Edge::Pressed);
    EXPECT_EQ(state.onKey(KEY_RIGHTMETA, false), Edge::Released);

    // Pressing it again completes the chord again
    EXPECT_EQ(state.onKey(KEY_LEFTMETA, true), Edge::Pressed);
}

TEST(HotkeyState, eitherSideSatisfiesAModifier) {
    HotkeyState state{*parseHotkey("SHIFT+SPACE")};

    state.onKey(KEY_LEFTSHIFT, true);
    state.onKey(KEY_RIGHTSHIFT, true);
    EXPECT_EQ(state.onKey(KEY_SPACE, true), Edge::Pressed);
    EXPECT_EQ(state.onKey(KEY_LEFTSHIFT, false), Edge::None);
    EXPECT_EQ(state.onKey(KEY_RIGHTSHIFT, false), Edge::Released);
}

TEST(HotkeyState, resetReleasesHeldChord) {
    HotkeyState state{*parseHotkey("F9")};

    EXPECT_EQ(state.reset(), Edge::None);
    EXPECT_EQ(state.onKey(KEY_F9, true), Edge::Pressed);
    EXPECT_EQ(state.reset(), Edge::Released);
    EXPECT_FALSE(state.isHeld());
    EXPECT_EQ(state.onKey(KEY_F9, false), Edge::None);
}

TEST(HotkeyState, chordMaySpanKeyboards) {
    HotkeyState state{*parseHotkey("CTRL+F9")};

    EXPECT_EQ(state.onKey(KEY_LEFTCTRL, true, 1), Edge::None);
    EXPECT_EQ(state.onKey(KEY_F9, true, 2), Edge::Pressed);
    EXPECT_EQ(state.onKey(KEY_LEFTCTRL, false, 1), Edge::Released);
}

TEST(HotkeyState, forgettingAKeyboardKeepsTheOthers) {
    HotkeyState state{*parseHotkey("SHIFT+SPACE")};

    state.onKey(KEY_LEFTSHIFT, true, 1);
    EXPECT_EQ(state.onKey(KEY_SPACE, true, 1), Edge::Pressed);
    state.onKey(KEY_A, true, 2);

    // An unrelated keyboard goes away
    EXPECT_EQ(state.forget(2), Edge::None);
    EXPECT_TRUE(state.isHeld());

    // The keyboard holding the chord goes away
    EXPECT_EQ(state.forget(1), Edge::Released);
    EXPECT_FALSE(state.isHeld());
    EXPECT_EQ(state.forget(1), Edge::None);
}
