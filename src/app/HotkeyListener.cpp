#include <algorithm>
#include <array>
#include <map>
#include <string_view>

#include <linux/input-event-codes.h>

#include "HotkeyListener.h"

using namespace std;

namespace {

const map<QString, Hotkey::part_t>& keyNames() {
    static const map<QString, Hotkey::part_t> names = [] {
        map<QString, Hotkey::part_t> m = {
            {"SHIFT",       {KEY_LEFTSHIFT, KEY_RIGHTSHIFT}},
            {"LSHIFT",      {KEY_LEFTSHIFT}},
            {"RSHIFT",      {KEY_RIGHTSHIFT}},
            {"CTRL",        {KEY_LEFTCTRL, KEY_RIGHTCTRL}},
            {"CONTROL",     {KEY_LEFTCTRL, KEY_RIGHTCTRL}},
            {"LCTRL",       {KEY_LEFTCTRL}},
            {"RCTRL",       {KEY_RIGHTCTRL}},
            {"ALT",         {KEY_LEFTALT, KEY_RIGHTALT}},
            {"LALT",        {KEY_LEFTALT}},
            {"RALT",        {KEY_RIGHTALT}},
            {"ALTGR",       {KEY_RIGHTALT}},
            {"META",        {KEY_LEFTMETA, KEY_RIGHTMETA}},
            {"SUPER",       {KEY_LEFTMETA, KEY_RIGHTMETA}},
            {"WIN",         {KEY_LEFTMETA, KEY_RIGHTMETA}},
            {"SPACE",       {KEY_SPACE}},
            {"ENTER",       {KEY_ENTER}},
            {"RETURN",      {KEY_ENTER}},
            {"TAB",         {KEY_TAB}},
            {"ESC",         {KEY_ESC}},
            {"ESCAPE",      {KEY_ESC}},
            {"BACKSPACE",   {KEY_BACKSPACE}},
            {"CAPSLOCK",    {KEY_CAPSLOCK}},
            {"INSERT",      {KEY_INSERT}},
            {"DELETE",      {KEY_DELETE}},
            {"HOME",        {KEY_HOME}},
            {"END",         {KEY_END}},
            {"PAGEUP",      {KEY_PAGEUP}},
            {"PAGEDOWN",    {KEY_PAGEDOWN}},
            {"PAUSE",       {KEY_PAUSE}},
            {"SCROLLLOCK",  {KEY_SCROLLLOCK}},
        };

        // The letter codes follow the keyboard rows, not the alphabet
        constexpr auto letters = to_array<pair<char, uint16_t>>({
            {'A', KEY_A}, {'B', KEY_B}, {'C', KEY_C}, {'D', KEY_D}, {'E', KEY_E},
            {'F', KEY_F}, {'G', KEY_G}, {'H', KEY_H}, {'I', KEY_I}, {'J', KEY_J},
            {'K', KEY_K}, {'L', KEY_L}, {'M', KEY_M}, {'N', KEY_N}, {'O', KEY_O},
            {'P', KEY_P}, {'Q', KEY_Q}, {'R', KEY_R}, {'S', KEY_S}, {'T', KEY_T},
            {'U', KEY_U}, {'V', KEY_V}, {'W', KEY_W}, {'X', KEY_X}, {'Y', KEY_Y},
            {'Z', KEY_Z}
        });
        for (const auto& [ch, code] : letters) {
            m.emplace(QString{QChar::fromLatin1(ch)}, Hotkey::part_t{code});
        }

        constexpr auto digits = to_array<uint16_t>({
            KEY_0, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9
        });
        for (size_t i = 0; i < digits.size(); ++i) {
            m.emplace(QString::number(i), Hotkey::part_t{digits[i]});
        }

        constexpr auto fkeys = to_array<uint16_t>({
            KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6,
            KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12
        });
        for (size_t i = 0; i < fkeys.size(); ++i) {
            m.emplace(QStringLiteral("F%1").arg(i + 1), Hotkey::part_t{fkeys[i]});
        }

        return m;
    }();

    return names;
}

} // anon ns

optional<Hotkey> parseHotkey(const QString &text)
{
    Hotkey hotkey;
    hotkey.text = text.trimmed().toUpper();

    if (hotkey.text.isEmpty()) {
        return {};
    }

    for (const auto& token : hotkey.text.split('+')) {
        const auto name = token.trimmed();
        const auto& names = keyNames();
        const auto it = names.find(name);
        if (it == names.end()) {
            return {};
        }
        hotkey.parts.push_back(it->second);
    }

    return hotkey;
}

HotkeyState::HotkeyState(Hotkey hotkey)
    : hotkey_{std::move(hotkey)}
{
}

HotkeyState::Edge HotkeyState::onKey(uint16_t code, bool down, int source)
{
    if (down) {
        down_[source].insert(code);
    } else if (auto it = down_.find(source); it != down_.end()) {
        it->second.erase(code);
    }

    return update();
}

HotkeyState::Edge HotkeyState::forget(int source)
{
    down_.erase(source);
    return update();
}

HotkeyState::Edge HotkeyState::update()
{
    const auto now = satisfied();
    if (now == held_) {
        return Edge::None;
    }

    held_ = now;
    return held_ ? Edge::Pressed : Edge::Released;
}

HotkeyState::Edge HotkeyState::reset()
{
    down_.clear();
    if (held_) {
        held_ = false;
        return Edge::Released;
    }
    return Edge::None;
}

bool HotkeyState::satisfied() const
{
    if (hotkey_.empty()) {
        return false;
    }

    return ranges::all_of(hotkey_.parts, [this](const Hotkey::part_t& part) {
        return ranges::any_of(part, [this](uint16_t code) {
            return isDown(code);
        });
    });
}

bool HotkeyState::isDown(uint16_t code) const
{
    return ranges::any_of(down_, [code](const auto& keys) {
        return keys.second.contains(code);
    });
}

ostream& operator << (ostream& os, HotkeyState::Edge edge) {
    constexpr auto edges = to_array<string_view>({
        "None",
        "Pressed",
        "Released"
    });

    return os << edges.at(static_cast<size_t>(edge));
}
