#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <vector>

#include <QObject>
#include <QString>

/*! A key chord, like SHIFT+META+SPACE.
 *
 *  Each part is satisfied by any of its key codes, so SHIFT matches both the
 *  left and the right shift key. Codes are Linux input event codes.
 */
struct Hotkey {
    using part_t = std::vector<uint16_t>;

    std::vector<part_t> parts;
    QString text;

    bool empty() const noexcept { return parts.empty(); }
};

/*! Parses a chord like "CTRL+ALT+F9". Case insensitive.
 *
 *  Returns nullopt if a key name is unknown or the chord is empty.
 */
std::optional<Hotkey> parseHotkey(const QString& text);

/*! Turns a stream of key up/down events into chord press and release edges. */
class HotkeyState
{
public:
    enum class Edge {
        None,
        Pressed,
        Released
    };

    explicit HotkeyState(Hotkey hotkey);

    /*! Feed one key event. Auto-repeat events must be filtered out by the caller.
     *
     *  @param source Identifies the keyboard. A chord may span keyboards.
     */
    Edge onKey(uint16_t code, bool down, int source = 0);

    /*! Forget the keys held on one keyboard, for example when it is unplugged. */
    Edge forget(int source);

    /*! Forget all keys. Releases the chord if it is held. */
    Edge reset();

    bool isHeld() const noexcept { return held_; }
    const Hotkey& hotkey() const noexcept { return hotkey_; }

private:
    bool satisfied() const;
    bool isDown(uint16_t code) const;
    Edge update();

    const Hotkey hotkey_;
    std::map<int, std::set<uint16_t>> down_;
    bool held_{false};
};

/*! Global hotkey source.
 *
 *  Emits `pressed()` when the chord is completed and `released()` when any of
 *  its keys is let go. Each press is followed by exactly one release.
 */
class HotkeyListener : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;

    /*! Starts listening.
     *
     * @return false if no input source could be opened.
     */
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isActive() const = 0;

signals:
    void pressed();
    void released();
};

std::ostream& operator << (std::ostream& os, HotkeyState::Edge edge);
