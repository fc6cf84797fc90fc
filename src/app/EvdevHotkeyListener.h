#pragma once

#include <memory>
#include <vector>

#include <QStringList>

#include "HotkeyListener.h"

class QSocketNotifier;

/*! Hotkey listener reading keyboard events from /dev/input.
 *
 *  Works under X11, Wayland and on the console, as long as the user can read
 *  the event devices (usually by being a member of the "input" group).
 *  The key events are observed, not grabbed.
 */
class EvdevHotkeyListener : public HotkeyListener
{
    Q_OBJECT

public:
    /*! @param devices Event device paths. If empty, all keyboards are used. */
    EvdevHotkeyListener(Hotkey hotkey, QStringList devices = {}, QObject *parent = nullptr);
    ~EvdevHotkeyListener() override;

    bool start() override;
    void stop() override;
    bool isActive() const override { return !devices_.empty(); }

    /*! True if at least one keyboard event device can be opened for reading. */
    static bool hasInputAccess(const QStringList& devices = {});

    static QStringList eventDevicePaths();

private:
    struct Device {
        ~Device();

        QString path;
        int fd{-1};
        std::unique_ptr<QSocketNotifier> notifier;
    };

    void onReadable(Device& device);
    void drop(Device& device);
    void apply(HotkeyState::Edge edge);

    HotkeyState state_;
    const QStringList device_paths_;
    std::vector<std::unique_ptr<Device>> devices_;
};
