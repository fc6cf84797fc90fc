#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include <QObject>
#include <QSet>
#include <QStringList>

#include "AudioInput.h"

/*! Owns the audio device selection.
 *
 *  The selection is either the system default (nullopt) or a device name.
 *  It is persisted in QSettings under "audio/device".
 *
 *  A selected device that was valid at some point and has since disappeared
 *  falls back to the system default when the next capture starts.
 */
class AudioController : public QObject
{
    Q_OBJECT

public:
    explicit AudioController(std::unique_ptr<AudioBackend> backend, QObject *parent = nullptr);

    QStringList inputDevices() const;

    std::optional<QString> currentDevice() const;

    /*! Changes the selection.
     *
     * Throws AppError(DeviceUnavailable) if the named device is not present.
     */
    void setCurrentDevice(const std::optional<QString>& deviceName);

    /*! Opens the input for the current selection.
     *
     * Throws AppError(DeviceUnavailable) if no usable device exists.
     */
    std::unique_ptr<AudioInput> openInput();

signals:
    void inputDevicesChanged();
    void currentDeviceChanged();

private:
    void rememberDevices();
    void printDevices() const;

    std::unique_ptr<AudioBackend> backend_;
    mutable std::mutex mutex_;
    std::optional<QString> selection_;
    // Devices seen while this process has been running, plus the persisted selection
    QSet<QString> known_devices_;
};
