#pragma once

#include <functional>
#include <memory>

#include <QAudioFormat>
#include <QObject>
#include <QString>
#include <QStringList>

class QIODevice;

/*! An opened audio input.
 *
 *  Once started, the input pushes PCM in `format()` into the sink device.
 */
class AudioInput
{
public:
    using error_handler_t = std::function<void(const QString& why)>;

    virtual ~AudioInput() = default;

    virtual QString deviceName() const = 0;
    virtual QAudioFormat format() const = 0;

    /*! Starts delivering audio to `sink`.
     *
     * @return false if the device could not be started. See errorString().
     */
    virtual bool start(QIODevice *sink) = 0;
    virtual void stop() = 0;
    virtual QString errorString() const = 0;

    /*! Called if the device fails after a successful start. */
    void setErrorHandler(error_handler_t handler) {
        error_handler_ = std::move(handler);
    }

protected:
    void reportError(const QString& why) {
        if (error_handler_) {
            error_handler_(why);
        }
    }

private:
    error_handler_t error_handler_;
};

/*! Enumerates input devices and opens them. */
class AudioBackend : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;

    virtual QStringList inputDeviceNames() const = 0;

    /*! Name of the system default input, or an empty string if there is none. */
    virtual QString defaultInputDeviceName() const = 0;

    /*! Opens a device by name. An empty name means the system default.
     *
     * @return nullptr if the device does not exist.
     */
    virtual std::unique_ptr<AudioInput> createInput(const QString& deviceName) = 0;

signals:
    void inputDevicesChanged();
};
