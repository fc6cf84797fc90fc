#include <cassert>
#include <format>

#include <QSettings>

#include "AppError.h"
#include "AudioController.h"
#include "logging.h"

using namespace std;

AudioController::AudioController(std::unique_ptr<AudioBackend> backend, QObject *parent)
    : QObject(parent), backend_{std::move(backend)}
{
    assert(backend_);

    if (const auto saved = QSettings{}.value("audio/device").toString(); !saved.isEmpty()) {
        selection_ = saved;
        // It was present when it was chosen
        known_devices_.insert(saved);
    }

    rememberDevices();
    LOG_DEBUG_N << "Available audio input devices: ";
    printDevices();

    connect(backend_.get(), &AudioBackend::inputDevicesChanged, this, [this] {
        rememberDevices();
        printDevices();
        emit inputDevicesChanged();
    });
}

QStringList AudioController::inputDevices() const
{
    return backend_->inputDeviceNames();
}

std::optional<QString> AudioController::currentDevice() const
{
    std::lock_guard lock{mutex_};
    return selection_;
}

void AudioController::setCurrentDevice(const std::optional<QString> &deviceName)
{
    if (deviceName && !deviceName->isEmpty() && !backend_->inputDeviceNames().contains(*deviceName)) {
        throw AppError{ErrorKind::DeviceUnavailable,
                       format("Audio device '{}' is not available", deviceName->toStdString())};
    }

    const std::optional<QString> sel = (deviceName && !deviceName->isEmpty()) ? deviceName : std::nullopt;
    {
        std::lock_guard lock{mutex_};
        if (selection_ == sel) {
            return;
        }
        selection_ = sel;
    }

    QSettings settings;
    if (sel) {
        known_devices_.insert(*sel);
        settings.setValue("audio/device", *sel);
        LOG_INFO_N << "Current audio input device changed to '" << sel->toStdString() << "'";
    } else {
        settings.remove("audio/device");
        LOG_INFO_N << "Current audio input device changed to the system default";
    }

    emit currentDeviceChanged();
}

std::unique_ptr<AudioInput> AudioController::openInput()
{
    const auto names = backend_->inputDeviceNames();
    if (names.isEmpty()) {
        throw AppError{ErrorKind::DeviceUnavailable, "No audio input devices are available"};
    }

    QString name;
    if (const auto sel = currentDevice()) {
        if (names.contains(*sel)) {
            name = *sel;
        } else if (known_devices_.contains(*sel)) {
            LOG_WARN_N << "Audio device '" << sel->toStdString()
                       << "' has disappeared. Using the system default";
        } else {
            throw AppError{ErrorKind::DeviceUnavailable,
                           format("Audio device '{}' is not available", sel->toStdString())};
        }
    }

    auto input = backend_->createInput(name);
    if (!input) {
        throw AppError{ErrorKind::DeviceUnavailable,
                       name.isEmpty() ? string{"No default audio input device"}
                                      : format("Cannot open audio device '{}'", name.toStdString())};
    }

    LOG_DEBUG_N << "Opened audio input '" << input->deviceName().toStdString() << "'";
    return input;
}

void AudioController::rememberDevices()
{
    for (const auto& name : backend_->inputDeviceNames()) {
        known_devices_.insert(name);
    }
}

void AudioController::printDevices() const
{
    const auto current = currentDevice();
    const auto def = backend_->defaultInputDeviceName();
    auto ix = 0u;
    for (const auto &name : backend_->inputDeviceNames()) {
        const bool is_current = current ? (name == *current) : (name == def);
        LOG_DEBUG_N << "  #" << ix << (is_current ? " * " : " : ") << name.toStdString();
        ++ix;
    }
}
