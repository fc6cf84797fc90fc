#pragma once

#include <memory>

#include <QAudioDevice>
#include <QAudioSource>
#include <QMediaDevices>

#include "AudioInput.h"

/*! Audio input using QAudioSource in push mode. */
class QtAudioInput final : public AudioInput
{
public:
    explicit QtAudioInput(const QAudioDevice& device);
    ~QtAudioInput() override;

    QString deviceName() const override {
        return device_.description();
    }

    QAudioFormat format() const override {
        return format_;
    }

    bool start(QIODevice *sink) override;
    void stop() override;
    QString errorString() const override {
        return error_;
    }

private:
    static QAudioFormat createWhisperFormat(const QAudioDevice &device);
    void onStateChanged(QAudio::State state);

    QAudioDevice device_;
    QAudioFormat format_;
    std::unique_ptr<QAudioSource> source_;
    QString error_;
    bool stopping_{false};
};

/*! Devices as seen by QMediaDevices. */
class QtAudioBackend final : public AudioBackend
{
    Q_OBJECT

public:
    explicit QtAudioBackend(QObject *parent = nullptr);

    QStringList inputDeviceNames() const override;
    QString defaultInputDeviceName() const override;
    std::unique_ptr<AudioInput> createInput(const QString& deviceName) override;

private:
    QMediaDevices media_devices_;
};
