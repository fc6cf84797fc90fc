#pragma once

#include <memory>
#include <span>
#include <vector>

#include <QAudioFormat>
#include <QIODevice>

#include "AudioInput.h"

namespace qdt_test {

/*! What the test sees of the input that is currently open. */
struct FakeChannel {
    class FakeAudioInput *input{};
    QIODevice *sink{};
    int opened{0};
    QString last_device;
};

class FakeAudioInput final : public AudioInput
{
public:
    FakeAudioInput(QString name, QAudioFormat format, std::shared_ptr<FakeChannel> channel, bool canStart)
        : name_{std::move(name)}, format_{format}, channel_{std::move(channel)}, can_start_{canStart}
    {
        channel_->input = this;
        channel_->last_device = name_;
        ++channel_->opened;
    }

    ~FakeAudioInput() override {
        if (channel_->input == this) {
            channel_->input = nullptr;
            channel_->sink = nullptr;
        }
    }

    QString deviceName() const override { return name_; }
    QAudioFormat format() const override { return format_; }

    bool start(QIODevice *sink) override {
        if (!can_start_) {
            error_ = "The device is busy";
            return false;
        }
        channel_->sink = sink;
        return true;
    }

    void stop() override {
        channel_->sink = nullptr;
    }

    QString errorString() const override { return error_; }

    void fail(const QString& why) {
        reportError(why);
    }

private:
    const QString name_;
    const QAudioFormat format_;
    std::shared_ptr<FakeChannel> channel_;
    const bool can_start_;
    QString error_;
};

/*! Audio backend with scripted devices. The test feeds PCM into the open input. */
class FakeAudioBackend final : public AudioBackend
{
public:
    explicit FakeAudioBackend(QStringList devices = {"Built-in Microphone", "USB Headset"})
        : devices_{std::move(devices)}
    {
        format_.setSampleRate(16000);
        format_.setChannelCount(1);
        format_.setSampleFormat(QAudioFormat::Int16);
    }

    QStringList inputDeviceNames() const override { return devices_; }

    QString defaultInputDeviceName() const override {
        return devices_.isEmpty() ? QString{} : devices_.front();
    }

    std::unique_ptr<AudioInput> createInput(const QString& deviceName) override {
        const auto name = deviceName.isEmpty() ? defaultInputDeviceName() : deviceName;
        if (name.isEmpty() || !devices_.contains(name)) {
            return {};
        }
        return std::make_unique<FakeAudioInput>(name, format_, channel_, can_start_);
    }

    void setDevices(QStringList devices) {
        devices_ = std::move(devices);
        emit inputDevicesChanged();
    }

    void setFormat(const QAudioFormat& format) { format_ = format; }
    void setCanStart(bool canStart) { can_start_ = canStart; }

    /*! Writes PCM to the running input, as the audio callback would. */
    bool feed(std::span<const int16_t> pcm) {
        if (!channel_->sink) {
            return false;
        }
        const auto bytes = static_cast<qint64>(pcm.size_bytes());
        return channel_->sink->write(reinterpret_cast<const char *>(pcm.data()), bytes) == bytes;
    }

    bool feedRaw(const QByteArray& data) {
        if (!channel_->sink) {
            return false;
        }
        return channel_->sink->write(data) == data.size();
    }

    void failDevice(const QString& why) {
        if (channel_->input) {
            channel_->input->fail(why);
        }
    }

    bool isCapturing() const noexcept { return channel_->sink != nullptr; }
    const FakeChannel& channel() const noexcept { return *channel_; }

private:
    QStringList devices_;
    QAudioFormat format_;
    bool can_start_{true};
    std::shared_ptr<FakeChannel> channel_ = std::make_shared<FakeChannel>();
};

} // ns
