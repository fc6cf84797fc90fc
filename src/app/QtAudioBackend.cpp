#include <array>

#include "QtAudioBackend.h"
#include "logging.h"

using namespace std;

namespace {

string_view toName(QAudio::Error error) {
    constexpr auto names = to_array<string_view>({
        "NoError",
        "OpenError",
        "IOError",
        "UnderrunError",
        "FatalError"
    });

    const auto ix = static_cast<size_t>(error);
    return ix < names.size() ? names[ix] : "Unknown";
}

QString describe(QAudio::Error error) {
    const auto name = toName(error);
    return QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size()));
}

} // anon ns

QtAudioInput::QtAudioInput(const QAudioDevice &device)
    : device_{device}
    , format_{createWhisperFormat(device)}
{
}

QtAudioInput::~QtAudioInput()
{
    stop();
}

bool QtAudioInput::start(QIODevice *sink)
{
    LOG_DEBUG_N << "Starting audio input '" << device_.description().toStdString()
                << "' at " << format_.sampleRate() << " Hz, "
                << format_.channelCount() << " channel(s)";

    stopping_ = false;
    error_.clear();
    source_ = make_unique<QAudioSource>(device_, format_);

    QObject::connect(source_.get(), &QAudioSource::stateChanged,
                     source_.get(), [this](QAudio::State state) {
        onStateChanged(state);
    });

    source_->start(sink);  // push mode

    if (const auto err = source_->error(); err != QAudio::NoError) {
        error_ = QStringLiteral("Failed to start '%1': %2").arg(device_.description(), describe(err));
        LOG_ERROR_N << error_.toStdString();
        stopping_ = true;
        source_.reset();
        return false;
    }

    return true;
}

void QtAudioInput::stop()
{
    if (!source_) {
        return;
    }

    stopping_ = true;
    source_->stop();
    source_.reset();
}

QAudioFormat QtAudioInput::createWhisperFormat(const QAudioDevice &device)
{
    QAudioFormat format;
    format.setSampleRate(16000);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);

    if (!device.isFormatSupported(format)) {
        format = device.preferredFormat();
        LOG_INFO_N << "16 kHz mono is not supported by '" << device.description().toStdString()
                   << "'. Capturing at " << format.sampleRate() << " Hz, "
                   << format.channelCount() << " channel(s) and converting";
    }
    return format;
}

void QtAudioInput::onStateChanged(QAudio::State state)
{
    if (stopping_ || state != QAudio::StoppedState || !source_) {
        return;
    }

    if (const auto err = source_->error(); err != QAudio::NoError) {
        error_ = QStringLiteral("Audio device '%1' stopped: %2").arg(device_.description(), describe(err));
        LOG_WARN_N << error_.toStdString();
        reportError(error_);
    }
}

QtAudioBackend::QtAudioBackend(QObject *parent)
    : AudioBackend(parent)
{
    connect(&media_devices_, &QMediaDevices::audioInputsChanged, this, [this] {
        LOG_INFO_N << "Audio input devices changed. Now " << QMediaDevices::audioInputs().size() << " device(s)";
        emit inputDevicesChanged();
    });
}

QStringList QtAudioBackend::inputDeviceNames() const
{
    QStringList names;
    for (const auto& dev : QMediaDevices::audioInputs()) {
        names.append(dev.description());
    }
    return names;
}

QString QtAudioBackend::defaultInputDeviceName() const
{
    const auto dev = QMediaDevices::defaultAudioInput();
    return dev.isNull() ? QString{} : dev.description();
}

std::unique_ptr<AudioInput> QtAudioBackend::createInput(const QString &deviceName)
{
    if (deviceName.isEmpty()) {
        const auto dev = QMediaDevices::defaultAudioInput();
        if (dev.isNull()) {
            return {};
        }
        return make_unique<QtAudioInput>(dev);
    }

    for (const auto& dev : QMediaDevices::audioInputs()) {
        if (dev.description() == deviceName) {
            return make_unique<QtAudioInput>(dev);
        }
    }

    return {};
}
