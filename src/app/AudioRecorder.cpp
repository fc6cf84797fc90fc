#include <array>
#include <format>

#include "AppError.h"
#include "AudioController.h"
#include "AudioRecorder.h"

#include "logging.h"

using namespace std;

namespace {
// Chunks the collector may lag behind before the sink starts to keep a backlog
constexpr size_t queue_capacity = 256;
} // anon ns

ostream& operator << (ostream& os, AudioRecorder::State state) {
    constexpr auto states = to_array<string_view>({
        "Stopped",
        "Capturing"
    });

    return os << states.at(static_cast<size_t>(state));
}

AudioRecorder::AudioRecorder(AudioController& controller, QObject *parent)
    : QObject(parent)
    , controller_{controller}
{}

AudioRecorder::~AudioRecorder()
{
    teardown();
}

void AudioRecorder::startCapture()
{
    LOG_DEBUG_N << "Starting audio capture";
    if (isCapturing()) {
        LOG_DEBUG_N << "Audio capture already running";
        return;
    }

    input_ = controller_.openInput();

    const auto format = input_->format();
    device_rate_ = format.sampleRate();
    samples_.clear();

    queue_ = make_unique<chunk_queue_t>(queue_capacity);
    sink_ = make_unique<AudioCaptureDevice>(format, *queue_);
    connect(sink_.get(), &AudioCaptureDevice::levelUpdated, this, &AudioRecorder::levelUpdated);

    if (!sink_->open(QIODevice::WriteOnly)) {
        teardown();
        throw AppError{ErrorKind::DeviceUnavailable, "Cannot open the capture buffer"};
    }

    collector_.emplace([this] {
        collect();
    });

    input_->setErrorHandler([this](const QString& why) {
        QMetaObject::invokeMethod(this, [this, why] {
            if (isCapturing()) {
                emit captureFailed(why);
            }
        }, Qt::QueuedConnection);
    });

    if (!input_->start(sink_.get())) {
        const auto why = input_->errorString();
        teardown();
        throw AppError{ErrorKind::DeviceUnavailable, why.toStdString()};
    }

    setState(State::Capturing);
}

AudioBuffer AudioRecorder::stopCapture()
{
    if (!isCapturing()) {
        LOG_DEBUG_N << "Audio capture not running";
        return {};
    }

    LOG_DEBUG_N << "Stopping audio capture";
    setState(State::Stopped);
    teardown();

    AudioBuffer buffer;
    buffer.samples = std::move(samples_);
    buffer.sample_rate = device_rate_;
    samples_ = {};

    LOG_DEBUG_N << "Captured " << buffer.duration().count() << " ms of audio ("
                << buffer.samples.size() << " samples at " << buffer.sample_rate << " Hz)";
    return buffer;
}

void AudioRecorder::discardCapture()
{
    if (!isCapturing()) {
        return;
    }

    LOG_DEBUG_N << "Discarding audio capture";
    setState(State::Stopped);
    teardown();
    samples_ = {};
}

QString AudioRecorder::deviceName() const
{
    return input_ ? input_->deviceName() : QString{};
}

void AudioRecorder::collect()
{
    AudioChunk chunk;
    while (queue_->pop(chunk)) {
        samples_.insert(samples_.end(), chunk.samples.begin(), chunk.samples.end());
    }

    LOG_TRACE_N << "Collector done after " << samples_.size() << " samples";
}

void AudioRecorder::teardown()
{
    // Order matters: no writes after the input stops, the sink flushes into the
    // queue, and the collector drains the queue before it exits.
    if (input_) {
        input_->stop();
    }

    if (sink_) {
        sink_->close();
    }

    if (queue_) {
        queue_->stop();
    }

    if (collector_) {
        collector_->join();
        collector_.reset();
    }

    sink_.reset();
    queue_.reset();
    input_.reset();
}

void AudioRecorder::setState(State state)
{
    if (state_ != state) {
        LOG_DEBUG_N << "AudioRecorder state changed from " << state_ << " to " << state;
        state_ = state;
    }
}
