#include <span>

#include "AudioCaptureDevice.h"
#include "AudioConverter.h"

#include "logging.h"
using namespace std;

AudioCaptureDevice::AudioCaptureDevice(const QAudioFormat& format, chunk_queue_t& queue, QObject *parent)
    : QIODevice(parent)
    , format_{format}
    , queue_{queue}
    , chunk_frames_{static_cast<size_t>(
          max<qint64>(1, static_cast<qint64>(format.sampleRate()) * CAPTURE_CHUNK_DURATION.count() / 1000))}
{
    current_.reserve(chunk_frames_);
}

bool AudioCaptureDevice::open(OpenMode mode)
{
    LOG_DEBUG_N << "Opening AudioCaptureDevice. Chunks are " << chunk_frames_ << " frames at "
                << format_.sampleRate() << " Hz";
    if (!(mode & WriteOnly)) {
        LOG_ERROR_N << "AudioCaptureDevice can only be opened in WriteOnly mode";
        return false;
    }

    const auto res = QIODevice::open(mode);
    if (!res) {
        LOG_ERROR_N << "Failed to open AudioCaptureDevice";
    }
    return res;
}

void AudioCaptureDevice::close()
{
    if (!isOpen()) {
        return;
    }

    if (!current_.empty()) {
        AudioChunk chunk;
        chunk.samples.swap(current_);
        emitChunk(std::move(chunk));
    }

    // Not a real-time context anymore, so capacity does not apply
    while (!backlog_.empty()) {
        queue_.push(std::move(backlog_.front()));
        backlog_.pop_front();
    }

    LOG_DEBUG_N << "Closing AudioCaptureDevice after " << frames_captured_ << " frames";
    QIODevice::close();
}

qint64 AudioCaptureDevice::writeData(const char *data, qint64 len)
{
    span<const char> pcm{data, static_cast<size_t>(len)};
    const auto before = current_.size();

    // Complete a frame that was split between two writes
    if (!partial_frame_.isEmpty()) {
        const auto missing = min<qint64>(format_.bytesPerFrame() - partial_frame_.size(), len);
        partial_frame_.append(data, missing);
        pcm = pcm.subspan(static_cast<size_t>(missing));
        if (partial_frame_.size() == format_.bytesPerFrame()) {
            appendAsMono({partial_frame_.constData(), static_cast<size_t>(partial_frame_.size())}, format_, current_);
            partial_frame_.clear();
        }
    }

    const auto consumed = appendAsMono(pcm, format_, current_);
    if (consumed < static_cast<qsizetype>(pcm.size())) {
        partial_frame_.append(pcm.data() + consumed, static_cast<qsizetype>(pcm.size()) - consumed);
    }
    frames_captured_ += static_cast<qint64>(current_.size() - before);

    while (current_.size() >= chunk_frames_) {
        AudioChunk chunk;
        chunk.samples.assign(current_.begin(), current_.begin() + static_cast<ptrdiff_t>(chunk_frames_));
        current_.erase(current_.begin(), current_.begin() + static_cast<ptrdiff_t>(chunk_frames_));
        emitChunk(std::move(chunk));
    }

    return len;
}

void AudioCaptureDevice::emitChunk(AudioChunk &&chunk)
{
    chunk.level = audioLevel(chunk.samples);
    const auto level = chunk.level;

    drainBacklog();
    if (!backlog_.empty() || !queue_.tryPush(std::move(chunk))) {
        backlog_.push_back(std::move(chunk));
    }

    publishLevel(level);
}

void AudioCaptureDevice::drainBacklog()
{
    while (!backlog_.empty()) {
        if (!queue_.tryPush(std::move(backlog_.front()))) {
            return;
        }
        backlog_.pop_front();
    }
}

void AudioCaptureDevice::publishLevel(float level)
{
    latest_level_ = level;
    if (level_posted_.exchange(true)) {
        // The previous one is still in flight. It will pick up this value.
        return;
    }

    QMetaObject::invokeMethod(this, [this] {
        level_posted_ = false;
        emit levelUpdated(latest_level_.load());
    }, Qt::QueuedConnection);
}
