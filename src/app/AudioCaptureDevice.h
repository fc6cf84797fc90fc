#pragma once

#include <atomic>
#include <deque>
#include <vector>

#include <QAudioFormat>
#include <QByteArray>
#include <QIODevice>

#include "AudioBuffer.h"
#include "Queue.h"

using chunk_queue_t = Queue<AudioChunk>;

/*! Sink for the audio input.
 *
 *  writeData() runs in the audio delivery context. It only converts the PCM,
 *  cuts it into fixed size chunks and hands them to the queue. It never blocks:
 *  if the queue is full, chunks wait in a local backlog until the next write
 *  or close(). No audio is dropped.
 *
 *  Levels are delivered to the owner's thread. If the consumer falls behind,
 *  intermediate levels are skipped.
 */
class AudioCaptureDevice : public QIODevice
{
    Q_OBJECT
public:
    AudioCaptureDevice(const QAudioFormat& format, chunk_queue_t& queue, QObject *parent = nullptr);

    bool open(OpenMode mode) override;

    // Flushes the last partial chunk and the backlog to the queue
    void close() override;

    qint64 framesCaptured() const noexcept {
        return frames_captured_.load();
    }

protected:
    qint64 readData(char *, qint64) override
    {
        return -1;
    }

    qint64 writeData(const char *data, qint64 len) override;

signals:
    void levelUpdated(float level);

private:
    void emitChunk(AudioChunk&& chunk);
    void drainBacklog();
    void publishLevel(float level);

    const QAudioFormat format_;
    chunk_queue_t& queue_;
    const size_t chunk_frames_;
    std::vector<float> current_;
    QByteArray partial_frame_;
    std::deque<AudioChunk> backlog_;
    std::atomic<qint64> frames_captured_{0};
    std::atomic<float> latest_level_{0.0f};
    std::atomic_bool level_posted_{false};
};
