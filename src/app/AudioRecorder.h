#pragma once

#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <QObject>

#include "AudioBuffer.h"
#include "AudioCaptureDevice.h"
#include "AudioInput.h"

class AudioController;

/*! Audio capture engine

 Opens the selected input, receives fixed size chunks from the capture sink on
 a collector thread and appends them, in order, to the recording. When the
 capture stops, the mono recording is handed over at the device's sample
 rate. Resampling is left to the transcription worker.

 Signals:
 - levelUpdated(level): Live level in [0, 1] while capturing.
 - captureFailed(reason): The device failed after capture had started.
*/
class AudioRecorder : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Stopped,
        Capturing
    };

    explicit AudioRecorder(AudioController& controller, QObject *parent = nullptr);
    ~AudioRecorder() override;

    State state() const noexcept { return state_;}
    bool isCapturing() const noexcept { return state_ == State::Capturing;}

    /*! Starts capturing from the selected device.
     *
     * Throws AppError(DeviceUnavailable) if the device cannot be opened or started.
     * Does nothing if a capture is already running.
     */
    void startCapture();

    /*! Stops capturing and returns everything captured since startCapture().
     *
     * Returns an empty buffer if nothing is being captured.
     */
    [[nodiscard]] AudioBuffer stopCapture();

    /*! Stops capturing and throws the audio away. */
    void discardCapture();

    QString deviceName() const;

signals:
    void levelUpdated(float level);
    void captureFailed(const QString& reason);

private:
    void collect();
    void teardown();
    void setState(State state);

    AudioController& controller_;
    std::unique_ptr<AudioInput> input_;
    std::unique_ptr<chunk_queue_t> queue_;
    std::unique_ptr<AudioCaptureDevice> sink_;
    std::optional<std::jthread> collector_;
    // Only touched by the collector while it runs
    std::vector<float> samples_;
    int device_rate_{TRANSCRIBE_SAMPLE_RATE};
    State state_{State::Stopped};
};

std::ostream& operator << (std::ostream& os, AudioRecorder::State state);
