#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

#include <QObject>
#include <QTimer>

#include <qcorotask.h>

#include "AppError.h"
#include "AudioBuffer.h"
#include "ModelInfo.h"
#include "ScopedTimer.h"
#include "SessionConfig.h"

class AudioRecorder;
class ModelMgr;
class Transcriber;

/*! Session controller

 The state machine behind hold-to-talk. Only this class changes session state.

   Idle -> Recording -> Processing -> Done | Error -> Idle

 - A press while Recording or Processing is ignored.
 - A press in Done or Error resets to Idle and starts a new recording.
 - Recordings shorter than the configured minimum go straight back to Idle.
 - Done and Error go back to Idle by themselves after the display window.
 - Every failure after the press ends in an error event and, eventually, Idle.
*/
class SessionController : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Recording,
        Processing,
        Done,
        Error
    };
    Q_ENUM(State)

    SessionController(const SessionConfig& config,
                      AudioRecorder& recorder,
                      ModelMgr& models,
                      Transcriber& transcriber,
                      QObject *parent = nullptr);

    State state() const noexcept { return state_; }

    // Number of the current (or last) session. Starts at 0.
    uint64_t sessionId() const noexcept { return session_id_; }

    void onHotkeyPressed();
    void onHotkeyReleased();

    /*! Drops any recording or pending result and returns to Idle. */
    void shutdown();

signals:
    void stateChanged(SessionController::State state);
    void recordingStarted();
    void audioLevel(float level);
    void recordingStopped();
    void transcriptionStarted();
    void transcriptionComplete(const QString& text);
    void transcriptionError(const QString& reason);

private:
    QCoro::Task<void> process(AudioBuffer buffer, ModelDescriptor model, uint64_t session);
    void startRecording();
    void finishRecording();
    void abortRecording(ErrorKind kind, const QString& why);
    void done(const QString& text);
    void failed(ErrorKind kind, const QString& why);
    void setState(State state);
    void scheduleReset();

    const SessionConfig& config_;
    AudioRecorder& recorder_;
    ModelMgr& models_;
    Transcriber& transcriber_;
    State state_{State::Idle};
    uint64_t session_id_{0};
    std::optional<ScopedTimer> started_at_;
    std::optional<ModelDescriptor> session_model_;
    QTimer reset_timer_;
    QTimer max_duration_timer_;
};

std::ostream& operator << (std::ostream& os, SessionController::State state);
