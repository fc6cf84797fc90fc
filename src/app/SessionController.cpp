#include <array>
#include <cassert>
#include <format>
#include <sstream>

#include <QPointer>

#include "AudioRecorder.h"
#include "ModelMgr.h"
#include "SessionController.h"
#include "Transcriber.h"

#include "logging.h"

using namespace std;

namespace {
constexpr auto blank_audio_marker = "[BLANK_AUDIO]";
} // anon ns

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const SessionController& sc, bool json) {
    ostringstream state;
    state << sc.state();

    if (json) {
        return make_pair(true, format(R"("session":{}, "state":"{}")", sc.sessionId(), state.str()));
    }

    return make_pair(false, format("Session{{id={}, state={}}}", sc.sessionId(), state.str()));
}
} // logfault ns

ostream& operator << (ostream& os, SessionController::State state) {
    constexpr auto states = to_array<string_view>({
        "Idle",
        "Recording",
        "Processing",
        "Done",
        "Error"
    });

    return os << states.at(static_cast<size_t>(state));
}

SessionController::SessionController(const SessionConfig& config,
                                     AudioRecorder& recorder,
                                     ModelMgr& models,
                                     Transcriber& transcriber,
                                     QObject *parent)
    : QObject(parent)
    , config_{config}
    , recorder_{recorder}
    , models_{models}
    , transcriber_{transcriber}
{
    reset_timer_.setSingleShot(true);
    connect(&reset_timer_, &QTimer::timeout, this, [this] {
        if (state_ == State::Done || state_ == State::Error) {
            setState(State::Idle);
        }
    });

    max_duration_timer_.setSingleShot(true);
    connect(&max_duration_timer_, &QTimer::timeout, this, [this] {
        if (state_ == State::Recording) {
            LOG_INFO_EX(*this) << "Maximum recording duration of "
                               << config_.max_recording.count() << " ms reached";
            finishRecording();
        }
    });

    connect(&recorder_, &AudioRecorder::levelUpdated, this, [this](float level) {
        if (state_ == State::Recording) {
            emit audioLevel(level);
        }
    });

    connect(&recorder_, &AudioRecorder::captureFailed, this, [this](const QString& why) {
        if (state_ == State::Recording) {
            abortRecording(ErrorKind::DeviceUnavailable, why);
        }
    });
}

void SessionController::onHotkeyPressed()
{
    switch (state_) {
    case State::Recording:
    case State::Processing:
        LOG_DEBUG_EX(*this) << "Hotkey pressed while busy. Ignoring.";
        return;
    case State::Done:
    case State::Error:
        reset_timer_.stop();
        setState(State::Idle);
        break;
    case State::Idle:
        break;
    }

    startRecording();
}

void SessionController::onHotkeyReleased()
{
    if (state_ != State::Recording) {
        LOG_TRACE_EX(*this) << "Hotkey released while not recording. Ignoring.";
        return;
    }

    finishRecording();
}

void SessionController::shutdown()
{
    LOG_DEBUG_EX(*this) << "Shutting down";
    reset_timer_.stop();
    max_duration_timer_.stop();

    if (state_ == State::Recording) {
        recorder_.discardCapture();
        emit recordingStopped();
    }

    // A transcription still running belongs to a session that no longer exists
    ++session_id_;
    session_model_.reset();
    started_at_.reset();
    setState(State::Idle);
}

void SessionController::startRecording()
{
    assert(state_ == State::Idle);
    ++session_id_;

    auto model = models_.activeModel();
    if (!model) {
        const auto reason = formatReason(ErrorKind::NoActiveModel,
                                         tr("No transcription model is downloaded and selected"));
        LOG_WARN_EX(*this) << "Cannot start recording: " << reason.toStdString();
        emit transcriptionError(reason);
        return;
    }

    try {
        recorder_.startCapture();
    } catch (const AppError& ex) {
        LOG_WARN_EX(*this) << "Cannot start recording: " << ex.what();
        emit transcriptionError(ex.reason());
        return;
    }

    session_model_ = std::move(model);
    started_at_.emplace();
    setState(State::Recording);
    emit recordingStarted();
    max_duration_timer_.start(config_.max_recording);
}

void SessionController::finishRecording()
{
    max_duration_timer_.stop();
    auto buffer = recorder_.stopCapture();
    emit recordingStopped();

    const auto held = started_at_ ? started_at_->elapsedMs() : chrono::milliseconds{};
    LOG_DEBUG_EX(*this) << "Recording stopped after " << held.count() << " ms with "
                        << buffer.duration().count() << " ms of audio";

    if (buffer.duration() < config_.min_recording) {
        LOG_DEBUG_EX(*this) << "Recording is shorter than " << config_.min_recording.count()
                            << " ms. Not transcribing.";
        setState(State::Idle);
        return;
    }

    assert(session_model_);
    auto model = std::move(*session_model_);
    session_model_.reset();

    setState(State::Processing);
    emit transcriptionStarted();
    process(std::move(buffer), std::move(model), session_id_);
}

void SessionController::abortRecording(ErrorKind kind, const QString &why)
{
    max_duration_timer_.stop();
    recorder_.discardCapture();
    emit recordingStopped();
    session_model_.reset();
    failed(kind, why);
}

QCoro::Task<void> SessionController::process(AudioBuffer buffer, ModelDescriptor model, uint64_t session)
{
    QPointer<SessionController> self{this};

    const auto outcome = co_await transcriber_.transcribe(
        make_shared<const AudioBuffer>(std::move(buffer)), std::move(model));

    if (!self || session != session_id_ || state_ != State::Processing) {
        LOG_DEBUG << "Discarding the result of abandoned session #" << session;
        co_return;
    }

    if (!outcome.ok) {
        failed(outcome.error, outcome.text);
        co_return;
    }

    if (outcome.text.isEmpty() || outcome.text.contains(QLatin1String{blank_audio_marker})) {
        failed(ErrorKind::NoSpeechDetected, tr("No speech detected"));
        co_return;
    }

    done(outcome.text);
}

void SessionController::done(const QString &text)
{
    setState(State::Done);
    emit transcriptionComplete(text);
    scheduleReset();
}

void SessionController::failed(ErrorKind kind, const QString &why)
{
    const auto reason = formatReason(kind, why);
    LOG_WARN_EX(*this) << "Session failed: " << reason.toStdString();
    setState(State::Error);
    emit transcriptionError(reason);
    scheduleReset();
}

void SessionController::setState(State state)
{
    if (state_ != state) {
        LOG_DEBUG_EX(*this) << "State changed from " << state_ << " to " << state;
        state_ = state;
        emit stateChanged(state);
    }
}

void SessionController::scheduleReset()
{
    reset_timer_.start(config_.result_display);
}
