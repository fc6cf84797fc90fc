#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include <QFuture>
#include <QObject>
#include <QPromise>

#include <qcorotask.h>

#include "qdt/WhisperEngine.h"

#include "AppError.h"
#include "AudioBuffer.h"
#include "ModelInfo.h"
#include "Queue.h"
#include "SessionConfig.h"

/*! The outcome of one transcription. */
struct TranscriptionOutcome {
    bool ok{false};
    ErrorKind error{ErrorKind::EngineFailure};
    QString text; // The transcript if ok, else the reason

    static TranscriptionOutcome success(QString text) {
        return {true, ErrorKind::EngineFailure, std::move(text)};
    }

    static TranscriptionOutcome failure(ErrorKind kind, QString why) {
        return {false, kind, std::move(why)};
    }
};

/*! Transcription engine adapter

 Runs all engine calls on its own worker thread, one at a time, and hands the
 results back as futures.

 At most one model is resident. It is loaded the first time a model id is
 used, and the previous one is released first when the id changes.
*/
class Transcriber : public QObject
{
    Q_OBJECT

public:
    using engine_t = std::shared_ptr<qdt::WhisperEngine>;

    Transcriber(engine_t engine, const SessionConfig& config, QObject *parent = nullptr);
    ~Transcriber() override;

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    /*! Transcribes a finished recording with the given model.
     *
     * The buffer is immutable from here on and shared with the worker.
     */
    [[nodiscard]] QCoro::Task<TranscriptionOutcome> transcribe(std::shared_ptr<const AudioBuffer> buffer,
                                                              ModelDescriptor model);

    /*! Makes the model resident in the background, so the next transcription starts right away. */
    [[nodiscard]] QFuture<bool> preload(ModelDescriptor model);

    /*! Releases the resident model. */
    [[nodiscard]] QFuture<bool> unload();

    /*! Id of the resident model, or an empty string. */
    std::string residentModelId() const;

    const engine_t& engine() const noexcept { return engine_; }

    /*! Stops the worker. Pending work is finished first. */
    void stop();

private:
    struct NoModel {};
    struct ResidentModel {
        std::string id;
        std::shared_ptr<qdt::WhisperCtx> ctx;
    };
    using resident_t = std::variant<NoModel, ResidentModel>;

    class Operation {
    public:
        using fn_t = std::function<void()>;

        explicit Operation(fn_t && fn = {}) : fn_{std::move(fn)} {}

        bool isExit() const noexcept { return !fn_; }
        void execute() { fn_(); }

    private:
        fn_t fn_;
    };

    using cmd_queue_t = Queue<std::unique_ptr<Operation>>;

    template <typename T>
    QFuture<T> post(std::function<T()> fn, std::function<T(const QString& why)> onFailure);

    void run() noexcept;

    // Worker thread only
    TranscriptionOutcome transcribeImpl(const AudioBuffer& buffer, const ModelDescriptor& model);
    std::shared_ptr<qdt::WhisperCtx> makeResident(const ModelDescriptor& model, QString& error);
    void release();

    engine_t engine_;
    const SessionConfig& config_;
    bool engine_ready_{false};
    std::atomic_bool stopping_{false};
    resident_t resident_;
    mutable std::mutex mutex_;
    std::string resident_id_;
    cmd_queue_t cmd_queue_;
    std::optional<std::jthread> worker_;
};
