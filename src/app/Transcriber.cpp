// logging.h first, so log_wrapper.h sees logfault and provides forwardToLogfault()
#include "logging.h"

#include <cassert>
#include <format>
#include <span>
#include <vector>

#include <qcorofuture.h>

#include "AudioConverter.h"
#include "ScopedTimer.h"
#include "Transcriber.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const Transcriber& t, bool json) {
    const auto model = t.residentModelId();
    if (json) {
        return make_pair(true, format(R"("transcriber":"{}")", model));
    }

    return make_pair(false, format("Transcriber{{model={}}}", model.empty() ? "none" : model));
}
} // logfault ns

Transcriber::Transcriber(engine_t engine, const SessionConfig& config, QObject *parent)
    : QObject(parent)
    , engine_{std::move(engine)}
    , config_{config}
{
    assert(engine_);
    engine_->setLogger(qdt::logfwd::forwardToLogfault,
                       static_cast<qdt::logfwd::Level>(
                           ::logfault::LogManager::Instance().GetLoglevel()));

    worker_ = std::jthread([this] { run(); });
}

Transcriber::~Transcriber()
{
    stop();
}

QCoro::Task<TranscriptionOutcome> Transcriber::transcribe(std::shared_ptr<const AudioBuffer> buffer,
                                                          ModelDescriptor model)
{
    if (!buffer || buffer->empty()) {
        co_return TranscriptionOutcome::failure(ErrorKind::EmptyInput, tr("No audio to transcribe"));
    }

    LOG_DEBUG_EX(*this) << "Queueing transcription of " << buffer->duration().count()
                        << " ms of audio with model '" << model.id << "'";

    auto future = post<TranscriptionOutcome>(
        [this, buffer, model] {
            return transcribeImpl(*buffer, model);
        },
        [](const QString& why) {
            return TranscriptionOutcome::failure(ErrorKind::EngineFailure, why);
        });

    co_return co_await future;
}

QFuture<bool> Transcriber::preload(ModelDescriptor model)
{
    return post<bool>([this, model] {
        QString error;
        if (!makeResident(model, error)) {
            LOG_WARN_EX(*this) << "Failed to preload model '" << model.id << "': " << error.toStdString();
            return false;
        }
        return true;
    }, [](const QString&) {
        return false;
    });
}

QFuture<bool> Transcriber::unload()
{
    return post<bool>([this] {
        release();
        return true;
    }, [](const QString&) {
        return false;
    });
}

std::string Transcriber::residentModelId() const
{
    std::lock_guard lock{mutex_};
    return resident_id_;
}

void Transcriber::stop()
{
    if (!worker_) {
        return;
    }

    LOG_DEBUG_EX(*this) << "Stopping transcription worker...";
    stopping_ = true;
    cmd_queue_.push(make_unique<Operation>());

    if (worker_->joinable()) {
        worker_->join();
    }
    worker_.reset();
    LOG_DEBUG_N << "Transcription worker stopped.";
}

template <typename T>
QFuture<T> Transcriber::post(std::function<T()> fn, std::function<T(const QString&)> onFailure)
{
    auto promise = make_shared<QPromise<T>>();
    promise->start();
    auto future = promise->future();

    if (stopping_) {
        promise->addResult(onFailure(tr("The transcription worker is not running")));
        promise->finish();
        return future;
    }

    cmd_queue_.push(make_unique<Operation>([this, promise, fn = std::move(fn), onFailure = std::move(onFailure)] {
        try {
            promise->addResult(fn());
        } catch (const std::exception& ex) {
            LOG_ERROR_EX(*this) << "Exception in transcription worker: " << ex.what();
            promise->addResult(onFailure(QString::fromUtf8(ex.what())));
        }
        promise->finish();
    }));

    return future;
}

void Transcriber::run() noexcept
{
    LOG_DEBUG_N << "Transcription worker started";

    while (true) {
        cmd_queue_t::type_t op;
        if (!cmd_queue_.pop(op) || !op) {
            LOG_ERROR_N << "No command received, exiting...";
            break;
        }

        if (op->isExit()) {
            LOG_DEBUG_N << "Exit command received";
            break;
        }

        op->execute();
    }

    release();
}

TranscriptionOutcome Transcriber::transcribeImpl(const AudioBuffer &buffer, const ModelDescriptor &model)
{
    const ScopedTimer timer;

    QString error;
    auto ctx = makeResident(model, error);
    if (!ctx) {
        return TranscriptionOutcome::failure(ErrorKind::ModelNotLoaded, error);
    }

    auto session = ctx->createWhisperSession();
    if (!session) {
        const auto why = engine_->lastError();
        return TranscriptionOutcome::failure(ErrorKind::EngineFailure,
            why.empty() ? tr("Failed to create a transcription session") : QString::fromStdString(why));
    }

    qdt::WhisperSessionCtx::WhisperFullParams params;
    params.language = config_.language;
    params.threads = config_.threads;
    params.single_segment = true;
    params.suppress_blank = true;
    params.no_context = true;
    params.print_special = false;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_realtime = false;
    params.abort = &stopping_;

    // Recordings arrive at the device rate
    std::vector<float> resampled;
    std::span<const float> samples = buffer.samples;
    if (buffer.sample_rate != TRANSCRIBE_SAMPLE_RATE) {
        resampled = resampleLinear(buffer.samples, buffer.sample_rate, TRANSCRIBE_SAMPLE_RATE);
        samples = resampled;
        LOG_DEBUG_EX(*this) << "Resampled " << buffer.samples.size() << " samples at "
                            << buffer.sample_rate << " Hz to " << resampled.size();
    }

    qdt::WhisperSessionCtx::Transcript transcript;
    if (!session->whisperFull(samples, params, transcript)) {
        const auto why = engine_->lastError();
        LOG_WARN_EX(*this) << "Inference failed: " << why;
        return TranscriptionOutcome::failure(ErrorKind::EngineFailure,
            why.empty() ? tr("Inference failed") : QString::fromStdString(why));
    }

    auto text = QString::fromStdString(transcript.full_text).trimmed();
    LOG_INFO_EX(*this) << "Transcribed " << buffer.duration().count() << " ms of audio in "
                       << timer.elapsed() << " seconds. " << text.size() << " characters";
    LOG_TRACE_EX(*this) << "Transcript: " << text.toStdString();
    return TranscriptionOutcome::success(std::move(text));
}

std::shared_ptr<qdt::WhisperCtx> Transcriber::makeResident(const ModelDescriptor &model, QString &error)
{
    if (const auto *resident = get_if<ResidentModel>(&resident_); resident && resident->id == model.id) {
        return resident->ctx;
    }

    // Only one model at a time
    release();

    if (!engine_ready_) {
        if (!engine_->init()) {
            error = tr("Failed to initialize %1: %2")
                        .arg(QString::fromStdString(engine_->version()),
                             QString::fromStdString(engine_->lastError()));
            return {};
        }
        engine_ready_ = true;
    }

    qdt::WhisperEngineLoadParams params;
    params.use_gpu = config_.use_gpu;

    const ScopedTimer timer;
    LOG_DEBUG_EX(*this) << "Loading model '" << model.id << "' from " << model.local_path;
    auto ctx = engine_->loadWhisper(model.id, model.local_path, params);
    if (!ctx) {
        const auto why = engine_->lastError();
        error = why.empty() ? tr("Failed to load model %1").arg(QString::fromStdString(model.id))
                            : QString::fromStdString(why);
        LOG_ERROR_EX(*this) << "Failed to load model '" << model.id << "': " << error.toStdString();
        return {};
    }

    resident_ = ResidentModel{model.id, ctx};
    {
        std::lock_guard lock{mutex_};
        resident_id_ = model.id;
    }

    LOG_INFO_EX(*this) << "Model '" << model.id << "' loaded in " << timer.elapsed() << " seconds";
    return ctx;
}

void Transcriber::release()
{
    if (auto *resident = get_if<ResidentModel>(&resident_)) {
        LOG_DEBUG_EX(*this) << "Unloading model '" << resident->id << "'";
        resident_ = NoModel{};
        std::lock_guard lock{mutex_};
        resident_id_.clear();
    }
}
