#include <array>
#include <format>

#include <qcorosignal.h>

#include "DownloadJob.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const DownloadJob& job, bool json) {
    if (json) {
        return make_pair(true, format(R"("download":"{}")", job.modelInfo().id));
    }

    return make_pair(false, format("DownloadJob{{model={}}}", job.modelInfo().id));
}
} // logfault ns

ostream& operator << (ostream& os, DownloadJob::State state) {
    constexpr auto states = to_array<string_view>({
        "Running",
        "Succeeded",
        "Failed",
        "Cancelled"
    });

    return os << states.at(static_cast<size_t>(state));
}

DownloadJob::DownloadJob(const ModelInfo &modelInfo, QObject *parent)
    : QObject(parent)
    , model_info_{modelInfo}
    , model_id_{QString::fromUtf8(modelInfo.id.data(), static_cast<qsizetype>(modelInfo.id.size()))}
{
}

void DownloadJob::cancel()
{
    if (isFinished() || cancel_requested_) {
        return;
    }

    LOG_INFO_EX(*this) << "Cancelling download";
    cancel_requested_ = true;
    if (reply_) {
        reply_->abort();
    }
}

QCoro::Task<bool> DownloadJob::result()
{
    if (!isFinished()) {
        co_await qCoro(this, &DownloadJob::finished);
    }

    co_return state_ == State::Succeeded;
}

void DownloadJob::setReply(QNetworkReply *reply)
{
    reply_ = reply;
}

void DownloadJob::update(qint64 received, qint64 reportedTotal)
{
    if (isFinished()) {
        return;
    }

    if (total_ < 0) {
        if (reportedTotal > 0) {
            total_ = reportedTotal;
        } else if (model_info_.size_bytes > 0) {
            total_ = static_cast<qint64>(model_info_.size_bytes);
        } else {
            // Nothing to report against until we know the size
            return;
        }
        LOG_DEBUG_EX(*this) << "Total size is " << total_ << " bytes";
    }

    // The tick where downloaded == total is reserved for succeed()
    const auto capped = std::min(received, total_ - 1);
    if (capped <= downloaded_) {
        return;
    }

    downloaded_ = capped;
    emit progress(downloaded_, total_);
}

void DownloadJob::succeed(qint64 finalSize)
{
    if (isFinished()) {
        return;
    }

    if (total_ < 0) {
        total_ = finalSize;
    }
    downloaded_ = total_;
    state_ = State::Succeeded;

    LOG_INFO_EX(*this) << "Download completed. " << finalSize << " bytes";
    emit progress(downloaded_, total_);
    emit finished(true, {});
}

void DownloadJob::fail(const QString &why)
{
    if (isFinished()) {
        return;
    }

    state_ = cancel_requested_ ? State::Cancelled : State::Failed;
    error_ = why;

    LOG_WARN_EX(*this) << "Download " << state_ << ": " << why.toStdString();
    emit finished(false, error_);
}

ReplyEventProxy::ReplyEventProxy(QNetworkReply *reply, QObject *parent)
    : QObject(parent)
{
    connect(reply, &QNetworkReply::readyRead,
            this, [this] {
                emit event(Event::ReadyRead);
            });

    connect(reply, &QNetworkReply::finished,
            this, [this] {
                LOG_TRACE_N << "ReplyEventProxy: finished signaled.";
                emit event(Event::Finished);
            });

    connect(reply, &QNetworkReply::errorOccurred,
            this, [this](QNetworkReply::NetworkError code) {
                LOG_TRACE_N << "ReplyEventProxy: errorOccurred signaled: " << static_cast<int>(code);
                emit event(Event::Error);
            });
}
