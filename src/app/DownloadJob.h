#pragma once

#include <algorithm>
#include <ostream>

#include <QObject>
#include <QPointer>
#include <QNetworkReply>

#include <qcorotask.h>

#include "ModelInfo.h"

/*! One background transfer of a model artifact.
 *
 *  Owned by ModelMgr while it runs. Everyone who asks ModelMgr to download the
 *  same model while the transfer is active gets the same job, so they all
 *  see the same progress and the same outcome.
 *
 *  Progress ticks are non-decreasing in `downloaded` and constant in `total`.
 *  The tick where downloaded == total is only emitted after the artifact has
 *  been verified and moved into place.
 */
class DownloadJob : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Running,
        Succeeded,
        Failed,
        Cancelled
    };
    Q_ENUM(State)

    explicit DownloadJob(const ModelInfo& modelInfo, QObject *parent = nullptr);

    const ModelInfo& modelInfo() const noexcept { return model_info_; }
    const QString& modelId() const noexcept { return model_id_; }
    State state() const noexcept { return state_; }
    bool isFinished() const noexcept { return state_ != State::Running; }
    bool isCancelled() const noexcept { return cancel_requested_; }
    qint64 bytesDownloaded() const noexcept { return std::max<qint64>(downloaded_, 0); }
    qint64 bytesTotal() const noexcept { return total_; }
    const QString& errorString() const noexcept { return error_; }

    /*! Aborts the transfer. The job finishes with State::Cancelled. */
    void cancel();

    /*! Waits for the job to finish.
     *
     * @return true if the artifact was downloaded and verified.
     */
    QCoro::Task<bool> result();

signals:
    void progress(qint64 downloaded, qint64 total);
    void finished(bool ok, const QString& error);

private:
    friend class ModelMgr;

    void setReply(QNetworkReply *reply);
    void update(qint64 received, qint64 reportedTotal);
    void succeed(qint64 finalSize);
    void fail(const QString& why);

    const ModelInfo model_info_;
    const QString model_id_;
    State state_{State::Running};
    qint64 downloaded_{-1};
    qint64 total_{-1};
    QString error_;
    QPointer<QNetworkReply> reply_;
    bool cancel_requested_{false};
};

std::ostream& operator << (std::ostream& os, DownloadJob::State state);

/*! Turns the reply's signals into one signal, so a coroutine can wait for any of them. */
class ReplyEventProxy : public QObject {
    Q_OBJECT
public:
    enum class Event {
        ReadyRead,
        Finished,
        Error
    };
    Q_ENUM(Event)

    explicit ReplyEventProxy(QNetworkReply *reply, QObject *parent = nullptr);

signals:
    void event(ReplyEventProxy::Event ev);
};
