#include <filesystem>
#include <format>

#include <QCryptographicHash>
#include <QFile>
#include <QFuture>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QScopeGuard>
#include <QSettings>
#include <QStandardPaths>
#include <QTimer>
#include <QtConcurrent/QtConcurrentRun>

#include <qcorofuture.h>
#include <qcorosignal.h>

#include "AppError.h"
#include "ModelMgr.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

namespace {

QString toQString(string_view sv) {
    return QString::fromUtf8(sv.data(), static_cast<qsizetype>(sv.size()));
}

qint64 contentLength(const QNetworkReply& reply) {
    const auto header = reply.header(QNetworkRequest::ContentLengthHeader);
    if (header.isValid()) {
        return header.toLongLong();
    }
    return -1;
}

} // anon ns

ModelMgr::ModelMgr(Config config, model_list_t catalog, QObject *parent)
    : QObject(parent)
    , config_{std::move(config)}
    , catalog_{catalog}
{
    auto selected = QSettings{}.value("models/active", QString::fromStdString(config_.default_model))
                        .toString().trimmed().toStdString();
    if (!findInfo(selected)) {
        LOG_WARN_N << "Unknown model '" << selected << "' in settings. Using '"
                   << config_.default_model << "'";
        selected = config_.default_model;
    }
    selected_model_ = selected;

    LOG_DEBUG_N << "Model directory is " << config_.models_dir
                << ", selected model is '" << selected_model_ << "'";

    removeStalePartials();
}

ModelMgr::~ModelMgr()
{
    cancelAll();
}

ModelMgr::Config ModelMgr::configFromSettings()
{
    QSettings settings;
    Config cfg;

    auto base = settings.value("models/path", "").toString().trimmed();
    if (base.isEmpty()) {
        // This is supposed to be set in main(). This is a fallback.
        LOG_WARN_N << "Model path not set in settings; using default.";
        base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/models";
    }

    cfg.models_dir = base.toStdString();
    cfg.url_base = settings.value("models/url_base", "").toString().trimmed();
    cfg.verify_checksum = settings.value("models/verify_checksum", true).toBool();
    return cfg;
}

model_descriptors_t ModelMgr::listModels() const
{
    model_descriptors_t models;
    models.reserve(catalog_.size());

    for (const auto& mi : catalog_) {
        models.push_back(describe(mi));
    }

    return models;
}

std::optional<ModelDescriptor> ModelMgr::findModel(std::string_view modelId) const
{
    if (const auto *mi = findInfo(modelId)) {
        return describe(*mi);
    }

    return std::nullopt;
}

bool ModelMgr::isDownloaded(std::string_view modelId) const
{
    if (const auto *mi = findInfo(modelId)) {
        error_code ec;
        return filesystem::is_regular_file(modelPath(*mi), ec);
    }

    return false;
}

std::shared_ptr<DownloadJob> ModelMgr::download(std::string_view modelId)
{
    const auto *mi = findInfo(modelId);
    if (!mi) {
        throw AppError{ErrorKind::UnknownModel, format("Unknown model '{}'", modelId)};
    }

    if (auto it = jobs_.find(modelId); it != jobs_.end()) {
        LOG_DEBUG_N << "Joining active download of model '" << modelId << "'";
        return it->second;
    }

    auto job = make_shared<DownloadJob>(*mi);
    jobs_.emplace(string{mi->id}, job);

    connect(job.get(), &DownloadJob::progress, this,
            [this, id = job->modelId()](qint64 downloaded, qint64 total) {
        emit downloadProgress(id, downloaded, total);
    });

    LOG_INFO_N << "Queued download of model '" << modelId << "'";

    // Start from the event loop, so the caller can connect before anything is reported
    QTimer::singleShot(0, this, [this, job] {
        runJob(job);
    });

    return job;
}

std::shared_ptr<DownloadJob> ModelMgr::activeJob(std::string_view modelId) const
{
    if (auto it = jobs_.find(modelId); it != jobs_.end()) {
        return it->second;
    }

    return {};
}

void ModelMgr::selectModel(std::string_view modelId)
{
    const auto *mi = findInfo(modelId);
    if (!mi) {
        throw AppError{ErrorKind::UnknownModel, format("Unknown model '{}'", modelId)};
    }

    if (!isDownloaded(modelId)) {
        throw AppError{ErrorKind::ModelNotDownloaded, format("Model '{}' is not downloaded", modelId)};
    }

    bool changed = false;
    {
        std::lock_guard lock{mutex_};
        changed = selected_model_ != modelId;
        selected_model_ = modelId;
    }

    QSettings{}.setValue("models/active", toQString(mi->id));

    if (changed) {
        LOG_INFO_N << "Active model is now '" << modelId << "'";
        emit activeModelChanged(toQString(mi->id));
    }
}

string ModelMgr::selectedModelId() const
{
    std::lock_guard lock{mutex_};
    return selected_model_;
}

std::optional<ModelDescriptor> ModelMgr::activeModel() const
{
    auto model = findModel(selectedModelId());
    if (model && model->is_downloaded) {
        return model;
    }

    return std::nullopt;
}

bool ModelMgr::isModelReady() const
{
    return activeModel().has_value();
}

void ModelMgr::cancelAll()
{
    // finishJob() removes the job from jobs_
    vector<shared_ptr<DownloadJob>> jobs;
    for (const auto& [id, job] : jobs_) {
        jobs.push_back(job);
    }

    // The transfer coroutines only notice the abort on a later event loop
    // iteration, which never comes when we are shutting down. So the jobs
    // are finished and their partial files removed here.
    for (auto& job : jobs) {
        job->cancel();
        if (job->isFinished()) {
            continue;
        }

        const auto partial = partialPath(job->modelInfo());
        error_code ec;
        if (filesystem::remove(partial, ec)) {
            LOG_DEBUG_N << "Removed partial download " << partial;
        } else if (ec) {
            LOG_WARN_N << "Failed to remove " << partial << ": " << ec.message();
        }

        finishJob(job, tr("Download cancelled"));
    }
}

std::filesystem::path ModelMgr::modelPath(const ModelInfo &modelInfo) const
{
    return config_.models_dir / modelInfo.filename;
}

std::filesystem::path ModelMgr::partialPath(const ModelInfo &modelInfo) const
{
    auto path = modelPath(modelInfo);
    path += ".part";
    return path;
}

const ModelInfo *ModelMgr::findInfo(std::string_view modelId) const noexcept
{
    for (const auto& mi : catalog_) {
        if (mi.id == modelId) {
            return &mi;
        }
    }

    return nullptr;
}

ModelDescriptor ModelMgr::describe(const ModelInfo &modelInfo) const
{
    ModelDescriptor md;
    md.id = modelInfo.id;
    md.label = modelInfo.label;
    md.size_bytes = modelInfo.size_bytes;
    md.local_path = modelPath(modelInfo);
    error_code ec;
    md.is_downloaded = filesystem::is_regular_file(md.local_path, ec);
    return md;
}

QUrl ModelMgr::downloadUrl(const ModelInfo &modelInfo) const
{
    QString surl = config_.url_base.isEmpty() ? toQString(modelInfo.download_url) : config_.url_base;

    if (!config_.url_base.isEmpty() && !surl.endsWith('/')) {
        surl += '/';
    }

    if (surl.endsWith('/')) {
        surl += toQString(modelInfo.filename);
    }

    return QUrl{surl};
}

void ModelMgr::removeStalePartials() const
{
    for (const auto& mi : catalog_) {
        const auto partial = partialPath(mi);
        error_code ec;
        if (filesystem::exists(partial, ec)) {
            LOG_INFO_N << "Removing partial download " << partial;
            filesystem::remove(partial, ec);
            if (ec) {
                LOG_WARN_N << "Failed to remove " << partial << ": " << ec.message();
            }
        }
    }
}

QCoro::Task<void> ModelMgr::runJob(std::shared_ptr<DownloadJob> job)
{
    const auto& mi = job->modelInfo();
    const auto path = modelPath(mi);

    if (job->isCancelled()) {
        finishJob(job, tr("Download cancelled"));
        co_return;
    }

    error_code ec;
    if (filesystem::is_regular_file(path, ec)) {
        LOG_DEBUG_N << "Model file already exists on disk: " << path;
        const auto size = filesystem::file_size(path, ec);
        jobs_.erase(string{mi.id});
        job->succeed(ec ? 0 : static_cast<qint64>(size));
        co_return;
    }

    filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        finishJob(job, tr("Cannot create directory %1: %2")
                           .arg(QString::fromStdString(path.parent_path().string()),
                                QString::fromStdString(ec.message())));
        co_return;
    }

    const auto url = downloadUrl(mi);
    LOG_INFO_N << "Starting download of model '" << mi.id
               << "' from " << url.toString().toStdString()
               << " to " << path;

    const ScopedTimer timer;
    QPointer<ModelMgr> self{this};
    const auto error = co_await downloadFile(*job, url, QString::fromStdString(path.string()));
    if (!self) {
        LOG_DEBUG << "Download of model '" << mi.id << "' ended after the model manager was deleted";
        co_return;
    }

    if (!error.isEmpty()) {
        finishJob(job, error);
        co_return;
    }

    const auto size = filesystem::file_size(path, ec);
    LOG_INFO_N << "Model '" << mi.id << "' downloaded in " << timer.elapsed() << " seconds";
    finishJob(job, {}, ec ? 0 : static_cast<qint64>(size));
}

QCoro::Task<QString> ModelMgr::downloadFile(DownloadJob& job, const QUrl &url, const QString &fullPath)
{
    if (!nam_) {
        nam_ = new QNetworkAccessManager(this);
    }

    QPointer<ModelMgr> self{this};
    const QString tmpPath = fullPath + ".part";
    const bool verify = config_.verify_checksum;

    QNetworkRequest request{url};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    QPointer<QNetworkReply> reply = nam_->get(request);
    job.setReply(reply);

    // Ensure reply gets deleted and temp file cleaned up on every exit.
    // The reply is owned by nam_, so it is gone if we are.
    const auto guard = qScopeGuard([reply, tmpPath] {
        if (reply) {
            reply->deleteLater();
        }
        if (QFile::exists(tmpPath)) {
            LOG_DEBUG_N << "Removing temporary file: " << tmpPath.toStdString();
            QFile::remove(tmpPath);
        }
    });

    QFile out(tmpPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        reply->abort();
        co_return tr("Cannot write %1: %2").arg(tmpPath, out.errorString());
    }

    bool write_error = false;
    qint64 written = 0;

    ReplyEventProxy proxy{reply};

    auto drainToFile = [&](QNetworkReply *r) {
        while (r->bytesAvailable() > 0) {
            const QByteArray chunk = r->read(64 * 1024);
            if (chunk.isEmpty()) {
                break;
            }

            if (out.write(chunk) != chunk.size()) {
                write_error = true;
                r->abort();
                break;
            }
            written += chunk.size();
        }
        job.update(written, contentLength(*r));
    };

    auto replyError = [&] {
        return job.isCancelled() || !reply ? tr("Download cancelled") : reply->errorString();
    };

    while (true) {
        drainToFile(reply);
        if (write_error) {
            LOG_ERROR_N << "Disk write error during download of " << url.toString().toStdString();
            co_return tr("Disk write error: %1").arg(out.errorString());
        }

        if (reply->error() != QNetworkReply::NoError) {
            LOG_ERROR_N << "Download error detected: " << reply->errorString().toStdString();
            co_return replyError();
        }

        if (reply->isFinished() && reply->bytesAvailable() == 0) {
            LOG_TRACE_N << "Download finished.";
            break;
        }

        const auto ev = co_await qCoro(&proxy, &ReplyEventProxy::event);
        if (!self || !reply || job.isFinished()) {
            co_return tr("Download cancelled");
        }

        if (ev == ReplyEventProxy::Event::Error) {
            LOG_ERROR_N << "Download error signaled: " << reply->errorString().toStdString();
            co_return replyError();
        }
    }

    out.close();

    if (url.scheme().startsWith("http")) {
        const int http_status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (http_status < 200 || http_status >= 300) {
            LOG_ERROR_N << "Download of " << url.toString().toStdString() << " failed with HTTP status " << http_status;
            co_return tr("HTTP status %1").arg(http_status);
        }
    }

    if (const auto& mi = job.modelInfo(); verify && !mi.sha.empty()) {
        const auto expected = toQString(mi.sha);
        const ScopedTimer timer;
        const QString actual = co_await QtConcurrent::run([tmpPath]() -> QString {
            QFile file{tmpPath};
            if (!file.open(QIODevice::ReadOnly)) {
                return {};
            }

            QCryptographicHash hash{QCryptographicHash::Sha1};
            if (!hash.addData(&file)) {
                return {};
            }
            return QString::fromLatin1(hash.result().toHex());
        });

        if (!self || job.isCancelled()) {
            co_return tr("Download cancelled");
        }

        LOG_DEBUG_N << "Checksum of " << tmpPath.toStdString() << " computed in " << timer.elapsed() << " seconds";
        if (actual.compare(expected, Qt::CaseInsensitive) != 0) {
            LOG_ERROR_N << "Checksum mismatch for model '" << mi.id << "': expected "
                        << expected.toStdString() << ", got " << actual.toStdString();
            co_return tr("Checksum mismatch for %1").arg(toQString(mi.filename));
        }
    }

    if (job.isCancelled()) {
        co_return tr("Download cancelled");
    }

    if (!QFile::rename(tmpPath, fullPath)) {
        LOG_ERROR_N << "Failed to rename temporary file " << tmpPath.toStdString()
                    << " to final path " << fullPath.toStdString();
        co_return tr("Cannot move download into place at %1").arg(fullPath);
    }

    LOG_DEBUG_N << "File downloaded successfully: " << fullPath.toStdString();
    co_return QString{};
}

void ModelMgr::finishJob(const std::shared_ptr<DownloadJob> &job, const QString &error, qint64 size)
{
    if (job->isFinished()) {
        return;
    }

    const auto id = job->modelId();
    const auto key = id.toStdString();

    // Gone from jobs_ before anyone hears about it, so a retry starts a new transfer
    if (auto it = jobs_.find(key); it != jobs_.end() && it->second == job) {
        jobs_.erase(it);
    }

    if (!error.isEmpty()) {
        job->fail(formatReason(ErrorKind::DownloadFailure, error));
        emit downloadFailed(id, job->errorString());
        return;
    }

    job->succeed(size);
    emit modelDownloaded(id);

    if (key == selectedModelId()) {
        LOG_INFO_N << "Selected model '" << key << "' is now available";
        emit activeModelChanged(id);
    }
}
