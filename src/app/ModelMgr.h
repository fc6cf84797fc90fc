#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <QObject>
#include <QNetworkAccessManager>
#include <QUrl>

#include <qcorotask.h>

#include "DownloadJob.h"
#include "ModelInfo.h"

/*! Model catalog and download manager

 Knows which model variants exist, which of them are on disk, and which one
 is selected for transcription. Downloads missing models in the background.

 The selection is a preference. It becomes the active model once its artifact
 is on disk. Selecting a model that is not downloaded fails; it never starts
 a download.

 Signals:
 - downloadProgress(modelId, downloaded, total): Every progress tick of every job.
 - downloadFailed(modelId, reason): A job ended without an artifact.
 - modelDownloaded(modelId): An artifact was verified and moved into place.
 - activeModelChanged(modelId): The model to use for transcription changed.
*/
class ModelMgr : public QObject
{
    Q_OBJECT

public:
    struct Config {
        std::filesystem::path models_dir;
        // If set, replaces the catalog's download location
        QString url_base;
        bool verify_checksum{true};
        std::string default_model{"small"};
    };

    explicit ModelMgr(Config config, model_list_t catalog = builtinWhisperModels(), QObject *parent = nullptr);
    ~ModelMgr() override;

    /*! Reads the configuration from QSettings */
    static Config configFromSettings();

    model_descriptors_t listModels() const;
    std::optional<ModelDescriptor> findModel(std::string_view modelId) const;
    bool isDownloaded(std::string_view modelId) const;

    /*! Starts a download, or joins the one already running for the model.
     *
     * The job reports asynchronously, also when the model is already on disk.
     * Throws AppError(UnknownModel) for ids outside the catalog.
     */
    std::shared_ptr<DownloadJob> download(std::string_view modelId);

    /*! The running job for the model, if any. */
    std::shared_ptr<DownloadJob> activeJob(std::string_view modelId) const;

    /*! Makes a downloaded model the active one and persists the choice.
     *
     * Throws AppError(UnknownModel) or AppError(ModelNotDownloaded).
     */
    void selectModel(std::string_view modelId);

    std::string selectedModelId() const;

    /*! The selected model, if it is downloaded. */
    std::optional<ModelDescriptor> activeModel() const;

    bool isModelReady() const;

    /*! Cancels all running downloads.
     *
     * The jobs are finished and their partial files removed before this
     * returns, so it is safe to call when the event loop has stopped.
     */
    void cancelAll();

    std::filesystem::path modelPath(const ModelInfo& modelInfo) const;
    std::filesystem::path partialPath(const ModelInfo& modelInfo) const;

    const Config& config() const noexcept { return config_; }

signals:
    void downloadProgress(const QString& modelId, qint64 downloaded, qint64 total);
    void downloadFailed(const QString& modelId, const QString& reason);
    void modelDownloaded(const QString& modelId);
    void activeModelChanged(const QString& modelId);

private:
    const ModelInfo *findInfo(std::string_view modelId) const noexcept;
    ModelDescriptor describe(const ModelInfo& modelInfo) const;
    QUrl downloadUrl(const ModelInfo& modelInfo) const;
    void removeStalePartials() const;
    QCoro::Task<void> runJob(std::shared_ptr<DownloadJob> job);
    QCoro::Task<QString> downloadFile(DownloadJob& job, const QUrl& url, const QString& fullPath);
    void finishJob(const std::shared_ptr<DownloadJob>& job, const QString& error, qint64 size = 0);

    const Config config_;
    const model_list_t catalog_;
    QNetworkAccessManager *nam_{};
    std::map<std::string, std::shared_ptr<DownloadJob>, std::less<>> jobs_;

    mutable std::mutex mutex_;
    std::string selected_model_;
};
