#include <memory>

#include <QClipboard>
#include <QGuiApplication>
#include <QProcess>
#include <QSettings>

#include <qcorofuture.h>

#include "AppEngine.h"
#include "AppError.h"
#include "AudioController.h"
#include "EvdevHotkeyListener.h"
#include "ModelMgr.h"
#include "Transcriber.h"

#include "logging.h"

using namespace std;

AppEngine::AppEngine(SessionController& session,
                     ModelMgr& models,
                     AudioController& audio,
                     Transcriber& transcriber,
                     HotkeyListener *hotkey,
                     QObject *parent)
    : QObject(parent)
    , session_{session}
    , models_{models}
    , audio_{audio}
    , transcriber_{transcriber}
    , hotkey_{hotkey}
{
    connect(&session_, &SessionController::recordingStarted, this, &AppEngine::recordingStarted);
    connect(&session_, &SessionController::audioLevel, this, &AppEngine::audioLevel);
    connect(&session_, &SessionController::recordingStopped, this, &AppEngine::recordingStopped);
    connect(&session_, &SessionController::transcriptionStarted, this, &AppEngine::transcriptionStarted);
    connect(&session_, &SessionController::transcriptionComplete, this, &AppEngine::transcriptionComplete);
    connect(&session_, &SessionController::transcriptionError, this, &AppEngine::transcriptionError);

    connect(&models_, &ModelMgr::downloadProgress, this, [this](const QString& id, qint64 downloaded, qint64 total) {
        emit modelDownloadProgress(id, downloaded, total);
        // The id-less event is one job's sequence, the preferred model's
        if (id.toStdString() == models_.selectedModelId()) {
            emit downloadProgress(downloaded, total);
        }
    });
    connect(&models_, &ModelMgr::downloadFailed, this, &AppEngine::modelDownloadError);
    connect(&models_, &ModelMgr::modelDownloaded, this, &AppEngine::modelDownloaded);
    connect(&models_, &ModelMgr::activeModelChanged, this, &AppEngine::activeModelChanged);

    connect(&audio_, &AudioController::inputDevicesChanged, this, &AppEngine::audioDevicesChanged);

    if (hotkey_) {
        connect(hotkey_, &HotkeyListener::pressed, &session_, &SessionController::onHotkeyPressed);
        connect(hotkey_, &HotkeyListener::released, &session_, &SessionController::onHotkeyReleased);
    }
}

bool AppEngine::isModelReady() const
{
    return models_.isModelReady();
}

bool AppEngine::downloadWhisperModel(const QString &modelId)
{
    const auto id = modelId.isEmpty() ? models_.selectedModelId() : modelId.toStdString();

    try {
        auto job = models_.download(id);
        LOG_DEBUG_N << "Download of model " << id << " requested";
        return job != nullptr;
    } catch (const AppError& ex) {
        return failed(ex.reason());
    }
}

bool AppEngine::downloadModelSize(const QString &modelId)
{
    return downloadWhisperModel(modelId);
}

QVariantList AppEngine::getAvailableModels() const
{
    QVariantList list;
    for (const auto& model : models_.listModels()) {
        QVariantMap entry;
        entry["id"] = QString::fromStdString(model.id);
        entry["label"] = QString::fromStdString(model.label);
        entry["isDownloaded"] = model.is_downloaded;
        entry["sizeBytes"] = static_cast<qint64>(model.size_bytes);
        list.append(entry);
    }
    return list;
}

QVariantMap AppEngine::getModelInfo() const
{
    const auto id = models_.selectedModelId();

    QVariantMap info;
    info["activeModelId"] = QString::fromStdString(id);
    info["isDownloaded"] = models_.isDownloaded(id);
    return info;
}

bool AppEngine::setModelSize(const QString &modelId)
{
    try {
        models_.selectModel(modelId.toStdString());
        return true;
    } catch (const AppError& ex) {
        return failed(ex.reason());
    }
}

QStringList AppEngine::getAudioDevices() const
{
    return audio_.inputDevices();
}

QVariant AppEngine::getCurrentDevice() const
{
    if (const auto device = audio_.currentDevice()) {
        return *device;
    }
    return {};
}

bool AppEngine::setAudioDevice(const QVariant &deviceName)
{
    optional<QString> device;
    if (deviceName.isValid() && !deviceName.isNull()) {
        device = deviceName.toString();
    }

    try {
        audio_.setCurrentDevice(device);
        return true;
    } catch (const AppError& ex) {
        return failed(ex.reason());
    }
}

bool AppEngine::checkMicrophonePermission() const
{
    // Linux has no microphone permission. A visible input device is what matters.
    return !audio_.inputDevices().isEmpty();
}

bool AppEngine::checkAccessibilityPermission() const
{
    if (hotkey_ && hotkey_->isActive()) {
        return true;
    }

    const auto devices = QSettings{}.value("hotkey/devices").toString();
    return EvdevHotkeyListener::hasInputAccess(devices.isEmpty()
        ? QStringList{} : devices.split(',', Qt::SkipEmptyParts));
}

bool AppEngine::openMicrophoneSettings()
{
    return openSystemSettings("system/microphone_settings", "gnome-control-center sound");
}

bool AppEngine::openAccessibilitySettings()
{
    return openSystemSettings("system/accessibility_settings", "gnome-control-center universal-access");
}

void AppEngine::closeSettingsWindow()
{
    emit settingsWindowCloseRequested();
}

void AppEngine::startRecording()
{
    session_.onHotkeyPressed();
}

void AppEngine::stopRecording()
{
    session_.onHotkeyReleased();
}

void AppEngine::copyTextToClipboard(const QString &text)
{
    if (auto *clipb = QGuiApplication::clipboard()) {
        clipb->setText(text);
        LOG_DEBUG_N << "Copied " << text.size() << " characters to the clipboard";
    } else {
        LOG_WARN_N << "Clipboard not available";
    }
}

void AppEngine::startup(bool autoDownload)
{
    connect(&models_, &ModelMgr::activeModelChanged, this, [this](const QString& id) {
        if (auto model = models_.findModel(id.toStdString()); model && model->is_downloaded) {
            warmUp(std::move(*model));
        }
    });

    if (auto model = models_.activeModel()) {
        warmUp(std::move(*model));
        return;
    }

    const auto id = models_.selectedModelId();
    if (autoDownload) {
        LOG_INFO_N << "The preferred model " << id << " is not downloaded. Downloading it now.";
        downloadWhisperModel(QString::fromStdString(id));
    } else {
        LOG_WARN_N << "The preferred model " << id << " is not downloaded. "
                   << "Transcription is unavailable until a model is downloaded.";
    }
}

void AppEngine::shutdown()
{
    LOG_INFO_N << "Shutting down";
    if (hotkey_) {
        hotkey_->stop();
    }
    session_.shutdown();
    models_.cancelAll();
}

void AppEngine::initLogging()
{
    QSettings settings{};

    if (!settings.contains("logging/applevel")) {
        settings.setValue("logging/applevel", 4); // INFO
    }

    if (const auto level = settings.value("logging/applevel", 4).toInt()) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, static_cast<logfault::LogLevel>(level)));
        LOG_INFO << "Logging to console";
    }

    auto level = settings.value("logging/level", 0).toInt();
    if (level > 0) {
        if (auto path = settings.value("logging/path", "").toString().toStdString(); !path.empty()) {
            const bool prune = settings.value("logging/prune", "").toString() == "true";
            logfault::LogManager::Instance().AddHandler(
                make_unique<logfault::StreamHandler>(path, static_cast<logfault::LogLevel>(level), prune));

            LOG_INFO << "Logging to: " << path;
        }
    }
}

QCoro::Task<void> AppEngine::warmUp(ModelDescriptor model)
{
    const auto id = model.id;
    if (transcriber_.residentModelId() == id) {
        co_return;
    }

    LOG_DEBUG_N << "Loading model " << id << " in the background";
    if (co_await transcriber_.preload(std::move(model))) {
        LOG_INFO_N << "Model " << id << " is loaded and ready";
    } else {
        LOG_WARN_N << "Failed to pre-load model " << id << ". It will be loaded on first use.";
    }
}

bool AppEngine::openSystemSettings(const char *key, const char *defaultCommand)
{
    const auto command = QSettings{}.value(key, QString::fromUtf8(defaultCommand)).toString();
    auto args = QProcess::splitCommand(command);
    if (args.isEmpty()) {
        return failed(tr("No command is configured for %1").arg(QString::fromUtf8(key)));
    }

    const auto program = args.takeFirst();
    if (!QProcess::startDetached(program, args)) {
        return failed(tr("Failed to start '%1'").arg(command));
    }

    LOG_DEBUG_N << "Started " << command.toStdString();
    return true;
}

bool AppEngine::failed(const QString &reason)
{
    LOG_WARN_N << reason.toStdString();
    emit errorOccurred(reason);
    return false;
}
