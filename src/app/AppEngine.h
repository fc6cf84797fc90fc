#pragma once

#include <optional>
#include <string>

#include <QObject>
#include <QStringList>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>

#include <qcorotask.h>

#include "ModelInfo.h"
#include "SessionController.h"

class AudioController;
class HotkeyListener;
class ModelMgr;
class Transcriber;

/*! Command and event bridge

 The single entry point for a presentation layer. Commands are forwarded to
 the components that own the state, and component events are re-emitted
 here. Commands that fail report it with `errorOccurred()` and a false return
 value instead of throwing.
*/
class AppEngine : public QObject
{
    Q_OBJECT

public:
    AppEngine(SessionController& session,
              ModelMgr& models,
              AudioController& audio,
              Transcriber& transcriber,
              HotkeyListener *hotkey = nullptr,
              QObject *parent = nullptr);

    // Models
    Q_INVOKABLE bool isModelReady() const;
    /*! Starts or joins the download of a model. An empty id means the selected model. */
    Q_INVOKABLE bool downloadWhisperModel(const QString& modelId = {});
    Q_INVOKABLE bool downloadModelSize(const QString& modelId);
    Q_INVOKABLE QVariantList getAvailableModels() const;
    Q_INVOKABLE QVariantMap getModelInfo() const;
    Q_INVOKABLE bool setModelSize(const QString& modelId);

    // Audio
    Q_INVOKABLE QStringList getAudioDevices() const;
    /*! The selected device name, or a null QVariant for the system default. */
    Q_INVOKABLE QVariant getCurrentDevice() const;
    Q_INVOKABLE bool setAudioDevice(const QVariant& deviceName);

    // System integration
    Q_INVOKABLE bool checkMicrophonePermission() const;
    Q_INVOKABLE bool checkAccessibilityPermission() const;
    Q_INVOKABLE bool openMicrophoneSettings();
    Q_INVOKABLE bool openAccessibilitySettings();
    Q_INVOKABLE void closeSettingsWindow();

    // Session
    Q_INVOKABLE void startRecording();
    Q_INVOKABLE void stopRecording();
    Q_INVOKABLE static void copyTextToClipboard(const QString& text);

    /*! Warms up the active model and starts the download of a missing preferred model. */
    void startup(bool autoDownload);

    /*! Cancels downloads and drops any recording in progress. */
    void shutdown();

    static void initLogging();

signals:
    void downloadProgress(qint64 downloaded, qint64 total);
    void modelDownloadProgress(const QString& modelId, qint64 downloaded, qint64 total);
    void modelDownloadError(const QString& modelId, const QString& reason);
    void modelDownloaded(const QString& modelId);
    void activeModelChanged(const QString& modelId);
    void recordingStarted();
    void audioLevel(float level);
    void recordingStopped();
    void transcriptionStarted();
    void transcriptionComplete(const QString& text);
    void transcriptionError(const QString& reason);
    void audioDevicesChanged();
    void settingsWindowCloseRequested();
    void errorOccurred(const QString& reason);

private:
    QCoro::Task<void> warmUp(ModelDescriptor model);
    bool openSystemSettings(const char *key, const char *defaultCommand);
    bool failed(const QString& reason);

    SessionController& session_;
    ModelMgr& models_;
    AudioController& audio_;
    Transcriber& transcriber_;
    HotkeyListener *hotkey_{};
};
