#include <csignal>
#include <memory>

#include <QGuiApplication>
#include <QSettings>
#include <QStandardPaths>
#include <QTimer>

#include "AppEngine.h"
#include "AudioController.h"
#include "AudioRecorder.h"
#include "EvdevHotkeyListener.h"
#include "ModelMgr.h"
#include "QtAudioBackend.h"
#include "SessionConfig.h"
#include "SessionController.h"
#include "Transcriber.h"
#include "logging.h"

using namespace std;

namespace {
volatile sig_atomic_t quit_requested = 0;

extern "C" void onQuitSignal(int) {
    quit_requested = 1;
}

unique_ptr<HotkeyListener> createHotkeyListener(const QSettings& settings) {
    const auto keys = settings.value("hotkey/keys", "SHIFT+META+SPACE").toString();
    auto hotkey = parseHotkey(keys);
    if (!hotkey) {
        LOG_ERROR << "Invalid hotkey '" << keys.toStdString() << "' in hotkey/keys";
        return {};
    }

    const auto devices = settings.value("hotkey/devices").toString();
    return make_unique<EvdevHotkeyListener>(std::move(*hotkey),
        devices.isEmpty() ? QStringList{} : devices.split(',', Qt::SkipEmptyParts));
}

} // namespace

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    // Set application information
    QCoreApplication::setOrganizationName("The Last Viking LTD");
    QCoreApplication::setApplicationName("QDictate");
    QCoreApplication::setApplicationVersion(APP_VERSION);
    // No window. Quit on signals only.
    QGuiApplication::setQuitOnLastWindowClosed(false);

    QSettings settings;

    if (!settings.contains("models/path")) {
        const auto path = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/models";
        settings.setValue("models/path", path);
    }

    AppEngine::initLogging();

    LOG_INFO << "Starting QDictate " << APP_VERSION;
    LOG_INFO << "Configuration from '" << settings.fileName().toStdString() << "'";

    const auto config = SessionConfig::fromSettings(settings);

    auto engine = qdt::WhisperEngine::create({});
    if (!engine) {
        LOG_ERROR << "Failed to create the transcription engine";
        return 1;
    }

    AudioController audio{make_unique<QtAudioBackend>()};
    AudioRecorder recorder{audio};
    ModelMgr models{ModelMgr::configFromSettings()};
    Transcriber transcriber{engine, config};
    SessionController session{config, recorder, models, transcriber};
    auto hotkey = createHotkeyListener(settings);
    AppEngine bridge{session, models, audio, transcriber, hotkey.get()};

    QObject::connect(&bridge, &AppEngine::transcriptionComplete, &app, [](const QString& text) {
        AppEngine::copyTextToClipboard(text);
    });

    if (!hotkey || !hotkey->start()) {
        LOG_WARN << "The global hotkey is not available. "
                 << "Recording can only be started with the start/stop recording commands.";
    }

    bridge.startup(settings.value("models/auto_download", true).toBool());

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&] {
        bridge.shutdown();
        transcriber.stop();
    });

    signal(SIGINT, onQuitSignal);
    signal(SIGTERM, onQuitSignal);

    QTimer quit_poll;
    QObject::connect(&quit_poll, &QTimer::timeout, &app, [] {
        if (quit_requested) {
            LOG_INFO << "Received a termination signal. Quitting.";
            QCoreApplication::quit();
        }
    });
    quit_poll.start(200);

    return app.exec();
}
