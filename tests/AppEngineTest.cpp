#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QUrl>

#include <gtest/gtest.h>

#include "AppEngine.h"
#include "AudioController.h"
#include "AudioRecorder.h"
#include "HotkeyListener.h"
#include "ModelMgr.h"
#include "SessionController.h"
#include "TestUtils.h"
#include "Transcriber.h"
#include "fakes/FakeAudioBackend.h"
#include "fakes/FakeWhisperEngine.h"

using namespace std;
using namespace std::chrono_literals;
using namespace qdt_test;

namespace {

constexpr qint64 tiny_size = 64 * 1024;

const ModelInfo test_models[] = {
    {"tiny", "Tiny", "tiny.bin", static_cast<uint64_t>(tiny_size), "", ""},
    {"base", "Base", "base.bin", 1000, "", ""},
    {"small", "Small", "small.bin", static_cast<uint64_t>(tiny_size * 2), "", ""},
};

class FakeHotkeyListener final : public HotkeyListener
{
public:
    bool start() override { active_ = true; return true; }
    void stop() override { active_ = false; }
    bool isActive() const override { return active_; }

    void press() { emit pressed(); }
    void release() { emit released(); }

private:
    bool active_{false};
};

struct Fixture {
    explicit Fixture(bool withModel = true) {
        clearSettings();
        config.result_display = 100ms;

        server = tmp.filePath("server");
        models_dir = tmp.filePath("models");
        QDir{}.mkpath(server);
        QDir{}.mkpath(models_dir);
        write(server + "/tiny.bin", QByteArray(tiny_size, 'm'));
        write(server + "/small.bin", QByteArray(tiny_size * 2, 's'));
        if (withModel) {
            write(models_dir + "/tiny.bin", QByteArray(tiny_size, 'm'));
        }

        auto be = make_unique<FakeAudioBackend>();
        backend = be.get();
        audio = make_unique<AudioController>(std::move(be));
        recorder = make_unique<AudioRecorder>(*audio);

        ModelMgr::Config cfg;
        cfg.models_dir = models_dir.toStdString();
        cfg.url_base = QUrl::fromLocalFile(server).toString();
        cfg.default_model = "tiny";
        models = make_unique<ModelMgr>(std::move(cfg), test_models);

        transcriber = make_unique<Transcriber>(engine, config);
        session = make_unique<SessionController>(config, *recorder, *models, *transcriber);
        bridge = make_unique<AppEngine>(*session, *models, *audio, *transcriber, &hotkey);
    }

    static void write(const QString& path, const QByteArray& data) {
        QFile file{path};
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        EXPECT_EQ(file.write(data), data.size());
    }

    QTemporaryDir tmp;
    QString server;
    QString models_dir;
    SessionConfig config;
    FakeAudioBackend *backend{};
    FakeHotkeyListener hotkey;
    unique_ptr<AudioController> audio;
    unique_ptr<AudioRecorder> recorder;
    unique_ptr<ModelMgr> models;
    shared_ptr<FakeWhisperEngine> engine = make_shared<FakeWhisperEngine>();
    unique_ptr<Transcriber> transcriber;
    unique_ptr<SessionController> session;
    unique_ptr<AppEngine> bridge;
};

} // anon ns

TEST(AppEngine, modelQueries) {
    Fixture f;

    EXPECT_TRUE(f.bridge->isModelReady());

    const auto list = f.bridge->getAvailableModels();
    ASSERT_EQ(list.size(), 3);
    const auto tiny = list.at(0).toMap();
    EXPECT_EQ(tiny["id"].toString(), QString{"tiny"});
    EXPECT_EQ(tiny["label"].toString(), QString{"Tiny"});
    EXPECT_TRUE(tiny["isDownloaded"].toBool());
    EXPECT_FALSE(list.at(1).toMap()["isDownloaded"].toBool());

    const auto info = f.bridge->getModelInfo();
    EXPECT_EQ(info["activeModelId"].toString(), QString{"tiny"});
    EXPECT_TRUE(info["isDownloaded"].toBool());
}

TEST(AppEngine, notReadyWithoutModel) {
    Fixture f{false};

    EXPECT_FALSE(f.bridge->isModelReady());
    const auto info = f.bridge->getModelInfo();
    EXPECT_EQ(info["activeModelId"].toString(), QString{"tiny"});
    EXPECT_FALSE(info["isDownloaded"].toBool());
}

TEST(AppEngine, setModelSizeFailuresAreReported) {
    Fixture f;
    QSignalSpy errors{f.bridge.get(), &AppEngine::errorOccurred};

    EXPECT_FALSE(f.bridge->setModelSize("base"));
    EXPECT_FALSE(f.bridge->setModelSize("huge"));
    ASSERT_EQ(errors.count(), 2);
    EXPECT_TRUE(errors.at(0).at(0).toString().startsWith("ModelNotDownloaded: "));
    EXPECT_TRUE(errors.at(1).at(0).toString().startsWith("UnknownModel: "));

    EXPECT_TRUE(f.bridge->setModelSize("tiny"));
    EXPECT_EQ(errors.count(), 2);
}

TEST(AppEngine, downloadForwardsProgress) {
    Fixture f{false};
    QSignalSpy progress{f.bridge.get(), &AppEngine::downloadProgress};
    QSignalSpy model_progress{f.bridge.get(), &AppEngine::modelDownloadProgress};
    QSignalSpy downloaded{f.bridge.get(), &AppEngine::modelDownloaded};
    QSignalSpy activated{f.bridge.get(), &AppEngine::activeModelChanged};

    // No id means the selected model
    EXPECT_TRUE(f.bridge->downloadWhisperModel());
    EXPECT_TRUE(waitUntil([&] { return downloaded.count() == 1; }));

    ASSERT_GT(progress.count(), 0);
    EXPECT_EQ(progress.count(), model_progress.count());
    EXPECT_EQ(progress.last().at(0).toLongLong(), tiny_size);
    EXPECT_EQ(progress.last().at(1).toLongLong(), tiny_size);
    EXPECT_EQ(model_progress.last().at(0).toString(), QString{"tiny"});
    EXPECT_EQ(activated.count(), 1);
    EXPECT_TRUE(f.bridge->isModelReady());
}

TEST(AppEngine, progressWithoutIdFollowsThePreferredModel) {
    Fixture f{false};
    QSignalSpy progress{f.bridge.get(), &AppEngine::downloadProgress};
    QSignalSpy model_progress{f.bridge.get(), &AppEngine::modelDownloadProgress};
    QSignalSpy downloaded{f.bridge.get(), &AppEngine::modelDownloaded};

    EXPECT_TRUE(f.bridge->downloadModelSize("small"));
    EXPECT_TRUE(f.bridge->downloadWhisperModel());
    EXPECT_TRUE(waitUntil([&] { return downloaded.count() == 2; }));

    bool saw_small = false;
    for (const auto& args : model_progress) {
        saw_small |= args.at(0).toString() == QString{"small"};
    }
    EXPECT_TRUE(saw_small);

    ASSERT_GT(progress.count(), 0);
    EXPECT_LT(progress.count(), model_progress.count());
    qint64 last = -1;
    for (const auto& args : progress) {
        EXPECT_EQ(args.at(1).toLongLong(), tiny_size);
        EXPECT_GE(args.at(0).toLongLong(), last);
        last = args.at(0).toLongLong();
    }
    EXPECT_EQ(last, tiny_size);
}

TEST(AppEngine, downloadErrorsAreReported) {
    Fixture f;
    QSignalSpy download_errors{f.bridge.get(), &AppEngine::modelDownloadError};
    QSignalSpy errors{f.bridge.get(), &AppEngine::errorOccurred};

    EXPECT_FALSE(f.bridge->downloadModelSize("huge"));
    ASSERT_EQ(errors.count(), 1);
    EXPECT_TRUE(errors.first().at(0).toString().startsWith("UnknownModel: "));

    // base.bin is not on the server
    EXPECT_TRUE(f.bridge->downloadModelSize("base"));
    EXPECT_TRUE(waitUntil([&] { return download_errors.count() == 1; }));
    EXPECT_EQ(download_errors.first().at(0).toString(), QString{"base"});
    EXPECT_TRUE(download_errors.first().at(1).toString().startsWith("DownloadFailure: "));
}

TEST(AppEngine, audioDevices) {
    Fixture f;
    QSignalSpy errors{f.bridge.get(), &AppEngine::errorOccurred};
    QSignalSpy devices_changed{f.bridge.get(), &AppEngine::audioDevicesChanged};

    EXPECT_EQ(f.bridge->getAudioDevices(), (QStringList{"Built-in Microphone", "USB Headset"}));
    EXPECT_TRUE(f.bridge->getCurrentDevice().isNull());

    EXPECT_TRUE(f.bridge->setAudioDevice(QString{"USB Headset"}));
    EXPECT_EQ(f.bridge->getCurrentDevice().toString(), QString{"USB Headset"});

    EXPECT_FALSE(f.bridge->setAudioDevice(QString{"Theremin"}));
    ASSERT_EQ(errors.count(), 1);
    EXPECT_TRUE(errors.first().at(0).toString().startsWith("DeviceUnavailable: "));
    EXPECT_EQ(f.bridge->getCurrentDevice().toString(), QString{"USB Headset"});

    EXPECT_TRUE(f.bridge->setAudioDevice(QVariant{}));
    EXPECT_TRUE(f.bridge->getCurrentDevice().isNull());

    f.backend->setDevices({"Built-in Microphone"});
    EXPECT_EQ(devices_changed.count(), 1);
}

TEST(AppEngine, permissions) {
    Fixture f;

    EXPECT_TRUE(f.bridge->checkMicrophonePermission());
    f.backend->setDevices({});
    EXPECT_FALSE(f.bridge->checkMicrophonePermission());

    f.hotkey.start();
    EXPECT_TRUE(f.bridge->checkAccessibilityPermission());
}

TEST(AppEngine, closeSettingsWindow) {
    Fixture f;
    QSignalSpy close{f.bridge.get(), &AppEngine::settingsWindowCloseRequested};

    f.bridge->closeSettingsWindow();
    EXPECT_EQ(close.count(), 1);
}

TEST(AppEngine, recordingCommandsDriveTheSession) {
    Fixture f;
    QSignalSpy started{f.bridge.get(), &AppEngine::recordingStarted};
    QSignalSpy stopped{f.bridge.get(), &AppEngine::recordingStopped};
    QSignalSpy transcribing{f.bridge.get(), &AppEngine::transcriptionStarted};
    QSignalSpy complete{f.bridge.get(), &AppEngine::transcriptionComplete};
    QSignalSpy levels{f.bridge.get(), &AppEngine::audioLevel};

    f.bridge->startRecording();
    EXPECT_EQ(f.session->state(), SessionController::State::Recording);
    EXPECT_TRUE(f.backend->feed(tone(8000, 0.1f)));
    EXPECT_TRUE(waitUntil([&] { return levels.count() > 0; }));

    f.bridge->stopRecording();
    EXPECT_TRUE(waitUntil([&] { return complete.count() == 1; }));
    EXPECT_EQ(complete.first().at(0).toString(), QString{"hello world"});
    EXPECT_EQ(started.count(), 1);
    EXPECT_EQ(stopped.count(), 1);
    EXPECT_EQ(transcribing.count(), 1);
}

TEST(AppEngine, hotkeyDrivesTheSession) {
    Fixture f;
    QSignalSpy errors{f.bridge.get(), &AppEngine::transcriptionError};

    f.hotkey.press();
    EXPECT_EQ(f.session->state(), SessionController::State::Recording);
    f.hotkey.release();
    // Too short to transcribe
    EXPECT_EQ(f.session->state(), SessionController::State::Idle);
    EXPECT_EQ(errors.count(), 0);
}

TEST(AppEngine, startupWarmsUpTheActiveModel) {
    Fixture f;

    f.bridge->startup(true);
    EXPECT_TRUE(waitUntil([&] { return f.transcriber->residentModelId() == "tiny"; }));
    EXPECT_FALSE(f.models->activeJob("tiny"));
}

TEST(AppEngine, startupDownloadsMissingModel) {
    Fixture f{false};
    QSignalSpy downloaded{f.bridge.get(), &AppEngine::modelDownloaded};

    f.bridge->startup(true);
    ASSERT_TRUE(f.models->activeJob("tiny"));
    EXPECT_TRUE(waitUntil([&] { return downloaded.count() == 1; }));

    // The new model is loaded as soon as it is there
    EXPECT_TRUE(waitUntil([&] { return f.transcriber->residentModelId() == "tiny"; }));
}

TEST(AppEngine, startupWithoutAutoDownload) {
    Fixture f{false};

    f.bridge->startup(false);
    EXPECT_FALSE(f.models->activeJob("tiny"));
    spin(50ms);
    EXPECT_TRUE(f.transcriber->residentModelId().empty());
}

TEST(AppEngine, shutdownCancelsDownloadsAndRecording) {
    Fixture f{false};

    EXPECT_TRUE(f.bridge->downloadWhisperModel("tiny"));
    auto job = f.models->activeJob("tiny");
    ASSERT_TRUE(job);

    f.hotkey.start();
    f.bridge->shutdown();
    EXPECT_FALSE(f.hotkey.isActive());
    EXPECT_TRUE(waitUntil([&] { return job->isFinished(); }));
    EXPECT_EQ(job->state(), DownloadJob::State::Cancelled);
    EXPECT_FALSE(f.models->isDownloaded("tiny"));
    EXPECT_EQ(f.session->state(), SessionController::State::Idle);
}

TEST(AppEngine, shutdownDuringTransferRemovesPartialFile) {
    Fixture f{false};
    QSignalSpy download_errors{f.bridge.get(), &AppEngine::modelDownloadError};

    EXPECT_TRUE(f.bridge->downloadWhisperModel());
    auto job = f.models->activeJob("tiny");
    ASSERT_TRUE(job);

    const auto partial = f.models_dir + "/tiny.bin.part";
    bool shut_down = false;
    bool partial_before = false;
    bool partial_after = true;
    bool finished_at_once = false;
    QObject::connect(job.get(), &DownloadJob::progress, job.get(), [&](qint64, qint64) {
        if (shut_down) {
            return;
        }
        shut_down = true;
        partial_before = QFile::exists(partial);
        // As from aboutToQuit, with no event loop iterations left
        f.bridge->shutdown();
        finished_at_once = job->isFinished();
        partial_after = QFile::exists(partial);
    });

    EXPECT_TRUE(waitUntil([&] { return shut_down; }));
    EXPECT_TRUE(partial_before);
    EXPECT_TRUE(finished_at_once);
    EXPECT_FALSE(partial_after);
    EXPECT_EQ(job->state(), DownloadJob::State::Cancelled);
    EXPECT_EQ(download_errors.count(), 1);

    spin(50ms);
    EXPECT_FALSE(f.models->isDownloaded("tiny"));
    EXPECT_FALSE(QFile::exists(partial));
}
