#include <cmath>

#include <QSignalSpy>

#include <gtest/gtest.h>

#include "AppError.h"
#include "AudioController.h"
#include "AudioRecorder.h"
#include "TestUtils.h"
#include "fakes/FakeAudioBackend.h"

using namespace std;
using namespace qdt_test;

namespace {

struct Fixture {
    Fixture() {
        clearSettings();
        auto be = make_unique<FakeAudioBackend>();
        backend = be.get();
        controller = make_unique<AudioController>(std::move(be));
        recorder = make_unique<AudioRecorder>(*controller);
    }

    FakeAudioBackend *backend{};
    unique_ptr<AudioController> controller;
    unique_ptr<AudioRecorder> recorder;
};

} // anon ns

TEST(AudioRecorder, capturesWholeRecording) {
    Fixture f;

    f.recorder->startCapture();
    EXPECT_TRUE(f.recorder->isCapturing());
    EXPECT_TRUE(f.backend->isCapturing());
    EXPECT_EQ(f.recorder->deviceName(), QString{"Built-in Microphone"});

    const auto pcm = tone(16000, 0.5f);
    ASSERT_TRUE(f.backend->feed(pcm));

    const auto buffer = f.recorder->stopCapture();
    EXPECT_FALSE(f.recorder->isCapturing());
    EXPECT_FALSE(f.backend->isCapturing());

    EXPECT_EQ(buffer.sample_rate, 16000);
    ASSERT_EQ(buffer.samples.size(), 16000u);
    EXPECT_EQ(buffer.duration().count(), 1000);
    for (size_t i = 0; i < buffer.samples.size(); i += 97) {
        EXPECT_NEAR(std::abs(buffer.samples[i]), 0.5f, 0.001f) << "at " << i;
    }
}

TEST(AudioRecorder, keepsOrderAcrossChunks) {
    Fixture f;
    f.recorder->startCapture();

    // A ramp, written in odd sized pieces that split frames between writes
    vector<int16_t> ramp(4000);
    for (size_t i = 0; i < ramp.size(); ++i) {
        ramp[i] = static_cast<int16_t>(i);
    }
    const QByteArray raw{reinterpret_cast<const char *>(ramp.data()), static_cast<qsizetype>(ramp.size() * 2)};
    for (qsizetype pos = 0; pos < raw.size(); pos += 333) {
        ASSERT_TRUE(f.backend->feedRaw(raw.mid(pos, 333)));
    }

    const auto buffer = f.recorder->stopCapture();
    ASSERT_EQ(buffer.samples.size(), ramp.size());
    for (size_t i = 0; i < ramp.size(); ++i) {
        ASSERT_NEAR(buffer.samples[i], static_cast<float>(i) / 32767.0f, 1e-6f) << "at " << i;
    }
}

TEST(AudioRecorder, noAudioIsDroppedWhenTheCollectorLags) {
    Fixture f;
    f.recorder->startCapture();

    // 30 seconds in one write is far more chunks than the queue holds
    const auto pcm = tone(16000 * 30, 0.1f);
    ASSERT_TRUE(f.backend->feed(pcm));

    const auto buffer = f.recorder->stopCapture();
    EXPECT_EQ(buffer.samples.size(), pcm.size());
    EXPECT_EQ(buffer.duration().count(), 30000);
}

TEST(AudioRecorder, reportsLevels) {
    Fixture f;
    QSignalSpy levels{f.recorder.get(), &AudioRecorder::levelUpdated};

    f.recorder->startCapture();
    ASSERT_TRUE(f.backend->feed(tone(1600, 0.02f)));
    EXPECT_TRUE(waitUntil([&] { return levels.count() > 0; }));

    const auto level = levels.last().at(0).toFloat();
    EXPECT_NEAR(level, 0.5f, 0.01f);

    ASSERT_TRUE(f.backend->feed(vector<int16_t>(1600, 0)));
    EXPECT_TRUE(waitUntil([&] { return levels.last().at(0).toFloat() == 0.0f; }));

    f.recorder->discardCapture();
}

TEST(AudioRecorder, convertsDeviceFormat) {
    Fixture f;

    QAudioFormat format;
    format.setSampleRate(48000);
    format.setChannelCount(2);
    format.setSampleFormat(QAudioFormat::Int16);
    f.backend->setFormat(format);

    f.recorder->startCapture();
    ASSERT_TRUE(f.backend->feed(tone(48000, 0.25f, 2)));

    // Mixed down to mono, still at the device rate
    const auto buffer = f.recorder->stopCapture();
    EXPECT_EQ(buffer.sample_rate, 48000);
    EXPECT_EQ(buffer.samples.size(), 48000u);
    EXPECT_EQ(buffer.duration().count(), 1000);
}

TEST(AudioRecorder, deviceThatCannotStart) {
    Fixture f;
    f.backend->setCanStart(false);

    try {
        f.recorder->startCapture();
        FAIL() << "Expected AppError";
    } catch (const AppError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::DeviceUnavailable);
        EXPECT_EQ(ex.reason(), QString{"DeviceUnavailable: The device is busy"});
    }

    EXPECT_FALSE(f.recorder->isCapturing());
    EXPECT_TRUE(f.recorder->stopCapture().empty());
}

TEST(AudioRecorder, stopWithoutStartIsEmpty) {
    Fixture f;
    EXPECT_TRUE(f.recorder->stopCapture().empty());
    f.recorder->discardCapture();
}

TEST(AudioRecorder, emptyCapture) {
    Fixture f;
    f.recorder->startCapture();
    const auto buffer = f.recorder->stopCapture();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.duration().count(), 0);
}

TEST(AudioRecorder, deviceFailureIsReported) {
    Fixture f;
    QSignalSpy failed{f.recorder.get(), &AudioRecorder::captureFailed};

    f.recorder->startCapture();
    f.backend->failDevice("Device unplugged");
    EXPECT_TRUE(waitUntil([&] { return failed.count() == 1; }));
    EXPECT_EQ(failed.first().at(0).toString(), QString{"Device unplugged"});

    f.recorder->discardCapture();
    EXPECT_FALSE(f.backend->isCapturing());
}

TEST(AudioRecorder, canRecordAgain) {
    Fixture f;

    for (int i = 0; i < 3; ++i) {
        f.recorder->startCapture();
        ASSERT_TRUE(f.backend->feed(tone(8000)));
        EXPECT_EQ(f.recorder->stopCapture().samples.size(), 8000u);
    }
    EXPECT_EQ(f.backend->channel().opened, 3);
}
