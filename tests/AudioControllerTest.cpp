#include <QSettings>
#include <QSignalSpy>

#include <gtest/gtest.h>

#include "AppError.h"
#include "AudioController.h"
#include "TestUtils.h"
#include "fakes/FakeAudioBackend.h"

using namespace std;
using namespace qdt_test;

namespace {

struct Fixture {
    Fixture(QStringList devices = {"Built-in Microphone", "USB Headset"}) {
        auto be = make_unique<FakeAudioBackend>(std::move(devices));
        backend = be.get();
        controller = make_unique<AudioController>(std::move(be));
    }

    FakeAudioBackend *backend{};
    unique_ptr<AudioController> controller;
};

} // anon ns

TEST(AudioController, defaultSelectionIsSystemDefault) {
    clearSettings();
    Fixture f;

    EXPECT_FALSE(f.controller->currentDevice());
    EXPECT_EQ(f.controller->inputDevices(), (QStringList{"Built-in Microphone", "USB Headset"}));

    auto input = f.controller->openInput();
    ASSERT_TRUE(input);
    EXPECT_EQ(input->deviceName(), QString{"Built-in Microphone"});
}

TEST(AudioController, selectionIsPersisted) {
    clearSettings();
    {
        Fixture f;
        f.controller->setCurrentDevice(QString{"USB Headset"});
        EXPECT_EQ(f.controller->currentDevice(), QString{"USB Headset"});
        EXPECT_EQ(f.controller->openInput()->deviceName(), QString{"USB Headset"});
    }

    EXPECT_EQ(QSettings{}.value("audio/device").toString(), QString{"USB Headset"});

    Fixture again;
    EXPECT_EQ(again.controller->currentDevice(), QString{"USB Headset"});

    again.controller->setCurrentDevice(nullopt);
    EXPECT_FALSE(again.controller->currentDevice());
    EXPECT_FALSE(QSettings{}.contains("audio/device"));
}

TEST(AudioController, unknownDeviceIsRejected) {
    clearSettings();
    Fixture f;
    QSignalSpy changed{f.controller.get(), &AudioController::currentDeviceChanged};

    try {
        f.controller->setCurrentDevice(QString{"Theremin"});
        FAIL() << "Expected AppError";
    } catch (const AppError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::DeviceUnavailable);
    }

    EXPECT_FALSE(f.controller->currentDevice());
    EXPECT_EQ(changed.count(), 0);
}

TEST(AudioController, disconnectedDeviceFallsBackToDefault) {
    clearSettings();
    Fixture f;
    QSignalSpy devices_changed{f.controller.get(), &AudioController::inputDevicesChanged};

    f.controller->setCurrentDevice(QString{"USB Headset"});
    f.backend->setDevices({"Built-in Microphone"});
    EXPECT_EQ(devices_changed.count(), 1);

    // The selection is kept, in case the device comes back
    EXPECT_EQ(f.controller->currentDevice(), QString{"USB Headset"});
    EXPECT_EQ(f.controller->openInput()->deviceName(), QString{"Built-in Microphone"});

    f.backend->setDevices({"Built-in Microphone", "USB Headset"});
    EXPECT_EQ(f.controller->openInput()->deviceName(), QString{"USB Headset"});
}

TEST(AudioController, persistedDeviceMissingAtStartFallsBack) {
    clearSettings();
    QSettings{}.setValue("audio/device", "Bluetooth Mic");

    Fixture f;
    EXPECT_EQ(f.controller->currentDevice(), QString{"Bluetooth Mic"});
    EXPECT_EQ(f.controller->openInput()->deviceName(), QString{"Built-in Microphone"});
    clearSettings();
}

TEST(AudioController, noDevices) {
    clearSettings();
    Fixture f{QStringList{}};

    EXPECT_TRUE(f.controller->inputDevices().isEmpty());
    try {
        f.controller->openInput();
        FAIL() << "Expected AppError";
    } catch (const AppError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::DeviceUnavailable);
    }
}
