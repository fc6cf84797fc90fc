#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <QDir>
#include <QSocketNotifier>

#include "EvdevHotkeyListener.h"
#include "logging.h"

using namespace std;

namespace {

constexpr size_t bits_per_long = sizeof(unsigned long) * 8;

bool testBit(const array<unsigned long, (KEY_MAX / bits_per_long) + 1>& bits, unsigned bit) {
    return (bits[bit / bits_per_long] >> (bit % bits_per_long)) & 1UL;
}

// A keyboard reports EV_KEY events for ordinary letter keys.
// Mice and power buttons report EV_KEY too, but not for these.
bool isKeyboard(int fd) {
    array<unsigned long, (KEY_MAX / bits_per_long) + 1> keys{};
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keys)), keys.data()) < 0) {
        return false;
    }
    return testBit(keys, KEY_A) && testBit(keys, KEY_Z) && testBit(keys, KEY_SPACE);
}

int openDevice(const QString& path) {
    return ::open(path.toLocal8Bit().constData(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
}

} // anon ns

EvdevHotkeyListener::Device::~Device()
{
    notifier.reset();
    if (fd >= 0) {
        ::close(fd);
    }
}

EvdevHotkeyListener::EvdevHotkeyListener(Hotkey hotkey, QStringList devices, QObject *parent)
    : HotkeyListener(parent)
    , state_{std::move(hotkey)}
    , device_paths_{std::move(devices)}
{
}

EvdevHotkeyListener::~EvdevHotkeyListener()
{
    devices_.clear();
}

QStringList EvdevHotkeyListener::eventDevicePaths()
{
    QStringList paths;
    const QDir dir{"/dev/input"};
    for (const auto& name : dir.entryList({"event*"}, QDir::System | QDir::Files, QDir::Name)) {
        paths << dir.absoluteFilePath(name);
    }
    return paths;
}

bool EvdevHotkeyListener::hasInputAccess(const QStringList &devices)
{
    for (const auto& path : devices.isEmpty() ? eventDevicePaths() : devices) {
        const auto fd = openDevice(path);
        if (fd < 0) {
            continue;
        }
        const auto ok = isKeyboard(fd);
        ::close(fd);
        if (ok) {
            return true;
        }
    }
    return false;
}

bool EvdevHotkeyListener::start()
{
    if (isActive()) {
        return true;
    }

    if (state_.hotkey().empty()) {
        LOG_ERROR_N << "No hotkey is configured.";
        return false;
    }

    const auto explicit_devices = !device_paths_.isEmpty();
    for (const auto& path : explicit_devices ? device_paths_ : eventDevicePaths()) {
        const auto fd = openDevice(path);
        if (fd < 0) {
            const auto err = errno;
            if (explicit_devices) {
                LOG_WARN_N << "Cannot open " << path.toStdString() << ": " << strerror(err);
            } else {
                LOG_TRACE_N << "Cannot open " << path.toStdString() << ": " << strerror(err);
            }
            continue;
        }

        if (!explicit_devices && !isKeyboard(fd)) {
            ::close(fd);
            continue;
        }

        auto dev = make_unique<Device>();
        dev->path = path;
        dev->fd = fd;
        dev->notifier = make_unique<QSocketNotifier>(fd, QSocketNotifier::Read);
        auto *raw = dev.get();
        connect(dev->notifier.get(), &QSocketNotifier::activated, this, [this, raw] {
            onReadable(*raw);
        });

        LOG_DEBUG_N << "Listening for " << state_.hotkey().text.toStdString()
                    << " on " << path.toStdString();
        devices_.push_back(std::move(dev));
    }

    if (devices_.empty()) {
        LOG_WARN_N << "No keyboard input device could be opened. The global hotkey is disabled. "
                   << "Add the user to the 'input' group to enable it.";
        return false;
    }

    LOG_INFO_N << "Global hotkey " << state_.hotkey().text.toStdString()
               << " active on " << devices_.size() << " device(s)";
    return true;
}

void EvdevHotkeyListener::stop()
{
    if (!isActive()) {
        return;
    }

    LOG_DEBUG_N << "Stopping the hotkey listener";
    devices_.clear();
    apply(state_.reset());
}

void EvdevHotkeyListener::onReadable(Device &device)
{
    array<input_event, 64> events;

    while(true) {
        const auto bytes = ::read(device.fd, events.data(), sizeof(events));
        if (bytes < 0) {
            const auto err = errno;
            if (err == EAGAIN || err == EINTR) {
                return;
            }
            LOG_WARN_N << "Failed to read from " << device.path.toStdString() << ": " << strerror(err);
            drop(device);
            return;
        }

        if (bytes == 0) {
            drop(device);
            return;
        }

        const auto count = static_cast<size_t>(bytes) / sizeof(input_event);
        for (size_t i = 0; i < count; ++i) {
            const auto& ev = events[i];
            // value: 0 = up, 1 = down, 2 = auto-repeat
            if (ev.type != EV_KEY || ev.value == 2) {
                continue;
            }
            apply(state_.onKey(ev.code, ev.value == 1, device.fd));
        }

        if (count < events.size()) {
            return;
        }
    }
}

void EvdevHotkeyListener::drop(Device &device)
{
    LOG_INFO_N << "Input device " << device.path.toStdString() << " is gone";

    // We are inside the notifier's signal. Delete it later.
    device.notifier->setEnabled(false);
    QMetaObject::invokeMethod(this, [this, path = device.path] {
        erase_if(devices_, [&path](const auto& d) { return d->path == path; });
    }, Qt::QueuedConnection);

    // The device may disappear while the chord is held on it
    apply(state_.forget(device.fd));
}

void EvdevHotkeyListener::apply(HotkeyState::Edge edge)
{
    switch(edge) {
    case HotkeyState::Edge::Pressed:
        LOG_TRACE_N << "Hotkey pressed";
        emit pressed();
        break;
    case HotkeyState::Edge::Released:
        LOG_TRACE_N << "Hotkey released";
        emit released();
        break;
    case HotkeyState::Edge::None:
        break;
    }
}
