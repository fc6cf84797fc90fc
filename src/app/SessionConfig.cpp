#include <algorithm>

#include <QSettings>

#include "SessionConfig.h"
#include "logging.h"

using namespace std;

SessionConfig SessionConfig::fromSettings(const QSettings &settings)
{
    SessionConfig cfg;

    cfg.min_recording = chrono::milliseconds{
        max(0, settings.value("session/min_recording_ms", static_cast<int>(cfg.min_recording.count())).toInt())};

    const auto max_s = settings.value("session/max_recording_s",
        static_cast<int>(chrono::duration_cast<chrono::seconds>(cfg.max_recording).count())).toInt();
    if (max_s > 0) {
        cfg.max_recording = chrono::seconds{max_s};
    } else {
        LOG_WARN_N << "Ignoring invalid session/max_recording_s=" << max_s;
    }

    cfg.result_display = chrono::milliseconds{
        max(0, settings.value("session/display_ms", static_cast<int>(cfg.result_display.count())).toInt())};

    cfg.language = settings.value("transcribe/language", QString::fromStdString(cfg.language)).toString().trimmed().toStdString();
    cfg.threads = settings.value("transcribe/threads", cfg.threads).toInt();
    cfg.use_gpu = settings.value("transcribe/use_gpu", cfg.use_gpu).toBool();

    LOG_DEBUG_N << "Session config: min_recording=" << cfg.min_recording.count()
                << "ms, max_recording=" << cfg.max_recording.count()
                << "ms, result_display=" << cfg.result_display.count()
                << "ms, language='" << cfg.language
                << "', threads=" << cfg.threads
                << ", gpu=" << cfg.use_gpu;
    return cfg;
}
