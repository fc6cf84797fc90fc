#pragma once

#include <chrono>
#include <string>

class QSettings;

/*! Tunables for recording sessions and transcription.
 *
 *  Read once at startup and passed by reference to the components.
 */
struct SessionConfig {
    // Recordings shorter than this are treated as accidental taps
    std::chrono::milliseconds min_recording{300};
    // Capture stops by itself after this long
    std::chrono::milliseconds max_recording{std::chrono::minutes{5}};
    // How long a result or error stays up before the session resets
    std::chrono::milliseconds result_display{1200};

    std::string language{"en"};
    int threads{-1};
    bool use_gpu{false};

    static SessionConfig fromSettings(const QSettings& settings);
};
