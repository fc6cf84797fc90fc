#pragma once

#include <chrono>
#include <vector>

// whisper.cpp wants 16 kHz mono
constexpr int TRANSCRIBE_SAMPLE_RATE = 16000;

// Capture is delivered in chunks of this duration
constexpr std::chrono::milliseconds CAPTURE_CHUNK_DURATION{50};

/*! One chunk of captured audio, mixed down to mono at the device's rate. */
struct AudioChunk {
    std::vector<float> samples;
    float level{};
};

/*! A finished recording, normalized to [-1, 1]. */
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate{TRANSCRIBE_SAMPLE_RATE};

    bool empty() const noexcept {
        return samples.empty();
    }

    std::chrono::milliseconds duration() const noexcept {
        if (sample_rate <= 0) {
            return {};
        }
        return std::chrono::milliseconds{static_cast<long long>(samples.size()) * 1000 / sample_rate};
    }
};
