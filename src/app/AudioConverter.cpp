#include <algorithm>
#include <cmath>

#include <QAudioFormat>

#include "AudioConverter.h"

using namespace std;

namespace {
// RMS of quiet speech is around 0.02-0.04
constexpr float level_gain = 25.0f;
} // anon ns

float audioLevel(std::span<const float> samples) noexcept
{
    if (samples.empty()) {
        return 0.0f;
    }

    double sum = 0.0;
    for (const auto s : samples) {
        sum += static_cast<double>(s) * static_cast<double>(s);
    }

    const auto rms = static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
    return std::clamp(rms * level_gain, 0.0f, 1.0f);
}

qsizetype appendAsMono(std::span<const char> pcm, const QAudioFormat &format, std::vector<float> &out)
{
    const auto frame_bytes = format.bytesPerFrame();
    const auto sample_bytes = format.bytesPerSample();
    const auto channels = format.channelCount();
    if (frame_bytes <= 0 || sample_bytes <= 0 || channels <= 0) {
        return 0;
    }

    const auto frames = static_cast<qsizetype>(pcm.size()) / frame_bytes;
    out.reserve(out.size() + static_cast<size_t>(frames));

    const char *p = pcm.data();
    for (qsizetype f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += format.normalizedSampleValue(p);
            p += sample_bytes;
        }
        out.push_back(std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f));
    }

    return frames * frame_bytes;
}

std::vector<float> resampleLinear(std::vector<float> samples, int fromRate, int toRate)
{
    if (fromRate == toRate || fromRate <= 0 || toRate <= 0 || samples.empty()) {
        return samples;
    }

    const double ratio = static_cast<double>(fromRate) / static_cast<double>(toRate);
    const auto out_len = static_cast<size_t>(static_cast<double>(samples.size()) / ratio);

    std::vector<float> out;
    out.reserve(out_len);

    for (size_t i = 0; i < out_len; ++i) {
        const double src = static_cast<double>(i) * ratio;
        const auto ix = static_cast<size_t>(src);
        const auto frac = static_cast<float>(src - static_cast<double>(ix));

        if (ix + 1 < samples.size()) {
            out.push_back(samples[ix] * (1.0f - frac) + samples[ix + 1] * frac);
        } else {
            out.push_back(samples[std::min(ix, samples.size() - 1)]);
        }
    }

    return out;
}
