#pragma once

#include <span>
#include <vector>

#include <QtGlobal>

class QAudioFormat;

// Level in [0, 1] for live feedback. Scaled RMS, so normal speech lands mid-range.
float audioLevel(std::span<const float> samples) noexcept;

// Decodes interleaved PCM frames in `format`, averages the channels and appends
// the result to `out`. Returns the number of bytes consumed (whole frames only).
qsizetype appendAsMono(std::span<const char> pcm, const QAudioFormat& format, std::vector<float>& out);

// Linear interpolation. Returns the input unchanged if the rates are equal.
std::vector<float> resampleLinear(std::vector<float> samples, int fromRate, int toRate);
