#include <array>

#include "ModelInfo.h"

namespace {

using mi_t = ModelInfo;
constexpr auto all_whisper_models = std::to_array<mi_t>({
    {"small", "Small (~500MB) - Fast", "ggml-small.bin", 487'601'967,
     "55356645c2b361a969dfd0ef2c5a50d530afd8d5",
     "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/"},
    {"medium", "Medium (~1.5GB) - Balanced", "ggml-medium.bin", 1'533'763'059,
     "fd9727b6e1217c2f614f9b698455c4ffd82463b4",
     "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/"},
    {"large", "Large (~3GB) - Accurate", "ggml-large-v3.bin", 3'095'033'483,
     "ad82bf6a9043ceed055076d0fd39f5f186ff8062",
     "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/"},
});

} // anon ns

model_list_t builtinWhisperModels() noexcept
{
    return all_whisper_models;
}
