#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "EngineBase.h"

struct whisper_context;

#if defined(_WIN32)
#if defined(QDT_WHISPER_WRAP_BUILD)
#define QDT_WHISPER_WRAP_API __declspec(dllexport)
#else
#define QDT_WHISPER_WRAP_API __declspec(dllimport)
#endif
#else
#define QDT_WHISPER_WRAP_API __attribute__((visibility("default")))
#endif

namespace qdt {

struct WhisperEngineLoadParams : public EngineLoadParams {
    bool use_gpu{};
    bool flash_attn{};
    int gpu_device{};
};

/*! Session context for one recording.
 *
 *  Holds the engine's decoder state. Create a new session for each recording.
 */
class QDT_WHISPER_WRAP_API WhisperSessionCtx : public SessionCtx {
public:
    struct WhisperFullParams {
        std::string language; // empty for auto
        int threads{-1}; // -1 for automatic
        std::optional<bool> single_segment;
        std::optional<bool> suppress_blank;
        std::optional<bool> no_context;
        std::optional<bool> print_special;
        std::optional<bool> print_progress;
        std::optional<bool> print_timestamps;
        std::optional<bool> print_realtime;
        // If set, inference stops early when it becomes true
        const std::atomic_bool *abort{};
    };

    struct Segment {
        int64_t t0_ms = 0;
        int64_t t1_ms = 0;
        std::string text;
        float no_speech_prob = 0.0f;
    };

    struct Transcript {
        std::vector<Segment> segments;
        std::string full_text;
        std::string language;
    };

    WhisperSessionCtx();
    virtual ~WhisperSessionCtx();

    /*! Runs the whole recording through the model.
     *
     * @param data 16 kHz mono samples in the range [-1, 1].
     * @param params Parameters for the run.
     * @param out Receives the segments and the concatenated text.
     * @return True if processing was successful, false otherwise.
     */
    virtual bool whisperFull(std::span<const float> data,
                             const WhisperFullParams& params,
                             Transcript& out) = 0;
};

class QDT_WHISPER_WRAP_API WhisperCtx : public ModelCtx {
public:
    WhisperCtx();
    virtual ~WhisperCtx();

    virtual whisper_context *ctx() noexcept = 0;
    virtual const whisper_context *ctx() const noexcept = 0;
};

/*! Whisper engine interface
 *
 */
class QDT_WHISPER_WRAP_API WhisperEngine : public EngineBase {
public:
    QDT_WHISPER_WRAP_API WhisperEngine();
    QDT_WHISPER_WRAP_API virtual ~WhisperEngine();

    struct WhisperCreateParams{};

    /*! Creates the whisper.cpp backed engine.
     *
     * @param params Parameters for creating the engine.
     * @return The engine, or nullptr on failure.
     */
    static QDT_WHISPER_WRAP_API std::shared_ptr<WhisperEngine> create(const WhisperCreateParams& params);

    virtual std::shared_ptr<WhisperCtx> loadWhisper(const std::string& modelId,
                                                    const std::filesystem::path& modelPath,
                                                    const WhisperEngineLoadParams& params) = 0;
};

} // ns
