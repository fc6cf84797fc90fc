#include <atomic>
#include <cassert>
#include <format>
#include <memory>
#include <mutex>
#include <thread>

#include "qdt/WhisperEngine.h"
#include "qdt/log_wrapper.h"

#include <whisper.h>

using namespace std;

namespace qdt {

namespace {

class WhisperImpl;
class WhisperCtxImpl;

void whisperLogger(ggml_log_level level, const char *msg, void *) {
    string_view message(msg ? msg : "");
    if (message.ends_with('\n')) {
        message.remove_suffix(1);
    }

    switch(level) {
    case GGML_LOG_LEVEL_ERROR:
        LOG_ERROR << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_WARN:
        LOG_WARN << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_INFO:
        LOG_DEBUG << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_DEBUG:
    case GGML_LOG_LEVEL_CONT:
        LOG_TRACE << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_NONE:
        break;
    }
}

int defaultThreads() {
    const auto thds = std::thread::hardware_concurrency();
    if (thds > 32) {
        return static_cast<int>(thds - 4);
    }
    if (thds > 4) {
        return static_cast<int>(thds - 1);
    }
    return 4;
}

class WhisperSessionCtxImpl final : public WhisperSessionCtx {
public:
    WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state);
    ~WhisperSessionCtxImpl() override;

    string getFullTextResult() const override {
        return final_text_;
    }

    bool whisperFull(std::span<const float> data, const WhisperFullParams &params, Transcript& out) override;

private:
    shared_ptr<WhisperCtxImpl> model_ctx_;
    whisper_state *state_{nullptr};
    std::string final_text_;
};

class WhisperCtxImpl final : public WhisperCtx, public enable_shared_from_this<WhisperCtxImpl> {
public:
    WhisperCtxImpl(WhisperImpl& engine, string_view modelId, whisper_context *ctx)
        : engine_{engine}, model_id_{modelId}, ctx_{ctx}
    {
        assert(ctx_ != nullptr);
    }

    ~WhisperCtxImpl() override;

    string info() const noexcept override;

    EngineBase &engine() noexcept override;

    const EngineBase &engine() const noexcept override;

    const WhisperImpl& wengine() const noexcept {
        return engine_;
    }

    const string &modelId() const noexcept override {
        return model_id_;
    }

    std::shared_ptr<WhisperSessionCtx> createWhisperSession() override {
        LOG_DEBUG << "Creating new Whisper session for model " << model_id_;

        if (auto state = whisper_init_state(ctx_)) {
            return make_shared<WhisperSessionCtxImpl>(shared_from_this(), state);
        }

        LOG_ERROR << "Failed to allocate whisper state for model " << model_id_;
        return {};
    }

    whisper_context *ctx() noexcept override {
        return ctx_;
    };

    const whisper_context *ctx() const noexcept override {
        return ctx_;
    };

private:
    WhisperImpl& engine_;
    const std::string model_id_;
    whisper_context *ctx_{nullptr};
};

class WhisperImpl final : public WhisperEngine {
public:
    explicit WhisperImpl(const WhisperCreateParams&)
    {
        LOG_DEBUG << "Creating Whisper engine";
        whisper_log_set(whisperLogger, nullptr);
    }

    ~WhisperImpl() override {
        LOG_DEBUG << "Destroying Whisper engine with " << num_loaded_models_ << " loaded models";
    }

    int numLoadedModels() const noexcept override {
        return num_loaded_models_.load();
    }

    string version() const override {
        string_view v;
        if (const auto p = whisper_version()) {
            v = p;
        }

        return format("whisper.cpp {}", v);
    }

    bool init() override {
        LOG_INFO << "Whisper engine initialized: " << version();
        return clearError();
    }

    string lastError() const noexcept override {
        std::lock_guard lock{mutex_};
        return error_;
    }

    void setLogger(logfwd::callback_t callback, logfwd::Level level) override {
        logfwd::setCallback(std::move(callback), "[qdt_whisper]");
        logfwd::setLevel(level);
    }

    shared_ptr<ModelCtx> load(const string &modelId, const filesystem::path &modelPath, const EngineLoadParams &params) override {
        WhisperEngineLoadParams wp;
        if (auto *wparams = dynamic_cast<const WhisperEngineLoadParams*>(&params)) {
            wp = *wparams;
        }

        return loadWhisper(modelId, modelPath, wp);
    }

    std::shared_ptr<WhisperCtx> loadWhisper(const std::string &modelId,
                                            const std::filesystem::path &modelPath,
                                            const WhisperEngineLoadParams &params) override {
        whisper_context_params cparams = whisper_context_default_params();

        LOG_DEBUG << "Loading Whisper model " << modelId << " from " << modelPath
                  << ", gpu=" << params.use_gpu;

        cparams.use_gpu = params.use_gpu;
        cparams.flash_attn = params.use_gpu && params.flash_attn;
        cparams.gpu_device = params.gpu_device;
        cparams.dtw_token_timestamps = false;
        cparams.dtw_aheads_preset = WHISPER_AHEADS_NONE;

        if (auto *ctx = whisper_init_from_file_with_params_no_state(modelPath.c_str(), cparams)) {
            auto modelCtx = make_shared<WhisperCtxImpl>(*this, modelId, ctx);
            ++num_loaded_models_;
            clearError();
            return modelCtx;
        }

        setError(format("Failed to load Whisper model from {}", modelPath.string()));
        LOG_ERROR << lastError();
        return {};
    }

    void onModelUnloaded() {
        --num_loaded_models_;
    }

private:
    bool setError(string msg) {
        std::lock_guard lock{mutex_};
        error_ = std::move(msg);
        return error_.empty();
    }

    bool clearError() {
        std::lock_guard lock{mutex_};
        error_.clear();
        return true;
    }

    mutable std::mutex mutex_;
    string error_;
    atomic_int num_loaded_models_{0};
};

WhisperCtxImpl::~WhisperCtxImpl() {
    if (ctx_) {
        LOG_DEBUG << "Unloading Whisper model " << model_id_;
        whisper_free(ctx_);
        ctx_ = nullptr;
        engine_.onModelUnloaded();
    }
}

string WhisperCtxImpl::info() const noexcept
{
    return format("{}, model={}", wengine().version(), modelId());
}

EngineBase &WhisperCtxImpl::engine() noexcept {
    return engine_;
}

const EngineBase &WhisperCtxImpl::engine() const noexcept
{
    return engine_;
}

WhisperSessionCtxImpl::WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state)
    : model_ctx_{std::move(modelCtx)}, state_{state}
{
    assert(model_ctx_ != nullptr);
    assert(state_ != nullptr);
}

WhisperSessionCtxImpl::~WhisperSessionCtxImpl()
{
    if (state_) {
        whisper_free_state(state_);
        state_ = nullptr;
    }
}

bool WhisperSessionCtxImpl::whisperFull(std::span<const float> data, const WhisperFullParams &params, Transcript& out) {
    auto p = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    if (params.single_segment.has_value()) {
        p.single_segment = params.single_segment.value();
    }
    if (params.suppress_blank.has_value()) {
        p.suppress_blank = params.suppress_blank.value();
    }
    if (params.no_context.has_value()) {
        p.no_context = params.no_context.value();
    }
    if (params.print_special.has_value()) {
        p.print_special = params.print_special.value();
    }
    if (params.print_progress.has_value()) {
        p.print_progress = params.print_progress.value();
    }
    if (params.print_timestamps.has_value()) {
        p.print_timestamps = params.print_timestamps.value();
    }
    if (params.print_realtime.has_value()) {
        p.print_realtime = params.print_realtime.value();
    }

    p.n_threads = params.threads > 0 ? params.threads : defaultThreads();

    if (params.abort) {
        p.abort_callback = [](void *data) -> bool {
            return static_cast<const std::atomic_bool *>(data)->load();
        };
        p.abort_callback_user_data = const_cast<std::atomic_bool *>(params.abort);
    }

    if (!params.language.empty()) {
        p.language = params.language.c_str();
    } else {
        p.language = "auto";
        p.detect_language = false;
    }

    LOG_TRACE << "Whisper full params: "
              << "language='" << (p.language ? p.language : "auto") << "', "
              << "n_threads=" << p.n_threads << ", "
              << "single_segment=" << p.single_segment << ", "
              << "suppress_blank=" << p.suppress_blank << ", "
              << "no_context=" << p.no_context
              << ", samples=" << data.size();

    const auto rc = whisper_full_with_state(model_ctx_->ctx(), state_, p, data.data(), static_cast<int>(data.size()));
    if (rc != 0) {
        LOG_ERROR << "whisper_full_with_state failed with code " << rc;
        return false;
    }

    out.segments.clear();
    out.full_text.clear();

    const int n = whisper_full_n_segments_from_state(state_);
    out.segments.reserve(std::max(0, n));

    for (int i = 0; i < n; ++i) {
        Segment seg{};
        // whisper uses 10ms units
        seg.t0_ms = whisper_full_get_segment_t0_from_state(state_, i) * 10;
        seg.t1_ms = whisper_full_get_segment_t1_from_state(state_, i) * 10;

        if (const char* txt = whisper_full_get_segment_text_from_state(state_, i)) {
            seg.text.assign(txt);
            out.full_text += seg.text;
        }

        seg.no_speech_prob = whisper_full_get_segment_no_speech_prob_from_state(state_, i);
        out.segments.push_back(std::move(seg));
    }

    if (!params.language.empty()) {
        out.language = params.language;
    } else if (const auto lang_id = whisper_full_lang_id_from_state(state_); lang_id >= 0) {
        if (const auto *name = whisper_lang_str(lang_id)) {
            out.language = name;
        }
    }

    final_text_ = out.full_text;
    return true;
}

} // anon ns

std::shared_ptr<WhisperEngine> WhisperEngine::create(const WhisperCreateParams &params)
{
    LOG_DEBUG << "Creating Whisper engine instance";
    return make_shared<WhisperImpl>(params);
}

WhisperCtx::WhisperCtx() {}

WhisperCtx::~WhisperCtx() {}

WhisperSessionCtx::WhisperSessionCtx() {}
WhisperSessionCtx::~WhisperSessionCtx() {}

WhisperEngine::WhisperEngine() {}

WhisperEngine::~WhisperEngine() {}

} // ns
