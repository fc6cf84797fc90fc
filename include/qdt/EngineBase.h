#pragma once

#include <string>
#include <memory>
#include <string_view>
#include <filesystem>

#include "log_wrapper.h"

/*! Only pure interfaces here. The implementations live in separate libraries.
 */

namespace qdt {

class EngineBase;
class WhisperSessionCtx;

/*! Parameters for loading a model.
 *
 * Specific engines may extend this struct with their own parameters.
 */
struct EngineLoadParams {
    EngineLoadParams() = default;
    virtual ~EngineLoadParams() = default;
};

/*! Context for one inference session.
 *
 * Specific engines define their own session types.
 */
struct SessionCtx {
    SessionCtx() = default;
    virtual ~SessionCtx() = default;

    /*! The text produced by the last completed run, or an empty string. */
    virtual std::string getFullTextResult() const = 0;
};

/*! Context for a loaded model.
 *
 * The model stays resident for as long as someone holds a reference to its context.
 */
class ModelCtx {
public:
    ModelCtx() = default;
    virtual ~ModelCtx() = default;

    virtual std::string info() const noexcept = 0;

    virtual const EngineBase& engine() const noexcept = 0;

    virtual EngineBase & engine() noexcept  = 0;

    virtual const std::string& modelId() const noexcept = 0;

    /*! Creates a new session for processing one recording.
     *
     * @return The session, or nullptr if the engine could not allocate its state.
     */
    virtual std::shared_ptr<WhisperSessionCtx> createWhisperSession() {
        return {};
    };
};


/* Abstract interface for the engine base.
 *
 * The implementations are built as separate shared libraries so the application
 * does not depend on the engine's headers or build flags.
 */

class EngineBase {
public:
    EngineBase() = default;
    virtual ~EngineBase() = default;

    /*! Returns the version string of the underlying engine/library.
     *
     * Example: "whisper.cpp 1.7.6"
     */
    virtual std::string version() const = 0;

    /*! One time initialization of the engine.
     *
     * Must be called before any other methods.
     */
    virtual bool init() = 0;

    /*! Returns the last error message, if any.
     *
     * If the last operation was successful, returns an empty string.
     */
    virtual std::string lastError() const noexcept = 0;

    /*! Routes the engine's own log output to the application's logger.
     *
     * The callback is installed inside the engine library, so it also
     * receives messages from the underlying inference library.
     */
    virtual void setLogger(logfwd::callback_t callback, logfwd::Level level) = 0;

    /*! Loads the model from the given path with the specified parameters.
     *
     * When the last reference to the returned context goes away, the model is unloaded.
     *
     * @param modelId Identifier of the model being loaded.
     * @param modelPath Filesystem path to the model file.
     * @param params Load parameters specific to the engine.
     *
     * @return Shared pointer to the loaded model context, or nullptr on failure.
     */
    virtual std::shared_ptr<ModelCtx> load(const std::string& modelId,
                                           const std::filesystem::path& modelPath,
                                           const EngineLoadParams& params) = 0;

    virtual int numLoadedModels() const noexcept = 0;
};

} // ns
