#pragma once

#include <string>
#include <memory>
#include <mutex>

namespace speakerfusion {
namespace models {

/**
 * Model asset locations and feature switches
 */
struct ModelConfig {
    std::string transcriptionModelPath;
    std::string diarizationModelPath;
    bool diarizationEnabled = true;
};

/**
 * Process-wide handle on the loaded transcription and diarization models.
 *
 * Lifecycle: initialize() runs once per process; later calls return the same
 * handle and ignore their argument. The handle is immutable afterwards and is
 * passed explicitly to the collaborators that need it. Tests may construct
 * private instances directly.
 */
class ModelContext {
public:
    explicit ModelContext(const ModelConfig& config);

    /**
     * Initialize the process-wide context (first call wins)
     * @param config Model configuration
     * @return Shared process-wide context
     */
    static std::shared_ptr<const ModelContext> initialize(const ModelConfig& config);

    /**
     * @return Process-wide context, nullptr before initialize()
     */
    static std::shared_ptr<const ModelContext> instance();

    bool isTranscriptionModelLoaded() const { return transcriptionLoaded_; }
    bool isDiarizationModelLoaded() const { return diarizationLoaded_; }
    bool isDiarizationEnabled() const { return config_.diarizationEnabled; }

    /**
     * Diarization can run: enabled and its model is present
     */
    bool isDiarizationReady() const { return isDiarizationEnabled() && diarizationLoaded_; }

    const ModelConfig& getConfig() const { return config_; }
    std::string getModelInfo() const;

private:
    static bool probeModel(const std::string& path, const char* kind);

    ModelConfig config_;
    bool transcriptionLoaded_;
    bool diarizationLoaded_;

    static std::once_flag initFlag_;
    static std::shared_ptr<const ModelContext> instance_;
};

} // namespace models
} // namespace speakerfusion
