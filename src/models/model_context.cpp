#include "models/model_context.hpp"
#include "utils/logging.hpp"
#include "utils/error_handler.hpp"
#include <filesystem>
#include <sstream>
#include <system_error>

namespace speakerfusion {
namespace models {

// instance_ is read and written only through std::atomic_load/atomic_store
std::once_flag ModelContext::initFlag_;
std::shared_ptr<const ModelContext> ModelContext::instance_;

ModelContext::ModelContext(const ModelConfig& config)
    : config_(config)
    , transcriptionLoaded_(probeModel(config.transcriptionModelPath, "transcription"))
    , diarizationLoaded_(probeModel(config.diarizationModelPath, "diarization")) {
}

std::shared_ptr<const ModelContext> ModelContext::initialize(const ModelConfig& config) {
    bool created = false;
    std::call_once(initFlag_, [&config, &created]() {
        auto context = std::make_shared<const ModelContext>(config);
        std::atomic_store(&instance_, context);
        created = true;
        utils::Logger::info("Model context initialized: " + context->getModelInfo());
    });

    if (!created) {
        utils::Logger::debug("Model context already initialized, ignoring new configuration");
    }
    return std::atomic_load(&instance_);
}

std::shared_ptr<const ModelContext> ModelContext::instance() {
    return std::atomic_load(&instance_);
}

std::string ModelContext::getModelInfo() const {
    std::ostringstream info;
    info << "transcription=" << (transcriptionLoaded_ ? config_.transcriptionModelPath : "<none>")
         << ", diarization=";
    if (!config_.diarizationEnabled) {
        info << "<disabled>";
    } else {
        info << (diarizationLoaded_ ? config_.diarizationModelPath : "<none>");
    }
    return info.str();
}

bool ModelContext::probeModel(const std::string& path, const char* kind) {
    if (path.empty()) {
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        SPEAKERFUSION_REPORT_ERROR(utils::ErrorCategory::MODEL_LOADING, utils::ErrorSeverity::WARNING,
                                   std::string("Model not found for ") + kind, path);
        return false;
    }
    return true;
}

} // namespace models
} // namespace speakerfusion
