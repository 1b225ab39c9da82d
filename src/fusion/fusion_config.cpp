#include "fusion/fusion_config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace speakerfusion {
namespace fusion {

std::string toString(InvalidSegmentPolicy policy) {
    return policy == InvalidSegmentPolicy::FILTER ? "filter" : "reject";
}

FusionConfigManager::FusionConfigManager()
    : isModified_(false)
    , lastModified_(std::chrono::steady_clock::now()) {
}

bool FusionConfigManager::loadFromFile(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        configFilePath_ = configPath;
    }

    if (!std::filesystem::exists(configPath)) {
        utils::Logger::info("Configuration file not found: " + configPath + ", using defaults");
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = FusionConfig();
        isModified_ = true;
        return true;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        utils::Logger::error("Failed to open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string jsonStr = buffer.str();
    if (jsonStr.empty()) {
        utils::Logger::info("Empty configuration file, using defaults");
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = FusionConfig();
        isModified_ = true;
        return true;
    }

    if (!applyParsedConfig(jsonStr, configPath)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    isModified_ = false;
    utils::Logger::info("Fusion configuration loaded from: " + configPath);
    return true;
}

bool FusionConfigManager::saveToFile(const std::string& configPath) const {
    std::lock_guard<std::mutex> lock(configMutex_);

    std::filesystem::path filePath(configPath);
    std::filesystem::path dirPath = filePath.parent_path();

    if (!dirPath.empty() && !std::filesystem::exists(dirPath)) {
        std::error_code ec;
        if (!std::filesystem::create_directories(dirPath, ec)) {
            utils::Logger::error("Failed to create configuration directory: " + dirPath.string() +
                                 " - " + ec.message());
            return false;
        }
    }

    std::ofstream file(configPath);
    if (!file.is_open()) {
        utils::Logger::error("Failed to open configuration file for writing: " + configPath);
        return false;
    }

    file << configToJson(config_);
    file.close();

    if (file.fail()) {
        utils::Logger::error("Failed to write configuration file: " + configPath);
        return false;
    }

    utils::Logger::info("Fusion configuration saved to: " + configPath);
    return true;
}

bool FusionConfigManager::loadFromJson(const std::string& jsonStr) {
    if (!applyParsedConfig(jsonStr, "JSON string")) {
        return false;
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    isModified_ = true;
    return true;
}

std::string FusionConfigManager::exportToJson() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configToJson(config_);
}

FusionConfig FusionConfigManager::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

ConfigValidationResult FusionConfigManager::updateConfig(const FusionConfig& newConfig) {
    ConfigValidationResult result = validateConfig(newConfig);
    if (!result.isValid) {
        return result;
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = newConfig;
    isModified_ = true;
    lastModified_ = std::chrono::steady_clock::now();
    return result;
}

ConfigValidationResult FusionConfigManager::validateConfig(const FusionConfig& config) const {
    ConfigValidationResult result;

    if (!std::isfinite(config.tieEpsilon) || config.tieEpsilon < 0.0) {
        result.addError("tie_epsilon must be a non-negative number");
    } else if (config.tieEpsilon > 0.01) {
        result.addWarning("tie_epsilon above 10ms merges clearly different overlaps into ties");
    }

    if (!(config.lowConfidenceThreshold >= 0.0f && config.lowConfidenceThreshold <= 1.0f)) {
        result.addError("low_confidence_threshold must be between 0.0 and 1.0");
    }

    if (config.unknownSpeakerLabel.empty()) {
        result.addError("unknown_speaker_label must not be empty");
    }

    utils::LogLevel level;
    if (!utils::Logger::parseLevel(config.logLevel, level)) {
        result.addError("log_level must be one of DEBUG, INFO, WARN, ERROR");
    }

    if (config.models.diarizationEnabled && config.models.diarizationModelPath.empty()) {
        result.addWarning("diarization enabled without a model path; transcripts will be degraded");
    }

    return result;
}

void FusionConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = FusionConfig();
    isModified_ = true;
    lastModified_ = std::chrono::steady_clock::now();
}

bool FusionConfigManager::isModified() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return isModified_;
}

std::string FusionConfigManager::getConfigFilePath() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configFilePath_;
}

bool FusionConfigManager::applyParsedConfig(const std::string& jsonStr, const std::string& source) {
    FusionConfig newConfig;
    try {
        newConfig = parseJsonConfig(jsonStr);
    } catch (const utils::ConfigurationError& e) {
        utils::ErrorHandler::getInstance().reportError(e, "FusionConfigManager");
        return false;
    }

    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        utils::Logger::error("Invalid configuration loaded from: " + source);
        for (const auto& error : validationResult.errors) {
            utils::Logger::error("  Error: " + error);
        }
        return false;
    }

    for (const auto& warning : validationResult.warnings) {
        utils::Logger::warn("  Warning: " + warning);
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = newConfig;
    lastModified_ = std::chrono::steady_clock::now();
    return true;
}

FusionConfig FusionConfigManager::parseJsonConfig(const std::string& jsonStr) {
    FusionConfig config;

    try {
        nlohmann::json j = nlohmann::json::parse(jsonStr);
        if (!j.is_object()) {
            throw utils::ConfigurationError("Configuration root must be a JSON object");
        }

        config.tieEpsilon = j.value("tie_epsilon", config.tieEpsilon);

        if (j.contains("invalid_segment_policy")) {
            std::string policy = j["invalid_segment_policy"].get<std::string>();
            if (policy == "reject") {
                config.invalidSegmentPolicy = InvalidSegmentPolicy::REJECT;
            } else if (policy == "filter") {
                config.invalidSegmentPolicy = InvalidSegmentPolicy::FILTER;
            } else {
                throw utils::ConfigurationError("Unknown invalid_segment_policy", policy);
            }
        }

        config.annotateConfidence = j.value("annotate_confidence", config.annotateConfidence);
        config.lowConfidenceThreshold = j.value("low_confidence_threshold", config.lowConfidenceThreshold);
        config.unknownSpeakerLabel = j.value("unknown_speaker_label", config.unknownSpeakerLabel);
        config.logLevel = j.value("log_level", config.logLevel);

        if (j.contains("models")) {
            const auto& m = j["models"];
            config.models.transcriptionModelPath =
                m.value("transcription_model_path", config.models.transcriptionModelPath);
            config.models.diarizationModelPath =
                m.value("diarization_model_path", config.models.diarizationModelPath);
            config.models.diarizationEnabled =
                m.value("diarization_enabled", config.models.diarizationEnabled);
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::ConfigurationError("Failed to parse fusion configuration", e.what());
    }

    return config;
}

std::string FusionConfigManager::configToJson(const FusionConfig& config) {
    nlohmann::json j;

    j["tie_epsilon"] = config.tieEpsilon;
    j["invalid_segment_policy"] = toString(config.invalidSegmentPolicy);
    j["annotate_confidence"] = config.annotateConfidence;
    j["low_confidence_threshold"] = config.lowConfidenceThreshold;
    j["unknown_speaker_label"] = config.unknownSpeakerLabel;
    j["log_level"] = config.logLevel;

    j["models"] = {
        {"transcription_model_path", config.models.transcriptionModelPath},
        {"diarization_model_path", config.models.diarizationModelPath},
        {"diarization_enabled", config.models.diarizationEnabled}
    };

    return j.dump(2);
}

} // namespace fusion
} // namespace speakerfusion
