#pragma once

#include "models/model_context.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace speakerfusion {
namespace fusion {

/**
 * What to do with transcript segments that cannot be fused
 */
enum class InvalidSegmentPolicy {
    REJECT,  // throw InvalidSegmentError, the recording fails
    FILTER   // drop the segment with a warning and fuse the rest
};

/**
 * Fusion-specific configuration structure
 */
struct FusionConfig {
    // Fusion settings
    double tieEpsilon = 1e-9;  // overlaps closer than this are treated as equal
    InvalidSegmentPolicy invalidSegmentPolicy = InvalidSegmentPolicy::REJECT;

    // Rendering settings
    bool annotateConfidence = false;
    float lowConfidenceThreshold = 0.9f;
    std::string unknownSpeakerLabel = "Unknown Speaker";

    // Logging
    std::string logLevel = "INFO";

    // Collaborator models
    models::ModelConfig models;
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

std::string toString(InvalidSegmentPolicy policy);

/**
 * Fusion Configuration Manager
 * Handles loading, validation and saving of the fusion configuration
 */
class FusionConfigManager {
public:
    FusionConfigManager();
    ~FusionConfigManager() = default;

    /**
     * Load configuration from file. A missing file leaves the defaults in place.
     * @param configPath Path to configuration file
     * @return true if loaded successfully
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * Save configuration to file
     * @param configPath Path to configuration file
     * @return true if saved successfully
     */
    bool saveToFile(const std::string& configPath) const;

    /**
     * Load configuration from JSON string
     * @param jsonStr JSON configuration string
     * @return true if loaded successfully
     */
    bool loadFromJson(const std::string& jsonStr);

    std::string exportToJson() const;

    FusionConfig getConfig() const;

    /**
     * Replace the configuration if it validates
     * @return Validation result; the configuration is unchanged on error
     */
    ConfigValidationResult updateConfig(const FusionConfig& newConfig);

    ConfigValidationResult validateConfig(const FusionConfig& config) const;

    void resetToDefaults();

    bool isModified() const;
    std::string getConfigFilePath() const;

    /**
     * Parse a configuration document. Absent keys keep their defaults.
     * @throws utils::ConfigurationError on malformed JSON or mistyped values
     */
    static FusionConfig parseJsonConfig(const std::string& jsonStr);
    static std::string configToJson(const FusionConfig& config);

private:
    bool applyParsedConfig(const std::string& jsonStr, const std::string& source);

    FusionConfig config_;
    std::string configFilePath_;
    bool isModified_;
    std::chrono::steady_clock::time_point lastModified_;

    mutable std::mutex configMutex_;
};

} // namespace fusion
} // namespace speakerfusion
