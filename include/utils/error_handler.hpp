#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>
#include <cstdint>

namespace speakerfusion {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per pipeline stage
 */
enum class ErrorCategory {
    TRANSCRIPTION,
    DIARIZATION,
    FUSION,
    IDENTITY,
    CONFIGURATION,
    MODEL_LOADING,
    UNKNOWN
};

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string recording_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& rid = "");
};

std::string toString(ErrorCategory category);
std::string toString(ErrorSeverity severity);

/**
 * Base class of every exception raised by the fusion core
 */
class SpeakerFusionException : public std::exception {
public:
    explicit SpeakerFusionException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

/**
 * A diarization turn with non-positive duration or invalid bounds
 */
class InvalidTurnError : public SpeakerFusionException {
public:
    InvalidTurnError(const std::string& message, const std::string& details = "");
};

/**
 * A transcription segment that cannot be fused (zero duration, out of order, ...)
 */
class InvalidSegmentError : public SpeakerFusionException {
public:
    InvalidSegmentError(const std::string& message, const std::string& details = "");
};

/**
 * Identity assignment for a speaker index absent from the transcript
 */
class UnknownSpeakerError : public SpeakerFusionException {
public:
    explicit UnknownSpeakerError(uint32_t speaker_index);
    uint32_t getSpeakerIndex() const { return speaker_index_; }

private:
    uint32_t speaker_index_;
};

class TranscriptionError : public SpeakerFusionException {
public:
    TranscriptionError(const std::string& message, const std::string& recording_id = "");
};

/**
 * Diarization ran but failed on this input. Never downgraded to the fallback.
 */
class DiarizationFailedError : public SpeakerFusionException {
public:
    DiarizationFailedError(const std::string& message, const std::string& recording_id = "");
};

class ConfigurationError : public SpeakerFusionException {
public:
    ConfigurationError(const std::string& message, const std::string& details = "");
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error reporter. Keeps a bounded history for observability;
 * it never retries or recovers, callers decide what a failure means.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    // Error reporting
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& recording_id = "");

    void setErrorCallback(ErrorCallback callback);

    // Error statistics; UNKNOWN counts every category
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& recording_id = "");
    ~ErrorContext();

    void setContext(const std::string& context);
    void setRecordingId(const std::string& recording_id);

    static std::string getCurrentContext();
    static std::string getCurrentRecordingId();

private:
    std::string previous_context_;
    std::string previous_recording_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_recording_id_;
};

#define SPEAKERFUSION_REPORT_ERROR(category, severity, message, details) \
    do { \
        ::speakerfusion::utils::ErrorInfo sf_error_(category, severity, message, details, \
                       ::speakerfusion::utils::ErrorContext::getCurrentContext(), \
                       ::speakerfusion::utils::ErrorContext::getCurrentRecordingId()); \
        ::speakerfusion::utils::ErrorHandler::getInstance().reportError(sf_error_); \
    } while(0)

} // namespace utils
} // namespace speakerfusion
