#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <random>
#include <algorithm>
#include <utility>

namespace speakerfusion {
namespace utils {

// Thread-local storage for error context
thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_recording_id_;

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& rid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), recording_id(rid) {

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TRANSCRIPTION: return "Transcription";
        case ErrorCategory::DIARIZATION: return "Diarization";
        case ErrorCategory::FUSION: return "Fusion";
        case ErrorCategory::IDENTITY: return "Identity";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::MODEL_LOADING: return "ModelLoading";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string toString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

// SpeakerFusionException implementation
SpeakerFusionException::SpeakerFusionException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* SpeakerFusionException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

// Specific exception implementations
InvalidTurnError::InvalidTurnError(const std::string& message, const std::string& details)
    : SpeakerFusionException(ErrorInfo(ErrorCategory::FUSION, ErrorSeverity::ERROR,
                                       message, details, "TurnIndex")) {
}

InvalidSegmentError::InvalidSegmentError(const std::string& message, const std::string& details)
    : SpeakerFusionException(ErrorInfo(ErrorCategory::FUSION, ErrorSeverity::ERROR,
                                       message, details, "SegmentValidation")) {
}

UnknownSpeakerError::UnknownSpeakerError(uint32_t speaker_index)
    : SpeakerFusionException(ErrorInfo(ErrorCategory::IDENTITY, ErrorSeverity::WARNING,
                                       "Unknown speaker index " + std::to_string(speaker_index),
                                       "speaker does not appear in the transcript",
                                       "IdentityRegistry"))
    , speaker_index_(speaker_index) {
}

TranscriptionError::TranscriptionError(const std::string& message, const std::string& recording_id)
    : SpeakerFusionException(ErrorInfo(ErrorCategory::TRANSCRIPTION, ErrorSeverity::ERROR,
                                       message, "", "Transcription", recording_id)) {
}

DiarizationFailedError::DiarizationFailedError(const std::string& message, const std::string& recording_id)
    : SpeakerFusionException(ErrorInfo(ErrorCategory::DIARIZATION, ErrorSeverity::ERROR,
                                       message, "", "Diarization", recording_id)) {
}

ConfigurationError::ConfigurationError(const std::string& message, const std::string& details)
    : SpeakerFusionException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                       message, details, "Configuration")) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& recording_id) {
    if (auto fusion_error = dynamic_cast<const SpeakerFusionException*>(&e)) {
        ErrorInfo error = fusion_error->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        if (!recording_id.empty()) {
            error.recording_id = recording_id;
        }
        reportError(error);
        return;
    }

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, recording_id);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                         [category](const ErrorInfo& error) {
                             return error.category == category;
                         });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = max_size;
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << toString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.recording_id.empty()) {
        log_message << " | Recording: " << error.recording_id;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

// ErrorContext implementation
ErrorContext::ErrorContext(const std::string& context, const std::string& recording_id)
    : previous_context_(current_context_), previous_recording_id_(current_recording_id_) {
    current_context_ = context;
    if (!recording_id.empty()) {
        current_recording_id_ = recording_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_recording_id_ = previous_recording_id_;
}

void ErrorContext::setContext(const std::string& context) {
    current_context_ = context;
}

void ErrorContext::setRecordingId(const std::string& recording_id) {
    current_recording_id_ = recording_id;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentRecordingId() {
    return current_recording_id_;
}

} // namespace utils
} // namespace speakerfusion
