#include "pipeline/collaborators.hpp"
#include "utils/logging.hpp"
#include <utility>

namespace speakerfusion {
namespace pipeline {

std::string toString(CollaboratorStatus status) {
    switch (status) {
        case CollaboratorStatus::SUCCESS: return "success";
        case CollaboratorStatus::UNAVAILABLE: return "unavailable";
        case CollaboratorStatus::FAILED: return "failed";
    }
    return "failed";
}

TranscriptionOutcome TranscriptionOutcome::success(std::vector<fusion::TranscriptSegment> segments) {
    TranscriptionOutcome outcome;
    outcome.status = CollaboratorStatus::SUCCESS;
    outcome.segments = std::move(segments);
    return outcome;
}

TranscriptionOutcome TranscriptionOutcome::unavailable(const std::string& reason) {
    TranscriptionOutcome outcome;
    outcome.status = CollaboratorStatus::UNAVAILABLE;
    outcome.error = reason;
    return outcome;
}

TranscriptionOutcome TranscriptionOutcome::failed(const std::string& reason) {
    TranscriptionOutcome outcome;
    outcome.status = CollaboratorStatus::FAILED;
    outcome.error = reason;
    return outcome;
}

DiarizationOutcome DiarizationOutcome::success(std::vector<fusion::LabeledTurn> turns) {
    DiarizationOutcome outcome;
    outcome.status = CollaboratorStatus::SUCCESS;
    outcome.turns = std::move(turns);
    return outcome;
}

DiarizationOutcome DiarizationOutcome::unavailable(const std::string& reason) {
    DiarizationOutcome outcome;
    outcome.status = CollaboratorStatus::UNAVAILABLE;
    outcome.error = reason;
    return outcome;
}

DiarizationOutcome DiarizationOutcome::failed(const std::string& reason) {
    DiarizationOutcome outcome;
    outcome.status = CollaboratorStatus::FAILED;
    outcome.error = reason;
    return outcome;
}

GatedDiarizationSource::GatedDiarizationSource(std::shared_ptr<DiarizationSource> inner,
                                               std::shared_ptr<const models::ModelContext> context)
    : inner_(std::move(inner)), context_(std::move(context)) {
}

DiarizationOutcome GatedDiarizationSource::diarize(const AudioBuffer& audio) {
    if (!inner_) {
        return DiarizationOutcome::unavailable("no diarization source configured");
    }
    if (!context_) {
        return DiarizationOutcome::unavailable("model context not initialized");
    }
    if (!context_->isDiarizationEnabled()) {
        return DiarizationOutcome::unavailable("diarization disabled");
    }
    if (!context_->isDiarizationModelLoaded()) {
        return DiarizationOutcome::unavailable("diarization model not loaded");
    }

    utils::Logger::debug("Running diarization with " + inner_->getName());
    return inner_->diarize(audio);
}

std::string GatedDiarizationSource::getName() const {
    return inner_ ? "gated(" + inner_->getName() + ")" : "gated(<none>)";
}

} // namespace pipeline
} // namespace speakerfusion
