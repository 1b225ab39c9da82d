#include "pipeline/transcript_pipeline.hpp"
#include "fusion/fallback_controller.hpp"
#include "fusion/speaker_label_mapper.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <sstream>
#include <utility>

namespace speakerfusion {
namespace pipeline {

TranscriptPipeline::TranscriptPipeline(std::shared_ptr<TranscriptionSource> transcriber,
                                       std::shared_ptr<DiarizationSource> diarizer,
                                       const fusion::FusionConfig& config)
    : transcriber_(std::move(transcriber))
    , diarizer_(std::move(diarizer))
    , config_(config)
    , engine_(config.tieEpsilon) {
}

fusion::DiarizedTranscript TranscriptPipeline::process(const AudioBuffer& audio,
                                                       const std::string& recordingId) {
    utils::ErrorContext context("TranscriptPipeline", recordingId);
    auto startTime = std::chrono::steady_clock::now();

    try {
        if (!transcriber_) {
            throw utils::TranscriptionError("No transcription source configured", recordingId);
        }

        TranscriptionOutcome transcription = transcriber_->transcribe(audio);
        if (transcription.status != CollaboratorStatus::SUCCESS) {
            throw utils::TranscriptionError("Transcription " + toString(transcription.status) +
                                            ": " + transcription.error, recordingId);
        }
        utils::Logger::info("Transcription complete: " +
                            std::to_string(transcription.segments.size()) + " segments");

        auto segments = prepareSegments(transcription.segments);

        DiarizationOutcome diarization = diarizer_
            ? diarizer_->diarize(audio)
            : DiarizationOutcome::unavailable("no diarization source configured");

        auto transcript = fuseWithOutcome(segments, diarization, audio.durationSeconds(), recordingId);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
        std::ostringstream summary;
        summary << "Recording " << (recordingId.empty() ? "<unnamed>" : recordingId)
                << " processed in " << elapsed.count() << "ms: "
                << transcript.segments.size() << " segments, "
                << transcript.speaker_count << " speakers"
                << (transcript.degraded ? ", degraded" : "");
        utils::Logger::info(summary.str());

        return transcript;
    } catch (const utils::SpeakerFusionException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "TranscriptPipeline", recordingId);
        throw;
    }
}

fusion::DiarizedTranscript TranscriptPipeline::processSegments(
    const std::vector<fusion::TranscriptSegment>& segments,
    const DiarizationOutcome& diarization,
    double totalDuration,
    const std::string& recordingId) const {
    utils::ErrorContext context("TranscriptPipeline", recordingId);

    try {
        return fuseWithOutcome(prepareSegments(segments), diarization, totalDuration, recordingId);
    } catch (const utils::SpeakerFusionException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "TranscriptPipeline", recordingId);
        throw;
    }
}

std::vector<fusion::TranscriptSegment> TranscriptPipeline::prepareSegments(
    const std::vector<fusion::TranscriptSegment>& segments) const {
    if (config_.invalidSegmentPolicy == fusion::InvalidSegmentPolicy::REJECT) {
        fusion::FusionEngine::validateSegments(segments);
        return segments;
    }

    size_t dropped = 0;
    auto kept = fusion::FusionEngine::filterInvalidSegments(segments, dropped);
    if (dropped > 0) {
        utils::Logger::warn("Filtered " + std::to_string(dropped) + " invalid transcript segments");
    }
    return kept;
}

fusion::DiarizedTranscript TranscriptPipeline::fuseWithOutcome(
    const std::vector<fusion::TranscriptSegment>& segments,
    const DiarizationOutcome& diarization,
    double totalDuration,
    const std::string& recordingId) const {
    if (diarization.status == CollaboratorStatus::FAILED) {
        throw utils::DiarizationFailedError("Diarization failed: " + diarization.error, recordingId);
    }

    if (fusion::FallbackController::shouldFallBack(diarization.status)) {
        SPEAKERFUSION_REPORT_ERROR(utils::ErrorCategory::DIARIZATION, utils::ErrorSeverity::WARNING,
                                   "Diarization unavailable, using single-speaker fallback",
                                   diarization.error);
        auto turns = fusion::FallbackController::synthesizeTurns(totalDuration, segments);
        return engine_.fuseTranscript(segments, turns, totalDuration, true);
    }

    fusion::SpeakerLabelMapper mapper;
    auto turns = mapper.mapTurns(diarization.turns);
    utils::Logger::info("Diarization complete: " + std::to_string(turns.size()) +
                        " speaker turns, " + std::to_string(mapper.size()) + " labels");

    return engine_.fuseTranscript(segments, turns, totalDuration, false);
}

} // namespace pipeline
} // namespace speakerfusion
