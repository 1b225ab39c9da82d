#pragma once

#include "pipeline/collaborators.hpp"
#include "fusion/fusion_config.hpp"
#include "fusion/fusion_engine.hpp"
#include "fusion/transcript_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace speakerfusion {
namespace pipeline {

/**
 * Turns one recording into a speaker-attributed transcript.
 *
 * Transcription failures of any kind are fatal. Diarization UNAVAILABLE falls
 * back to a single speaker and marks the transcript degraded; diarization
 * FAILED is fatal. Nothing is retried. Every fatal error is reported to the
 * ErrorHandler before it propagates.
 *
 * The pipeline keeps no per-recording state; concurrent process() calls are
 * safe as long as the collaborators themselves are.
 */
class TranscriptPipeline {
public:
    TranscriptPipeline(std::shared_ptr<TranscriptionSource> transcriber,
                       std::shared_ptr<DiarizationSource> diarizer,
                       const fusion::FusionConfig& config = fusion::FusionConfig());

    /**
     * Transcribe, diarize and fuse a recording
     * @param audio Decoded mono audio
     * @param recordingId Identifier attached to logs and error reports
     * @throws utils::TranscriptionError, utils::DiarizationFailedError,
     *         utils::InvalidSegmentError, utils::InvalidTurnError
     */
    fusion::DiarizedTranscript process(const AudioBuffer& audio, const std::string& recordingId = "");

    /**
     * Fuse collaborator outputs the caller already holds
     * @param totalDuration Recording length in seconds (<= 0 if unknown)
     */
    fusion::DiarizedTranscript processSegments(const std::vector<fusion::TranscriptSegment>& segments,
                                               const DiarizationOutcome& diarization,
                                               double totalDuration,
                                               const std::string& recordingId = "") const;

    const fusion::FusionConfig& getConfig() const { return config_; }

private:
    std::vector<fusion::TranscriptSegment> prepareSegments(
        const std::vector<fusion::TranscriptSegment>& segments) const;

    fusion::DiarizedTranscript fuseWithOutcome(const std::vector<fusion::TranscriptSegment>& segments,
                                               const DiarizationOutcome& diarization,
                                               double totalDuration,
                                               const std::string& recordingId) const;

    std::shared_ptr<TranscriptionSource> transcriber_;
    std::shared_ptr<DiarizationSource> diarizer_;
    fusion::FusionConfig config_;
    fusion::FusionEngine engine_;
};

} // namespace pipeline
} // namespace speakerfusion
