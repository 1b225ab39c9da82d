#pragma once

#include "fusion/transcript_types.hpp"
#include "pipeline/collaborators.hpp"
#include <vector>

namespace speakerfusion {
namespace fusion {

/**
 * Single-speaker substitute for an unavailable diarization model.
 *
 * Only UNAVAILABLE selects the fallback. A FAILED diarization is a defect on
 * that input and must surface; covering it with a fully-confident single
 * speaker would hide it. Transcripts built from synthesized turns are marked
 * degraded, and their 1.0 confidences mean containment, not certainty.
 */
class FallbackController {
public:
    static bool shouldFallBack(pipeline::CollaboratorStatus diarizationStatus);

    /**
     * One turn for speaker 0 covering [0, span), where span is the larger of
     * the recording length and the last segment end. Empty when both are zero.
     */
    static std::vector<SpeakerTurn> synthesizeTurns(double totalDuration,
                                                    const std::vector<TranscriptSegment>& segments);
};

} // namespace fusion
} // namespace speakerfusion
