#pragma once

#include "fusion/transcript_types.hpp"
#include "fusion/turn_index.hpp"
#include <string>
#include <vector>

namespace speakerfusion {
namespace fusion {

/**
 * Attributes transcript segments to diarization turns by temporal overlap.
 *
 * Each segment goes to the single turn it overlaps most; equal overlaps go to
 * the earlier turn. Confidence is the fraction of the segment covered by the
 * winning turn. Output is one FusedSegment per input segment, in input order,
 * with timing copied unchanged.
 *
 * The engine holds only configuration, so one instance may be shared by
 * concurrent fusions.
 */
class FusionEngine {
public:
    /**
     * @param tieEpsilon Overlaps differing by no more than this (seconds) are ties
     */
    explicit FusionEngine(double tieEpsilon = 1e-9);

    /**
     * Fuse every segment against the turn index
     * @throws utils::InvalidSegmentError if any segment fails validation
     */
    std::vector<FusedSegment> fuse(const std::vector<TranscriptSegment>& segments,
                                   const TurnIndex& turns) const;

    /**
     * Fuse one already validated segment
     */
    FusedSegment fuseSegment(const TranscriptSegment& segment, const TurnIndex& turns) const;

    /**
     * Build the transcript aggregate
     * @param totalDuration Recording length; when <= 0 the furthest segment or turn end is used
     * @param degraded Whether the turns came from the single-speaker fallback
     * @throws utils::InvalidTurnError, utils::InvalidSegmentError
     */
    DiarizedTranscript fuseTranscript(const std::vector<TranscriptSegment>& segments,
                                      const std::vector<SpeakerTurn>& turns,
                                      double totalDuration,
                                      bool degraded = false) const;

    /**
     * @throws utils::InvalidSegmentError naming the first offending segment
     */
    static void validateSegments(const std::vector<TranscriptSegment>& segments);

    /**
     * Check one segment against its predecessor's start
     * @param reason Set to a description of the problem when invalid
     */
    static bool isValidSegment(const TranscriptSegment& segment, double previousStart,
                               std::string& reason);

    /**
     * Keep only segments that would pass validation, preserving order
     * @param dropped Number of segments removed
     */
    static std::vector<TranscriptSegment> filterInvalidSegments(
        const std::vector<TranscriptSegment>& segments, size_t& dropped);

    /**
     * Number of distinct attributed speakers
     */
    static size_t countSpeakers(const std::vector<FusedSegment>& segments);

    double getTieEpsilon() const { return tieEpsilon_; }

private:
    double tieEpsilon_;
};

} // namespace fusion
} // namespace speakerfusion
