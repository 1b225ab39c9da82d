#include "fusion/fusion_engine.hpp"
#include "fusion/interval.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>

namespace speakerfusion {
namespace fusion {

FusionEngine::FusionEngine(double tieEpsilon)
    : tieEpsilon_(tieEpsilon < 0.0 ? 0.0 : tieEpsilon) {
}

std::vector<FusedSegment> FusionEngine::fuse(const std::vector<TranscriptSegment>& segments,
                                             const TurnIndex& turns) const {
    validateSegments(segments);

    std::vector<FusedSegment> fused;
    fused.reserve(segments.size());

    for (const auto& segment : segments) {
        fused.push_back(fuseSegment(segment, turns));
    }

    return fused;
}

FusedSegment FusionEngine::fuseSegment(const TranscriptSegment& segment, const TurnIndex& turns) const {
    FusedSegment result;
    result.text = segment.text;
    result.start = segment.start;
    result.end = segment.end;
    result.source_confidence = segment.source_confidence;
    result.confidence = 0.0f;

    auto candidates = turns.turnsOverlapping(segment.start, segment.end);
    if (candidates.empty()) {
        return result;
    }

    // Candidates arrive in ascending start order, so keeping the first of
    // equal overlaps makes the earliest turn win ties.
    const SpeakerTurn* winner = nullptr;
    double bestOverlap = -std::numeric_limits<double>::infinity();
    for (const auto& turn : candidates) {
        double amount = overlap(segment.start, segment.end, turn.start, turn.end);
        if (amount > bestOverlap + tieEpsilon_) {
            bestOverlap = amount;
            winner = &turn;
        }
    }

    double coverage = bestOverlap / segment.duration();
    result.speaker_index = winner->speaker_index;
    result.confidence = static_cast<float>(std::clamp(coverage, 0.0, 1.0));
    if (result.confidence <= 0.0f) {
        // 0.0 is reserved for unattributed segments
        result.confidence = std::nextafter(0.0f, 1.0f);
    }

    return result;
}

DiarizedTranscript FusionEngine::fuseTranscript(const std::vector<TranscriptSegment>& segments,
                                                const std::vector<SpeakerTurn>& turns,
                                                double totalDuration,
                                                bool degraded) const {
    TurnIndex index(turns);

    DiarizedTranscript transcript;
    transcript.segments = fuse(segments, index);
    transcript.speaker_count = countSpeakers(transcript.segments);
    transcript.degraded = degraded;

    if (totalDuration > 0.0) {
        transcript.total_duration = totalDuration;
    } else {
        double furthest = 0.0;
        for (const auto& segment : segments) {
            furthest = std::max(furthest, segment.end);
        }
        for (const auto& turn : index.turns()) {
            furthest = std::max(furthest, turn.end);
        }
        transcript.total_duration = furthest;
    }

    std::ostringstream summary;
    summary << "Fused " << transcript.segments.size() << " segments against "
            << index.size() << " turns, " << transcript.speaker_count << " speakers"
            << (degraded ? " (degraded)" : "");
    utils::Logger::debug(summary.str());

    return transcript;
}

void FusionEngine::validateSegments(const std::vector<TranscriptSegment>& segments) {
    double previousStart = 0.0;
    std::string reason;

    for (size_t i = 0; i < segments.size(); ++i) {
        if (!isValidSegment(segments[i], previousStart, reason)) {
            std::ostringstream details;
            details << "segment #" << i << " [" << segments[i].start << ", "
                    << segments[i].end << "): " << reason;
            throw utils::InvalidSegmentError("Transcript segment cannot be fused", details.str());
        }
        previousStart = segments[i].start;
    }
}

bool FusionEngine::isValidSegment(const TranscriptSegment& segment, double previousStart,
                                  std::string& reason) {
    if (!std::isfinite(segment.start) || !std::isfinite(segment.end)) {
        reason = "non-finite bounds";
        return false;
    }
    if (segment.end > kMaxTimestampSeconds) {
        reason = "exceeds maximum timestamp";
        return false;
    }
    if (segment.start < 0.0) {
        reason = "starts before the recording";
        return false;
    }
    if (segment.end <= segment.start) {
        reason = "non-positive duration";
        return false;
    }
    if (!(segment.source_confidence >= 0.0f && segment.source_confidence <= 1.0f)) {
        reason = "source confidence outside [0, 1]";
        return false;
    }
    if (segment.start < previousStart) {
        reason = "starts before the previous segment";
        return false;
    }
    return true;
}

std::vector<TranscriptSegment> FusionEngine::filterInvalidSegments(
    const std::vector<TranscriptSegment>& segments, size_t& dropped) {
    std::vector<TranscriptSegment> kept;
    kept.reserve(segments.size());
    dropped = 0;

    double previousStart = 0.0;
    std::string reason;
    for (const auto& segment : segments) {
        if (isValidSegment(segment, previousStart, reason)) {
            kept.push_back(segment);
            previousStart = segment.start;
        } else {
            ++dropped;
            utils::Logger::warn("Dropping transcript segment \"" + segment.text + "\": " + reason);
        }
    }

    return kept;
}

size_t FusionEngine::countSpeakers(const std::vector<FusedSegment>& segments) {
    std::set<uint32_t> speakers;
    for (const auto& segment : segments) {
        if (segment.speaker_index) {
            speakers.insert(*segment.speaker_index);
        }
    }
    return speakers.size();
}

} // namespace fusion
} // namespace speakerfusion
