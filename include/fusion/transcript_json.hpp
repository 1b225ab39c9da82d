#pragma once

#include "fusion/transcript_types.hpp"
#include "identity/identity_registry.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace speakerfusion {
namespace fusion {

/**
 * JSON encoding of collaborator outputs and of the finished transcript.
 *
 * Input shapes:
 *   segments: [{"text", "start", "end", "confidence"?}]
 *   labeled turns: [{"speaker", "start", "end"}]
 *   indexed turns: [{"speaker_index", "start", "end"}]
 */
namespace json {

/**
 * @throws utils::InvalidSegmentError on malformed input
 */
std::vector<TranscriptSegment> segmentsFromJson(const nlohmann::json& j);

/**
 * @throws utils::InvalidTurnError on malformed input
 */
std::vector<LabeledTurn> labeledTurnsFromJson(const nlohmann::json& j);

/**
 * @throws utils::InvalidTurnError on malformed input
 */
std::vector<SpeakerTurn> turnsFromJson(const nlohmann::json& j);

nlohmann::json segmentToJson(const FusedSegment& segment);

nlohmann::json statisticsToJson(const TranscriptStatistics& stats,
                                const identity::IdentityRegistry& registry);

/**
 * Full response document: segments, speaker_count, speaker_names,
 * total_duration, degraded, speaker_stats, unattributed_count,
 * unattributed_time and formatted_transcript.
 */
nlohmann::json transcriptToJson(const DiarizedTranscript& transcript,
                                const identity::IdentityRegistry& registry,
                                const TranscriptStatistics& stats,
                                const std::string& formattedTranscript);

} // namespace json
} // namespace fusion
} // namespace speakerfusion
