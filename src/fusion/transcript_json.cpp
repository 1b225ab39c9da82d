#include "fusion/transcript_json.hpp"
#include "utils/error_handler.hpp"
#include <cstdint>
#include <set>
#include <utility>

namespace speakerfusion {
namespace fusion {
namespace json {

namespace {

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

std::vector<TranscriptSegment> segmentsFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw utils::InvalidSegmentError("Transcript segments must be a JSON array");
    }

    std::vector<TranscriptSegment> segments;
    segments.reserve(j.size());

    try {
        for (const auto& item : j) {
            TranscriptSegment segment;
            segment.text = item.at("text").get<std::string>();
            segment.start = item.at("start").get<double>();
            segment.end = item.at("end").get<double>();
            segment.source_confidence = item.value("confidence", 1.0f);
            segments.push_back(std::move(segment));
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::InvalidSegmentError("Malformed transcript segment", e.what());
    }

    return segments;
}

std::vector<LabeledTurn> labeledTurnsFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw utils::InvalidTurnError("Speaker turns must be a JSON array");
    }

    std::vector<LabeledTurn> turns;
    turns.reserve(j.size());

    try {
        for (const auto& item : j) {
            turns.emplace_back(item.at("speaker").get<std::string>(),
                               item.at("start").get<double>(),
                               item.at("end").get<double>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::InvalidTurnError("Malformed speaker turn", e.what());
    }

    return turns;
}

std::vector<SpeakerTurn> turnsFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw utils::InvalidTurnError("Speaker turns must be a JSON array");
    }

    std::vector<SpeakerTurn> turns;
    turns.reserve(j.size());

    try {
        for (const auto& item : j) {
            const auto& index = item.at("speaker_index");
            if (!index.is_number_unsigned()) {
                throw utils::InvalidTurnError("Speaker index must be a non-negative integer",
                                              index.dump());
            }
            uint64_t raw = index.get<uint64_t>();
            if (raw > UINT32_MAX) {
                throw utils::InvalidTurnError("Speaker index out of range", index.dump());
            }
            turns.emplace_back(static_cast<uint32_t>(raw),
                               item.at("start").get<double>(),
                               item.at("end").get<double>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::InvalidTurnError("Malformed speaker turn", e.what());
    }

    return turns;
}

nlohmann::json segmentToJson(const FusedSegment& segment) {
    nlohmann::json j;
    j["speaker_index"] = segment.speaker_index
        ? nlohmann::json(*segment.speaker_index) : nlohmann::json(nullptr);
    j["start_time"] = segment.start;
    j["end_time"] = segment.end;
    j["text"] = segment.text;
    j["confidence"] = segment.confidence;
    return j;
}

nlohmann::json statisticsToJson(const TranscriptStatistics& stats,
                                const identity::IdentityRegistry& registry) {
    nlohmann::json speakers = nlohmann::json::object();
    for (const auto& [index, entry] : stats.speakers) {
        speakers[std::to_string(index)] = {
            {"name", registry.resolve(index).display_name},
            {"segment_count", entry.segment_count},
            {"total_time", entry.total_time},
            {"avg_confidence", entry.mean_confidence},
            {"words", entry.word_count}
        };
    }
    return speakers;
}

nlohmann::json transcriptToJson(const DiarizedTranscript& transcript,
                                const identity::IdentityRegistry& registry,
                                const TranscriptStatistics& stats,
                                const std::string& formattedTranscript) {
    nlohmann::json j;

    nlohmann::json segments = nlohmann::json::array();
    std::set<uint32_t> speakers;
    for (const auto& segment : transcript.segments) {
        segments.push_back(segmentToJson(segment));
        if (segment.speaker_index) {
            speakers.insert(*segment.speaker_index);
        }
    }

    nlohmann::json names = nlohmann::json::object();
    for (uint32_t index : speakers) {
        auto profile = registry.resolve(index);
        names[std::to_string(index)] = {
            {"name", profile.display_name},
            {"email", optionalToJson(profile.email)},
            {"title", optionalToJson(profile.title)},
            {"company", optionalToJson(profile.company)}
        };
    }

    j["segments"] = segments;
    j["speaker_count"] = transcript.speaker_count;
    j["speaker_names"] = names;
    j["total_duration"] = transcript.total_duration;
    j["degraded"] = transcript.degraded;
    j["speaker_stats"] = statisticsToJson(stats, registry);
    j["unattributed_count"] = stats.unattributed_count;
    j["unattributed_time"] = stats.unattributed_time;
    j["formatted_transcript"] = formattedTranscript;

    return j;
}

} // namespace json
} // namespace fusion
} // namespace speakerfusion
