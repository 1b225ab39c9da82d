#pragma once

#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace speakerfusion {
namespace fusion {

// All times are seconds relative to the start of the recording.

/**
 * A span of transcribed text as produced by the transcription model
 */
struct TranscriptSegment {
    std::string text;
    double start;
    double end;
    float source_confidence;

    TranscriptSegment() : start(0.0), end(0.0), source_confidence(1.0f) {}
    TranscriptSegment(const std::string& t, double s, double e, float conf = 1.0f)
        : text(t), start(s), end(e), source_confidence(conf) {}

    double duration() const { return end - start; }
};

/**
 * A span attributed to one speaker by the diarization model
 */
struct SpeakerTurn {
    uint32_t speaker_index;
    double start;
    double end;

    SpeakerTurn() : speaker_index(0), start(0.0), end(0.0) {}
    SpeakerTurn(uint32_t idx, double s, double e) : speaker_index(idx), start(s), end(e) {}

    double duration() const { return end - start; }
};

/**
 * Raw diarization output, speakers named by model-specific labels (e.g. "SPEAKER_00")
 */
struct LabeledTurn {
    std::string label;
    double start;
    double end;

    LabeledTurn() : start(0.0), end(0.0) {}
    LabeledTurn(const std::string& l, double s, double e) : label(l), start(s), end(e) {}
};

/**
 * A transcript segment attributed to at most one speaker.
 * An empty speaker_index with confidence 0.0 marks an unattributable segment.
 */
struct FusedSegment {
    std::string text;
    double start;
    double end;
    std::optional<uint32_t> speaker_index;
    float confidence;
    float source_confidence;

    FusedSegment() : start(0.0), end(0.0), confidence(0.0f), source_confidence(1.0f) {}

    bool isAttributed() const { return speaker_index.has_value(); }
    double duration() const { return end - start; }
};

/**
 * Human-assigned identity of a speaker index
 */
struct SpeakerProfile {
    uint32_t speaker_index;
    std::string display_name;
    std::optional<std::string> email;
    std::optional<std::string> title;
    std::optional<std::string> company;

    SpeakerProfile() : speaker_index(0) {}
    SpeakerProfile(uint32_t idx, const std::string& name)
        : speaker_index(idx), display_name(name) {}
};

struct SpeakerStatistics {
    uint32_t speaker_index;
    size_t segment_count;
    double total_time;
    float mean_confidence;
    size_t word_count;

    SpeakerStatistics()
        : speaker_index(0), segment_count(0), total_time(0.0)
        , mean_confidence(0.0f), word_count(0) {}
};

/**
 * Per-speaker statistics plus the segments no speaker could be attributed to
 */
struct TranscriptStatistics {
    std::map<uint32_t, SpeakerStatistics> speakers;
    size_t unattributed_count;
    double unattributed_time;

    TranscriptStatistics() : unattributed_count(0), unattributed_time(0.0) {}
};

/**
 * Speaker-attributed transcript of one recording
 */
struct DiarizedTranscript {
    std::vector<FusedSegment> segments;
    size_t speaker_count;
    double total_duration;
    bool degraded;  // turns were synthesized by the single-speaker fallback

    DiarizedTranscript() : speaker_count(0), total_duration(0.0), degraded(false) {}
};

} // namespace fusion
} // namespace speakerfusion
