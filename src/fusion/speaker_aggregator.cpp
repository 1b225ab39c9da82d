#include "fusion/speaker_aggregator.hpp"
#include <map>
#include <sstream>

namespace speakerfusion {
namespace fusion {

TranscriptStatistics SpeakerAggregator::aggregate(const std::vector<FusedSegment>& segments) {
    TranscriptStatistics stats;
    std::map<uint32_t, double> confidenceSums;

    for (const auto& segment : segments) {
        if (!segment.speaker_index) {
            stats.unattributed_count++;
            stats.unattributed_time += segment.duration();
            continue;
        }

        uint32_t speaker = *segment.speaker_index;
        SpeakerStatistics& entry = stats.speakers[speaker];
        entry.speaker_index = speaker;
        entry.segment_count++;
        entry.total_time += segment.duration();
        entry.word_count += countWords(segment.text);
        confidenceSums[speaker] += segment.confidence;
    }

    for (auto& [speaker, entry] : stats.speakers) {
        entry.mean_confidence = static_cast<float>(confidenceSums[speaker] / entry.segment_count);
    }

    return stats;
}

TranscriptStatistics SpeakerAggregator::aggregate(const DiarizedTranscript& transcript) {
    return aggregate(transcript.segments);
}

size_t SpeakerAggregator::countWords(const std::string& text) {
    std::istringstream stream(text);
    std::string token;
    size_t count = 0;
    while (stream >> token) {
        ++count;
    }
    return count;
}

} // namespace fusion
} // namespace speakerfusion
