#pragma once

#include "fusion/transcript_types.hpp"
#include <string>
#include <vector>

namespace speakerfusion {
namespace fusion {

/**
 * Per-speaker statistics over a fused segment list.
 * Always recomputed from the segments handed in; nothing is cached.
 */
class SpeakerAggregator {
public:
    static TranscriptStatistics aggregate(const std::vector<FusedSegment>& segments);
    static TranscriptStatistics aggregate(const DiarizedTranscript& transcript);

    /**
     * Whitespace-separated token count
     */
    static size_t countWords(const std::string& text);
};

} // namespace fusion
} // namespace speakerfusion
