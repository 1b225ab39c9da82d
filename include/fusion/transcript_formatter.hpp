#pragma once

#include "fusion/transcript_types.hpp"
#include "identity/identity_registry.hpp"
#include <string>
#include <vector>

namespace speakerfusion {
namespace fusion {

struct FormatOptions {
    bool annotateConfidence = false;
    float lowConfidenceThreshold = 0.9f;
    std::string unknownSpeakerLabel = "Unknown Speaker";
};

/**
 * Human-readable rendering, one line per fused segment:
 *   Alice: [00:00-00:05] Hello everyone
 */
class TranscriptFormatter {
public:
    explicit TranscriptFormatter(FormatOptions options = FormatOptions());

    std::string format(const DiarizedTranscript& transcript,
                       const identity::IdentityRegistry& registry) const;

    std::vector<std::string> formatLines(const DiarizedTranscript& transcript,
                                         const identity::IdentityRegistry& registry) const;

    std::string formatSegment(const FusedSegment& segment,
                              const identity::IdentityRegistry& registry,
                              bool degraded = false) const;

    /**
     * "[mm:ss-mm:ss]"; seconds are floored, minutes keep counting past 59
     */
    static std::string formatTimestamp(double start, double end);

private:
    static std::string formatClock(double seconds);

    FormatOptions options_;
};

} // namespace fusion
} // namespace speakerfusion
