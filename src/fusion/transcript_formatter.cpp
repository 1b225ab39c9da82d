#include "fusion/transcript_formatter.hpp"
#include "fusion/interval.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace speakerfusion {
namespace fusion {

TranscriptFormatter::TranscriptFormatter(FormatOptions options)
    : options_(std::move(options)) {
}

std::string TranscriptFormatter::format(const DiarizedTranscript& transcript,
                                        const identity::IdentityRegistry& registry) const {
    std::ostringstream out;
    bool first = true;
    for (const auto& line : formatLines(transcript, registry)) {
        if (!first) {
            out << '\n';
        }
        out << line;
        first = false;
    }
    return out.str();
}

std::vector<std::string> TranscriptFormatter::formatLines(const DiarizedTranscript& transcript,
                                                          const identity::IdentityRegistry& registry) const {
    std::vector<std::string> lines;
    lines.reserve(transcript.segments.size());
    for (const auto& segment : transcript.segments) {
        lines.push_back(formatSegment(segment, registry, transcript.degraded));
    }
    return lines;
}

std::string TranscriptFormatter::formatSegment(const FusedSegment& segment,
                                               const identity::IdentityRegistry& registry,
                                               bool degraded) const {
    std::string name = segment.speaker_index
        ? registry.resolve(*segment.speaker_index).display_name
        : options_.unknownSpeakerLabel;

    std::ostringstream line;
    line << name << ": " << formatTimestamp(segment.start, segment.end);

    if (options_.annotateConfidence) {
        if (degraded) {
            line << " [degraded]";
        } else if (segment.confidence < options_.lowConfidenceThreshold) {
            line << " [" << std::fixed << std::setprecision(1)
                 << segment.confidence * 100.0f << "%]";
        }
    }

    line << ' ' << segment.text;
    return line.str();
}

std::string TranscriptFormatter::formatTimestamp(double start, double end) {
    return "[" + formatClock(start) + "-" + formatClock(end) + "]";
}

std::string TranscriptFormatter::formatClock(double seconds) {
    // NaN and negatives render as 00:00, anything past the validation bound is clamped
    long long whole = seconds > 0.0
        ? static_cast<long long>(std::floor(std::min(seconds, kMaxTimestampSeconds))) : 0;
    std::ostringstream clock;
    clock << std::setfill('0') << std::setw(2) << whole / 60
          << ':' << std::setw(2) << whole % 60;
    return clock.str();
}

} // namespace fusion
} // namespace speakerfusion
