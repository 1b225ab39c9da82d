#include "fusion/fallback_controller.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace speakerfusion {
namespace fusion {

bool FallbackController::shouldFallBack(pipeline::CollaboratorStatus diarizationStatus) {
    return diarizationStatus == pipeline::CollaboratorStatus::UNAVAILABLE;
}

std::vector<SpeakerTurn> FallbackController::synthesizeTurns(double totalDuration,
                                                             const std::vector<TranscriptSegment>& segments) {
    double span = std::isfinite(totalDuration) ? std::max(0.0, totalDuration) : 0.0;
    for (const auto& segment : segments) {
        if (std::isfinite(segment.end)) {
            span = std::max(span, segment.end);
        }
    }

    if (span <= 0.0) {
        utils::Logger::debug("Fallback for an empty recording, no turn synthesized");
        return {};
    }

    utils::Logger::info("Diarization unavailable, attributing recording to a single speaker");
    return {SpeakerTurn(0, 0.0, span)};
}

} // namespace fusion
} // namespace speakerfusion
