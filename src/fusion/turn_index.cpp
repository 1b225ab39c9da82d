#include "fusion/turn_index.hpp"
#include "fusion/interval.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace speakerfusion {
namespace fusion {

TurnIndex::TurnIndex(std::vector<SpeakerTurn> turns)
    : turns_(std::move(turns)) {
    for (size_t i = 0; i < turns_.size(); ++i) {
        validateTurn(turns_[i], i);
    }

    std::stable_sort(turns_.begin(), turns_.end(),
                     [](const SpeakerTurn& a, const SpeakerTurn& b) {
                         if (a.start != b.start) {
                             return a.start < b.start;
                         }
                         if (a.speaker_index != b.speaker_index) {
                             return a.speaker_index < b.speaker_index;
                         }
                         return a.end < b.end;
                     });
}

std::vector<SpeakerTurn> TurnIndex::turnsOverlapping(double start, double end) const {
    std::vector<SpeakerTurn> result;

    for (const auto& turn : turns_) {
        // Sorted by start: nothing after this can reach into [start, end)
        if (turn.start >= end) {
            break;
        }
        if (overlap(start, end, turn.start, turn.end) > 0.0) {
            result.push_back(turn);
        }
    }

    return result;
}

std::set<uint32_t> TurnIndex::speakerIndices() const {
    std::set<uint32_t> indices;
    for (const auto& turn : turns_) {
        indices.insert(turn.speaker_index);
    }
    return indices;
}

void TurnIndex::validateTurn(const SpeakerTurn& turn, size_t position) {
    if (isValidInterval(turn.start, turn.end) && turn.start >= 0.0
        && turn.end <= kMaxTimestampSeconds) {
        return;
    }

    std::ostringstream details;
    details << "turn #" << position << " (speaker " << turn.speaker_index
            << ") spans [" << turn.start << ", " << turn.end << ")";

    if (!std::isfinite(turn.start) || !std::isfinite(turn.end)) {
        throw utils::InvalidTurnError("Speaker turn has non-finite bounds", details.str());
    }
    if (turn.end > kMaxTimestampSeconds) {
        throw utils::InvalidTurnError("Speaker turn exceeds maximum timestamp", details.str());
    }
    if (turn.start < 0.0) {
        throw utils::InvalidTurnError("Speaker turn starts before the recording", details.str());
    }
    throw utils::InvalidTurnError("Speaker turn has non-positive duration", details.str());
}

} // namespace fusion
} // namespace speakerfusion
