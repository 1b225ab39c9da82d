#pragma once

#include "fusion/transcript_types.hpp"
#include <set>
#include <vector>

namespace speakerfusion {
namespace fusion {

/**
 * Ordered, validated collection of speaker turns for one recording.
 *
 * Turns are kept sorted by start time (ties by speaker index, then end), so
 * every query returns its matches in ascending start order. Recordings carry
 * tens to a few hundred turns; a linear scan with early exit is enough.
 */
class TurnIndex {
public:
    /**
     * @param turns Diarization turns in any order
     * @throws utils::InvalidTurnError if a turn has end <= start, a negative
     *         start, a non-finite bound or an end past kMaxTimestampSeconds
     */
    explicit TurnIndex(std::vector<SpeakerTurn> turns);

    /**
     * All turns whose interval overlaps [start, end) by a positive amount
     * @return Matching turns in ascending start order
     */
    std::vector<SpeakerTurn> turnsOverlapping(double start, double end) const;

    const std::vector<SpeakerTurn>& turns() const { return turns_; }
    std::set<uint32_t> speakerIndices() const;
    size_t size() const { return turns_.size(); }
    bool empty() const { return turns_.empty(); }

private:
    static void validateTurn(const SpeakerTurn& turn, size_t position);

    std::vector<SpeakerTurn> turns_;
};

} // namespace fusion
} // namespace speakerfusion
