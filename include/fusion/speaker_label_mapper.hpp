#pragma once

#include "fusion/transcript_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace speakerfusion {
namespace fusion {

/**
 * Maps model-native speaker labels onto dense indices 0..n-1.
 *
 * Indices are handed out in order of first appearance in time, so the first
 * voice heard is speaker 0 regardless of how the model named it.
 */
class SpeakerLabelMapper {
public:
    SpeakerLabelMapper() = default;

    /**
     * Convert labeled turns to indexed turns. Labels seen by an earlier call
     * keep their index.
     * @param turns Labeled turns in any order
     * @return Indexed turns, in the same order as the input
     */
    std::vector<SpeakerTurn> mapTurns(const std::vector<LabeledTurn>& turns);

    /**
     * Index for a label, assigning the next free index if it is new
     */
    uint32_t indexFor(const std::string& label);

    /**
     * @return Original label, or an empty string for an unmapped index
     */
    std::string labelFor(uint32_t index) const;

    size_t size() const { return labels_.size(); }
    void reset();

private:
    std::map<std::string, uint32_t> indices_;
    std::vector<std::string> labels_;
};

} // namespace fusion
} // namespace speakerfusion
