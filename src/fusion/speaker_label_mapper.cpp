#include "fusion/speaker_label_mapper.hpp"
#include <algorithm>
#include <numeric>

namespace speakerfusion {
namespace fusion {

std::vector<SpeakerTurn> SpeakerLabelMapper::mapTurns(const std::vector<LabeledTurn>& turns) {
    // Visit in time order so indices follow first appearance
    std::vector<size_t> order(turns.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&turns](size_t a, size_t b) {
        return turns[a].start < turns[b].start;
    });

    for (size_t i : order) {
        indexFor(turns[i].label);
    }

    std::vector<SpeakerTurn> mapped;
    mapped.reserve(turns.size());
    for (const auto& turn : turns) {
        mapped.emplace_back(indices_.at(turn.label), turn.start, turn.end);
    }
    return mapped;
}

uint32_t SpeakerLabelMapper::indexFor(const std::string& label) {
    auto it = indices_.find(label);
    if (it != indices_.end()) {
        return it->second;
    }

    uint32_t index = static_cast<uint32_t>(labels_.size());
    indices_.emplace(label, index);
    labels_.push_back(label);
    return index;
}

std::string SpeakerLabelMapper::labelFor(uint32_t index) const {
    if (index >= labels_.size()) {
        return "";
    }
    return labels_[index];
}

void SpeakerLabelMapper::reset() {
    indices_.clear();
    labels_.clear();
}

} // namespace fusion
} // namespace speakerfusion
