#pragma once

#include "fusion/transcript_types.hpp"
#include "models/model_context.hpp"
#include <memory>
#include <utility>
#include <string>
#include <vector>

namespace speakerfusion {
namespace pipeline {

/**
 * Decoded mono audio for one recording
 */
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate;

    AudioBuffer() : sample_rate(16000) {}
    AudioBuffer(std::vector<float> s, int rate) : samples(std::move(s)), sample_rate(rate) {}

    double durationSeconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/**
 * How a collaborator call ended.
 * UNAVAILABLE: the capability is absent (model not loaded, feature disabled,
 * unsupported input, timeout). FAILED: it ran and broke on this input.
 */
enum class CollaboratorStatus {
    SUCCESS,
    UNAVAILABLE,
    FAILED
};

std::string toString(CollaboratorStatus status);

struct TranscriptionOutcome {
    CollaboratorStatus status;
    std::vector<fusion::TranscriptSegment> segments;
    std::string error;

    TranscriptionOutcome() : status(CollaboratorStatus::SUCCESS) {}

    static TranscriptionOutcome success(std::vector<fusion::TranscriptSegment> segments);
    static TranscriptionOutcome unavailable(const std::string& reason);
    static TranscriptionOutcome failed(const std::string& reason);
};

struct DiarizationOutcome {
    CollaboratorStatus status;
    std::vector<fusion::LabeledTurn> turns;
    std::string error;

    DiarizationOutcome() : status(CollaboratorStatus::SUCCESS) {}

    static DiarizationOutcome success(std::vector<fusion::LabeledTurn> turns);
    static DiarizationOutcome unavailable(const std::string& reason);
    static DiarizationOutcome failed(const std::string& reason);
};

/**
 * Speech-to-text collaborator
 */
class TranscriptionSource {
public:
    virtual ~TranscriptionSource() = default;

    /**
     * Transcribe a whole recording
     * @param audio Decoded mono audio
     * @return Segments in transcription order, or why there are none
     */
    virtual TranscriptionOutcome transcribe(const AudioBuffer& audio) = 0;

    virtual std::string getName() const = 0;
};

/**
 * "Who spoke when" collaborator
 */
class DiarizationSource {
public:
    virtual ~DiarizationSource() = default;

    /**
     * Diarize a whole recording
     * @param audio Decoded mono audio
     * @return Labeled speaker turns, or why there are none
     */
    virtual DiarizationOutcome diarize(const AudioBuffer& audio) = 0;

    virtual std::string getName() const = 0;
};

/**
 * Reports UNAVAILABLE without calling the wrapped source when the model
 * context says diarization is disabled or its model is not loaded.
 */
class GatedDiarizationSource : public DiarizationSource {
public:
    GatedDiarizationSource(std::shared_ptr<DiarizationSource> inner,
                           std::shared_ptr<const models::ModelContext> context);

    DiarizationOutcome diarize(const AudioBuffer& audio) override;
    std::string getName() const override;

private:
    std::shared_ptr<DiarizationSource> inner_;
    std::shared_ptr<const models::ModelContext> context_;
};

} // namespace pipeline
} // namespace speakerfusion
