#include "pipeline/transcript_pipeline.hpp"
#include "fusion/fusion_config.hpp"
#include "fusion/speaker_aggregator.hpp"
#include "fusion/transcript_formatter.hpp"
#include "fusion/transcript_json.hpp"
#include "identity/identity_registry.hpp"
#include "models/model_context.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace speakerfusion;

namespace {

/**
 * Replays transcription output captured earlier instead of running a model
 */
class StaticTranscriptionSource : public pipeline::TranscriptionSource {
public:
    explicit StaticTranscriptionSource(std::vector<fusion::TranscriptSegment> segments)
        : segments_(std::move(segments)) {}

    pipeline::TranscriptionOutcome transcribe(const pipeline::AudioBuffer&) override {
        return pipeline::TranscriptionOutcome::success(segments_);
    }

    std::string getName() const override { return "static-transcription"; }

private:
    std::vector<fusion::TranscriptSegment> segments_;
};

class StaticDiarizationSource : public pipeline::DiarizationSource {
public:
    explicit StaticDiarizationSource(std::vector<fusion::LabeledTurn> turns)
        : turns_(std::move(turns)) {}

    pipeline::DiarizationOutcome diarize(const pipeline::AudioBuffer&) override {
        return pipeline::DiarizationOutcome::success(turns_);
    }

    std::string getName() const override { return "static-diarization"; }

private:
    std::vector<fusion::LabeledTurn> turns_;
};

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    return nlohmann::json::parse(file);
}

std::string readTextFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<fusion::TranscriptSegment> demoSegments() {
    return {
        fusion::TranscriptSegment("Morning, thanks for dialing in.", 0.0, 2.6, 0.97f),
        fusion::TranscriptSegment("Morning. Can you hear me okay?", 2.9, 5.1, 0.91f),
        fusion::TranscriptSegment("Loud and clear. Let's start with the launch plan.", 5.3, 9.8, 0.95f),
        fusion::TranscriptSegment("Sure, I'll share my screen.", 9.6, 12.4, 0.88f),
        fusion::TranscriptSegment("[music]", 40.0, 41.5, 0.40f)
    };
}

std::vector<fusion::LabeledTurn> demoTurns() {
    return {
        fusion::LabeledTurn("SPEAKER_01", 0.0, 2.8),
        fusion::LabeledTurn("SPEAKER_00", 2.8, 5.2),
        fusion::LabeledTurn("SPEAKER_01", 5.2, 10.2),
        fusion::LabeledTurn("SPEAKER_00", 10.2, 14.0)
    };
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config fusion.json] [segments.json turns.json [identities.json]]" << std::endl;
    std::cout << "Without input files a built-in two-speaker call is fused." << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    utils::Logger::initialize();

    std::string configPath;
    std::vector<std::string> inputs;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.size() == 1 || inputs.size() > 3) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        fusion::FusionConfigManager configManager;
        if (!configPath.empty() && !configManager.loadFromFile(configPath)) {
            std::cerr << "Invalid configuration: " << configPath << std::endl;
            return 1;
        }
        fusion::FusionConfig config = configManager.getConfig();
        if (!utils::Logger::setLevel(config.logLevel)) {
            utils::Logger::warn("Unknown log level " + config.logLevel + ", keeping INFO");
        }

        std::vector<fusion::TranscriptSegment> segments = demoSegments();
        std::vector<fusion::LabeledTurn> turns = demoTurns();
        if (inputs.size() >= 2) {
            segments = fusion::json::segmentsFromJson(readJsonFile(inputs[0]));
            turns = fusion::json::labeledTurnsFromJson(readJsonFile(inputs[1]));
        }

        auto transcriber = std::make_shared<StaticTranscriptionSource>(segments);
        std::shared_ptr<pipeline::DiarizationSource> diarizer =
            std::make_shared<StaticDiarizationSource>(turns);

        // With a model configured, diarization only runs once the model is present
        if (!config.models.diarizationModelPath.empty() || !config.models.diarizationEnabled) {
            auto context = models::ModelContext::initialize(config.models);
            diarizer = std::make_shared<pipeline::GatedDiarizationSource>(diarizer, context);
        }

        pipeline::TranscriptPipeline transcriptPipeline(transcriber, diarizer, config);
        pipeline::AudioBuffer audio;  // the static sources ignore the samples
        auto transcript = transcriptPipeline.process(audio, "example");

        auto registry = identity::IdentityRegistry::forTranscript(transcript);
        if (inputs.size() == 3) {
            registry.assignFromJson(readTextFile(inputs[2]));
        } else if (inputs.empty()) {
            registry.assign(0, "Avery Chen", std::string("avery@example.com"), std::string("Host"));
        }

        fusion::FormatOptions formatOptions;
        formatOptions.annotateConfidence = config.annotateConfidence;
        formatOptions.lowConfidenceThreshold = config.lowConfidenceThreshold;
        formatOptions.unknownSpeakerLabel = config.unknownSpeakerLabel;
        fusion::TranscriptFormatter formatter(formatOptions);

        std::string formatted = formatter.format(transcript, registry);
        auto stats = fusion::SpeakerAggregator::aggregate(transcript);

        std::cout << formatted << std::endl << std::endl;
        std::cout << fusion::json::transcriptToJson(transcript, registry, stats, formatted).dump(2)
                  << std::endl;

    } catch (const utils::SpeakerFusionException& e) {
        std::cerr << "Fusion failed: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Example failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
