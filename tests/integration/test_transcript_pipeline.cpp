#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "pipeline/transcript_pipeline.hpp"
#include "fusion/speaker_aggregator.hpp"
#include "fusion/transcript_formatter.hpp"
#include "identity/identity_registry.hpp"
#include "utils/error_handler.hpp"
#include <thread>

using namespace speakerfusion;
using namespace speakerfusion::pipeline;
using ::testing::_;
using ::testing::Return;

namespace {

class MockTranscriptionSource : public TranscriptionSource {
public:
    MOCK_METHOD(TranscriptionOutcome, transcribe, (const AudioBuffer& audio), (override));
    MOCK_METHOD(std::string, getName, (), (const, override));
};

class MockDiarizationSource : public DiarizationSource {
public:
    MOCK_METHOD(DiarizationOutcome, diarize, (const AudioBuffer& audio), (override));
    MOCK_METHOD(std::string, getName, (), (const, override));
};

} // namespace

class TranscriptPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        transcriber_ = std::make_shared<MockTranscriptionSource>();
        diarizer_ = std::make_shared<MockDiarizationSource>();
        ON_CALL(*transcriber_, getName()).WillByDefault(Return("mock-transcriber"));
        ON_CALL(*diarizer_, getName()).WillByDefault(Return("mock-diarizer"));

        // 12 seconds of silence at 16kHz
        audio_ = AudioBuffer(std::vector<float>(12 * 16000, 0.0f), 16000);

        segments_ = {
            fusion::TranscriptSegment("Thanks for making time today.", 0.0, 2.5),
            fusion::TranscriptSegment("Happy to. Where do we start?", 2.8, 5.0),
            fusion::TranscriptSegment("With the budget review.", 5.2, 8.0),
            fusion::TranscriptSegment("Sounds good.", 8.4, 12.0)
        };

        utils::ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        utils::ErrorHandler::getInstance().clearErrorHistory();
    }

    std::shared_ptr<MockTranscriptionSource> transcriber_;
    std::shared_ptr<MockDiarizationSource> diarizer_;
    AudioBuffer audio_;
    std::vector<fusion::TranscriptSegment> segments_;
};

TEST_F(TranscriptPipelineTest, FusesDiarizedRecording) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));
    EXPECT_CALL(*diarizer_, diarize(_))
        .WillOnce(Return(DiarizationOutcome::success({
            fusion::LabeledTurn("SPEAKER_03", 0.0, 2.7),
            fusion::LabeledTurn("SPEAKER_01", 2.7, 5.1),
            fusion::LabeledTurn("SPEAKER_03", 5.1, 8.2),
            fusion::LabeledTurn("SPEAKER_01", 8.2, 12.0)
        })));

    TranscriptPipeline pipeline(transcriber_, diarizer_);
    auto transcript = pipeline.process(audio_, "rec-001");

    ASSERT_EQ(transcript.segments.size(), 4u);
    EXPECT_EQ(transcript.segments[0].speaker_index, std::optional<uint32_t>(0));
    EXPECT_EQ(transcript.segments[1].speaker_index, std::optional<uint32_t>(1));
    EXPECT_EQ(transcript.segments[2].speaker_index, std::optional<uint32_t>(0));
    EXPECT_EQ(transcript.segments[3].speaker_index, std::optional<uint32_t>(1));
    EXPECT_EQ(transcript.speaker_count, 2u);
    EXPECT_DOUBLE_EQ(transcript.total_duration, 12.0);
    EXPECT_FALSE(transcript.degraded);
}

TEST_F(TranscriptPipelineTest, FallsBackWhenDiarizationUnavailable) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));
    EXPECT_CALL(*diarizer_, diarize(_))
        .WillOnce(Return(DiarizationOutcome::unavailable("diarization model not loaded")));

    TranscriptPipeline pipeline(transcriber_, diarizer_);
    auto transcript = pipeline.process(audio_, "rec-002");

    EXPECT_TRUE(transcript.degraded);
    EXPECT_EQ(transcript.speaker_count, 1u);
    for (const auto& segment : transcript.segments) {
        ASSERT_TRUE(segment.speaker_index.has_value());
        EXPECT_EQ(*segment.speaker_index, 0u);
        EXPECT_FLOAT_EQ(segment.confidence, 1.0f);
    }

    auto& handler = utils::ErrorHandler::getInstance();
    ASSERT_EQ(handler.getErrorCount(utils::ErrorCategory::DIARIZATION), 1u);
    auto warning = handler.getRecentErrors(1)[0];
    EXPECT_EQ(warning.severity, utils::ErrorSeverity::WARNING);
    EXPECT_EQ(warning.recording_id, "rec-002");
}

TEST_F(TranscriptPipelineTest, MissingDiarizerFallsBack) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));

    TranscriptPipeline pipeline(transcriber_, nullptr);
    auto transcript = pipeline.process(audio_);

    EXPECT_TRUE(transcript.degraded);
    EXPECT_EQ(transcript.speaker_count, 1u);
}

TEST_F(TranscriptPipelineTest, DiarizationFailureIsFatal) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));
    EXPECT_CALL(*diarizer_, diarize(_))
        .WillOnce(Return(DiarizationOutcome::failed("embedding extraction crashed")));

    TranscriptPipeline pipeline(transcriber_, diarizer_);

    EXPECT_THROW(pipeline.process(audio_, "rec-003"), utils::DiarizationFailedError);

    auto recent = utils::ErrorHandler::getInstance().getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].category, utils::ErrorCategory::DIARIZATION);
    EXPECT_EQ(recent[0].severity, utils::ErrorSeverity::ERROR);
    EXPECT_EQ(recent[0].recording_id, "rec-003");
}

TEST_F(TranscriptPipelineTest, TranscriptionFailureIsFatal) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::failed("decoder out of memory")));
    EXPECT_CALL(*diarizer_, diarize(_)).Times(0);

    TranscriptPipeline pipeline(transcriber_, diarizer_);

    try {
        pipeline.process(audio_, "rec-004");
        FAIL() << "expected TranscriptionError";
    } catch (const utils::TranscriptionError& e) {
        EXPECT_NE(std::string(e.what()).find("decoder out of memory"), std::string::npos);
    }
    EXPECT_EQ(utils::ErrorHandler::getInstance().getErrorCount(utils::ErrorCategory::TRANSCRIPTION), 1u);
}

TEST_F(TranscriptPipelineTest, UnavailableTranscriptionIsAlsoFatal) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::unavailable("no model")));

    TranscriptPipeline pipeline(transcriber_, diarizer_);

    EXPECT_THROW(pipeline.process(audio_), utils::TranscriptionError);
}

TEST_F(TranscriptPipelineTest, InvalidTurnFromDiarizerIsFatal) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));
    EXPECT_CALL(*diarizer_, diarize(_))
        .WillOnce(Return(DiarizationOutcome::success({fusion::LabeledTurn("A", 3.0, 3.0)})));

    TranscriptPipeline pipeline(transcriber_, diarizer_);

    EXPECT_THROW(pipeline.process(audio_), utils::InvalidTurnError);
}

TEST_F(TranscriptPipelineTest, RejectPolicyFailsOnBadSegment) {
    segments_.push_back(fusion::TranscriptSegment("glitch", 12.0, 12.0));
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));

    TranscriptPipeline pipeline(transcriber_, diarizer_);

    EXPECT_THROW(pipeline.process(audio_), utils::InvalidSegmentError);
}

TEST_F(TranscriptPipelineTest, FilterPolicyDropsBadSegment) {
    segments_.insert(segments_.begin() + 1, fusion::TranscriptSegment("glitch", 2.6, 2.6));
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));
    EXPECT_CALL(*diarizer_, diarize(_))
        .WillOnce(Return(DiarizationOutcome::unavailable("disabled")));

    fusion::FusionConfig config;
    config.invalidSegmentPolicy = fusion::InvalidSegmentPolicy::FILTER;
    TranscriptPipeline pipeline(transcriber_, diarizer_, config);

    auto transcript = pipeline.process(audio_);

    ASSERT_EQ(transcript.segments.size(), 4u);
    EXPECT_EQ(transcript.segments[1].text, "Happy to. Where do we start?");
}

TEST_F(TranscriptPipelineTest, ProcessSegmentsWithoutAudio) {
    TranscriptPipeline pipeline(nullptr, nullptr);

    auto transcript = pipeline.processSegments(
        segments_, DiarizationOutcome::unavailable("offline"), 0.0, "rec-005");

    EXPECT_TRUE(transcript.degraded);
    EXPECT_DOUBLE_EQ(transcript.total_duration, 12.0);
    EXPECT_EQ(transcript.segments.size(), 4u);
}

TEST_F(TranscriptPipelineTest, EndToEndRendering) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillOnce(Return(TranscriptionOutcome::success(segments_)));
    EXPECT_CALL(*diarizer_, diarize(_))
        .WillOnce(Return(DiarizationOutcome::success({
            fusion::LabeledTurn("host", 0.0, 2.7),
            fusion::LabeledTurn("guest", 2.7, 12.0)
        })));

    TranscriptPipeline pipeline(transcriber_, diarizer_);
    auto transcript = pipeline.process(audio_);

    auto registry = identity::IdentityRegistry::forTranscript(transcript);
    registry.assign(0, "Morgan Hale");
    fusion::TranscriptFormatter formatter;
    auto lines = formatter.formatLines(transcript, registry);

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "Morgan Hale: [00:00-00:02] Thanks for making time today.");
    EXPECT_EQ(lines[3], "Speaker 2: [00:08-00:12] Sounds good.");

    auto stats = fusion::SpeakerAggregator::aggregate(transcript);
    EXPECT_EQ(stats.speakers.at(1).segment_count, 3u);
}

TEST_F(TranscriptPipelineTest, ConcurrentRecordingsAreIndependent) {
    EXPECT_CALL(*transcriber_, transcribe(_))
        .WillRepeatedly(Return(TranscriptionOutcome::success(segments_)));
    EXPECT_CALL(*diarizer_, diarize(_))
        .WillRepeatedly(Return(DiarizationOutcome::unavailable("busy")));

    TranscriptPipeline pipeline(transcriber_, diarizer_);

    std::vector<std::thread> threads;
    std::vector<fusion::DiarizedTranscript> results(4);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() {
            results[i] = pipeline.process(audio_, "rec-" + std::to_string(i));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& transcript : results) {
        EXPECT_EQ(transcript.segments.size(), 4u);
        EXPECT_TRUE(transcript.degraded);
    }
}
