#include <gtest/gtest.h>
#include "fusion/fallback_controller.hpp"
#include "fusion/fusion_engine.hpp"
#include <cmath>
#include <limits>

using namespace speakerfusion::fusion;
using speakerfusion::pipeline::CollaboratorStatus;

TEST(FallbackControllerTest, OnlyUnavailableTriggersFallback) {
    EXPECT_TRUE(FallbackController::shouldFallBack(CollaboratorStatus::UNAVAILABLE));
    EXPECT_FALSE(FallbackController::shouldFallBack(CollaboratorStatus::SUCCESS));
    EXPECT_FALSE(FallbackController::shouldFallBack(CollaboratorStatus::FAILED));
}

TEST(FallbackControllerTest, SingleTurnSpansRecording) {
    auto turns = FallbackController::synthesizeTurns(12.0, {});

    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].speaker_index, 0u);
    EXPECT_DOUBLE_EQ(turns[0].start, 0.0);
    EXPECT_DOUBLE_EQ(turns[0].end, 12.0);
}

TEST(FallbackControllerTest, SpanCoversSegmentsPastReportedDuration) {
    std::vector<TranscriptSegment> segments = {
        TranscriptSegment("early", 0.0, 5.0),
        TranscriptSegment("runs long", 9.0, 12.5)
    };

    auto turns = FallbackController::synthesizeTurns(12.0, segments);

    ASSERT_EQ(turns.size(), 1u);
    EXPECT_DOUBLE_EQ(turns[0].end, 12.5);
}

TEST(FallbackControllerTest, UnknownDurationUsesSegments) {
    std::vector<TranscriptSegment> segments = {TranscriptSegment("only line", 1.0, 3.0)};

    auto turns = FallbackController::synthesizeTurns(std::numeric_limits<double>::quiet_NaN(), segments);

    ASSERT_EQ(turns.size(), 1u);
    EXPECT_DOUBLE_EQ(turns[0].end, 3.0);
}

TEST(FallbackControllerTest, EmptyRecordingGetsNoTurn) {
    EXPECT_TRUE(FallbackController::synthesizeTurns(0.0, {}).empty());
    EXPECT_TRUE(FallbackController::synthesizeTurns(-4.0, {}).empty());
}

TEST(FallbackControllerTest, FallbackFusionAttributesEverythingToSpeakerZero) {
    std::vector<TranscriptSegment> segments = {
        TranscriptSegment("Hi all.", 0.0, 1.5),
        TranscriptSegment("Agenda first.", 1.5, 4.0),
        TranscriptSegment("Then questions.", 6.0, 9.0),
        TranscriptSegment("Bye.", 11.0, 12.0)
    };

    auto turns = FallbackController::synthesizeTurns(12.0, segments);
    FusionEngine engine;
    auto transcript = engine.fuseTranscript(segments, turns, 12.0, true);

    EXPECT_TRUE(transcript.degraded);
    EXPECT_EQ(transcript.speaker_count, 1u);
    for (const auto& segment : transcript.segments) {
        ASSERT_TRUE(segment.speaker_index.has_value());
        EXPECT_EQ(*segment.speaker_index, 0u);
        EXPECT_FLOAT_EQ(segment.confidence, 1.0f);
    }
}
