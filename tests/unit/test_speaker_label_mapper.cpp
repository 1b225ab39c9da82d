#include <gtest/gtest.h>
#include "fusion/speaker_label_mapper.hpp"

using namespace speakerfusion::fusion;

TEST(SpeakerLabelMapperTest, IndicesFollowFirstAppearanceInTime) {
    SpeakerLabelMapper mapper;

    // Input order differs from time order
    std::vector<LabeledTurn> turns = {
        LabeledTurn("SPEAKER_07", 10.0, 12.0),
        LabeledTurn("SPEAKER_02", 0.0, 4.0),
        LabeledTurn("SPEAKER_07", 4.0, 10.0),
        LabeledTurn("SPEAKER_02", 12.0, 15.0),
        LabeledTurn("SPEAKER_00", 15.0, 16.0)
    };

    auto mapped = mapper.mapTurns(turns);

    ASSERT_EQ(mapped.size(), turns.size());
    EXPECT_EQ(mapped[0].speaker_index, 1u);
    EXPECT_EQ(mapped[1].speaker_index, 0u);
    EXPECT_EQ(mapped[2].speaker_index, 1u);
    EXPECT_EQ(mapped[3].speaker_index, 0u);
    EXPECT_EQ(mapped[4].speaker_index, 2u);

    // Bounds are untouched and input order is kept
    EXPECT_DOUBLE_EQ(mapped[0].start, 10.0);
    EXPECT_DOUBLE_EQ(mapped[0].end, 12.0);

    EXPECT_EQ(mapper.size(), 3u);
    EXPECT_EQ(mapper.labelFor(0), "SPEAKER_02");
    EXPECT_EQ(mapper.labelFor(1), "SPEAKER_07");
    EXPECT_EQ(mapper.labelFor(2), "SPEAKER_00");
}

TEST(SpeakerLabelMapperTest, LabelsAreStableAcrossCalls) {
    SpeakerLabelMapper mapper;

    EXPECT_EQ(mapper.indexFor("alice"), 0u);
    EXPECT_EQ(mapper.indexFor("bob"), 1u);
    EXPECT_EQ(mapper.indexFor("alice"), 0u);

    auto mapped = mapper.mapTurns({LabeledTurn("bob", 0.0, 1.0), LabeledTurn("carol", 1.0, 2.0)});
    EXPECT_EQ(mapped[0].speaker_index, 1u);
    EXPECT_EQ(mapped[1].speaker_index, 2u);
}

TEST(SpeakerLabelMapperTest, UnknownIndexHasNoLabel) {
    SpeakerLabelMapper mapper;
    mapper.indexFor("alice");

    EXPECT_EQ(mapper.labelFor(5), "");
}

TEST(SpeakerLabelMapperTest, ResetStartsOver) {
    SpeakerLabelMapper mapper;
    mapper.indexFor("alice");
    mapper.indexFor("bob");

    mapper.reset();

    EXPECT_EQ(mapper.size(), 0u);
    EXPECT_EQ(mapper.indexFor("bob"), 0u);
}
