#include <gtest/gtest.h>
#include "buffer_copy.h"

TEST(CopyParamsTest, Grow) {
    CopyParams p = computeCopyParams({ 4, 4 }, { 8, 6 });
    EXPECT_EQ(p.oldOffsetX, 0u);
    EXPECT_EQ(p.oldOffsetY, 0u);
    EXPECT_EQ(p.newOffsetX, 2u);
    EXPECT_EQ(p.newOffsetY, 1u);
    EXPECT_EQ(p.oldWidth, 4u);
    EXPECT_EQ(p.newWidth, 8u);
    EXPECT_EQ(p.overlapWidth, 4u);
    EXPECT_EQ(p.overlapHeight, 4u);
}

TEST(CopyParamsTest, Shrink) {
    CopyParams p = computeCopyParams({ 10, 7 }, { 4, 3 });
    EXPECT_EQ(p.oldOffsetX, 3u);
    EXPECT_EQ(p.oldOffsetY, 2u);
    EXPECT_EQ(p.newOffsetX, 0u);
    EXPECT_EQ(p.newOffsetY, 0u);
    EXPECT_EQ(p.oldWidth, 10u);
    EXPECT_EQ(p.newWidth, 4u);
    EXPECT_EQ(p.overlapWidth, 4u);
    EXPECT_EQ(p.overlapHeight, 3u);
}

TEST(CopyParamsTest, SameSizeHasNoOffsets) {
    CopyParams p = computeCopyParams({ 5, 9 }, { 5, 9 });
    EXPECT_EQ(p.oldOffsetX + p.oldOffsetY + p.newOffsetX + p.newOffsetY, 0u);
    EXPECT_EQ(p.overlapWidth, 5u);
    EXPECT_EQ(p.overlapHeight, 9u);
}

// Odd differences round the offset down
TEST(CopyParamsTest, OddDifferenceRoundsDown) {
    CopyParams p = computeCopyParams({ 4, 4 }, { 3, 7 });
    EXPECT_EQ(p.oldOffsetX, 0u);
    EXPECT_EQ(p.newOffsetX, 0u);
    EXPECT_EQ(p.newOffsetY, 1u);
    EXPECT_EQ(p.overlapWidth, 3u);
    EXPECT_EQ(p.overlapHeight, 4u);
}

TEST(CopyParamsTest, MixedAxes) {
    CopyParams p = computeCopyParams({ 8, 2 }, { 2, 8 });
    EXPECT_EQ(p.oldOffsetX, 3u);
    EXPECT_EQ(p.newOffsetX, 0u);
    EXPECT_EQ(p.oldOffsetY, 0u);
    EXPECT_EQ(p.newOffsetY, 3u);
    EXPECT_EQ(p.overlapWidth, 2u);
    EXPECT_EQ(p.overlapHeight, 2u);
}

TEST(CopyParamsTest, ZeroAreaHasEmptyOverlap) {
    CopyParams p = computeCopyParams({ 0, 0 }, { 6, 6 });
    EXPECT_EQ(p.overlapWidth, 0u);
    EXPECT_EQ(p.overlapHeight, 0u);
    EXPECT_EQ(p.newOffsetX, 3u);

    p = computeCopyParams({ 6, 6 }, { 6, 0 });
    EXPECT_EQ(p.overlapWidth, 6u);
    EXPECT_EQ(p.overlapHeight, 0u);
}

TEST(CopyParamsTest, TileCountRoundsUp) {
    EXPECT_EQ(tileCount(0), 0u);
    EXPECT_EQ(tileCount(1), 1u);
    EXPECT_EQ(tileCount(8), 1u);
    EXPECT_EQ(tileCount(9), 2u);
    EXPECT_EQ(tileCount(1024), 128u);
}
