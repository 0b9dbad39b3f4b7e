#include <gtest/gtest.h>

#include "../common/ttexception.h"
#include "../data/ttcutalignment.h"

class TTCutAlignmentTest : public ::testing::Test
{
protected:
    TTKeyframeList keyframes = TTKeyframeList() << 0.0 << 2.0 << 4.0 << 6.0 << 8.0;

    double nearest(double t, bool preferBefore)
    {
        double kf = -100.0;
        EXPECT_TRUE(TTCutAlignment::findNearestKeyframe(t, keyframes, preferBefore, kf));
        return kf;
    }
};

TEST_F(TTCutAlignmentTest, NearestKeyframeBefore)
{
    EXPECT_DOUBLE_EQ(nearest(1.5, true), 0.0);
    EXPECT_DOUBLE_EQ(nearest(2.0, true), 2.0);
    EXPECT_DOUBLE_EQ(nearest(3.0, true), 2.0);
    EXPECT_DOUBLE_EQ(nearest(-1.0, true), 0.0);
}

TEST_F(TTCutAlignmentTest, NearestKeyframeAfter)
{
    EXPECT_DOUBLE_EQ(nearest(1.5, false), 2.0);
    EXPECT_DOUBLE_EQ(nearest(3.0, false), 4.0);
    EXPECT_DOUBLE_EQ(nearest(9.0, false), 8.0);
}

TEST_F(TTCutAlignmentTest, NearestKeyframeInEmptyList)
{
    double kf = 42.0;
    EXPECT_FALSE(TTCutAlignment::findNearestKeyframe(1.0, TTKeyframeList(), true, kf));
    EXPECT_FALSE(TTCutAlignment::findNearestKeyframe(1.0, TTKeyframeList(), false, kf));
    EXPECT_DOUBLE_EQ(kf, 42.0);
}

TEST_F(TTCutAlignmentTest, ClosestKeyframeTieUsesPreferredSide)
{
    double kf = 0.0;
    ASSERT_TRUE(TTCutAlignment::findClosestKeyframe(3.0, keyframes, true, kf));
    EXPECT_DOUBLE_EQ(kf, 2.0);
    ASSERT_TRUE(TTCutAlignment::findClosestKeyframe(3.0, keyframes, false, kf));
    EXPECT_DOUBLE_EQ(kf, 4.0);
    ASSERT_TRUE(TTCutAlignment::findClosestKeyframe(3.9, keyframes, true, kf));
    EXPECT_DOUBLE_EQ(kf, 4.0);
}

TEST_F(TTCutAlignmentTest, AlignedCutPoints)
{
    TTAlignmentResult result = TTCutAlignment::evaluate(2.0, 4.0, keyframes);

    EXPECT_TRUE(result.startAligned);
    EXPECT_TRUE(result.endAligned);
    EXPECT_TRUE(result.keyframeAligned());
    EXPECT_DOUBLE_EQ(result.effectiveStart, 2.0);
    EXPECT_DOUBLE_EQ(result.effectiveEnd, 4.0);
}

TEST_F(TTCutAlignmentTest, UnalignedCutPoints)
{
    TTAlignmentResult result = TTCutAlignment::evaluate(1.5, 3.5, keyframes);

    EXPECT_FALSE(result.startAligned);
    EXPECT_FALSE(result.endAligned);
    EXPECT_FALSE(result.keyframeAligned());
    EXPECT_DOUBLE_EQ(result.effectiveStart, 1.5);
    EXPECT_DOUBLE_EQ(result.effectiveEnd, 3.5);
}

TEST_F(TTCutAlignmentTest, WithinToleranceIsAligned)
{
    TTAlignmentResult result = TTCutAlignment::evaluate(2.1, 3.9, keyframes, 0.1);

    EXPECT_TRUE(result.startAligned);
    EXPECT_TRUE(result.endAligned);
    EXPECT_DOUBLE_EQ(result.effectiveStart, 2.1);
    EXPECT_DOUBLE_EQ(result.effectiveEnd, 3.9);
}

TEST_F(TTCutAlignmentTest, EmptyKeyframesNeverAligned)
{
    TTAlignmentResult result = TTCutAlignment::evaluate(0.0, 2.0, TTKeyframeList());

    EXPECT_FALSE(result.keyframeAligned());
    EXPECT_FALSE(TTCutAlignment::evaluate(0.0, 2.0, TTKeyframeList(), 0.1, true).keyframeAligned());
}

TEST_F(TTCutAlignmentTest, SnapMovesEdgesOntoKeyframes)
{
    TTAlignmentResult result = TTCutAlignment::evaluate(1.5, 3.5, keyframes, 0.1, true, 1.0);

    EXPECT_DOUBLE_EQ(result.effectiveStart, 2.0);
    EXPECT_DOUBLE_EQ(result.effectiveEnd, 4.0);
    EXPECT_TRUE(result.startSnapped);
    EXPECT_TRUE(result.endSnapped);
    EXPECT_TRUE(result.keyframeAligned());
}

TEST_F(TTCutAlignmentTest, SnapOutsideWindowKeepsBounds)
{
    TTKeyframeList sparse = TTKeyframeList() << 0.0 << 10.0;
    TTAlignmentResult result = TTCutAlignment::evaluate(3.0, 6.0, sparse, 0.1, true, 1.0);

    EXPECT_DOUBLE_EQ(result.effectiveStart, 3.0);
    EXPECT_DOUBLE_EQ(result.effectiveEnd, 6.0);
    EXPECT_FALSE(result.startSnapped);
    EXPECT_FALSE(result.endSnapped);
    EXPECT_FALSE(result.keyframeAligned());
}

TEST_F(TTCutAlignmentTest, SnapNeverCollapsesRange)
{
    // both edges are closest to 2.0; the end snap is rejected
    TTAlignmentResult result = TTCutAlignment::evaluate(1.8, 2.3, keyframes, 0.1, true, 1.0);

    EXPECT_DOUBLE_EQ(result.effectiveStart, 2.0);
    EXPECT_DOUBLE_EQ(result.effectiveEnd, 2.3);
    EXPECT_GT(result.duration(), 0.0);
    EXPECT_FALSE(result.endSnapped);
}

TEST_F(TTCutAlignmentTest, NoSnapKeepsRequestedBounds)
{
    TTCutRequest request("in.mp4", 1.5, 3.5, "out.mp4");
    TTAlignmentResult result = TTCutAlignment::evaluate(request, keyframes);

    EXPECT_DOUBLE_EQ(result.effectiveStart, request.start);
    EXPECT_DOUBLE_EQ(result.effectiveEnd, request.end);
}

TEST(TTCutRequestTest, ValidRequest)
{
    TTCutRequest request("in.mp4", 0.0, 2.0, "out.mp4");
    EXPECT_NO_THROW(request.validate());
    EXPECT_DOUBLE_EQ(request.duration(), 2.0);
    EXPECT_FALSE(request.forceKeyframeSnap);
    EXPECT_TRUE(request.allowSmartCut);
}

TEST(TTCutRequestTest, InvalidRequestsThrow)
{
    EXPECT_THROW(TTCutRequest("in.mp4", 4.0, 2.0, "out.mp4").validate(), TTInvalidArgumentException);
    EXPECT_THROW(TTCutRequest("in.mp4", 2.0, 2.0, "out.mp4").validate(), TTInvalidArgumentException);
    EXPECT_THROW(TTCutRequest("in.mp4", -1.0, 2.0, "out.mp4").validate(), TTInvalidArgumentException);
    EXPECT_THROW(TTCutRequest("", 0.0, 2.0, "out.mp4").validate(), TTInvalidArgumentException);
    EXPECT_THROW(TTCutRequest("in.mp4", 0.0, 2.0, "").validate(), TTInvalidArgumentException);
}
