#include <gtest/gtest.h>

#include <limits>

#include "vidguard/vision/Types.h"
#include "vidguard/Errors.h"

namespace vision {
namespace {

TEST(VideoPropertiesTest, FrameIndexIsFloorOfTimestampTimesFps) {
  VideoProperties p;
  p.fps = 30.0;
  p.total_frames = 300;
  EXPECT_EQ(p.frameIndexAt(5.0), 150);
  EXPECT_EQ(p.frameIndexAt(0.0), 0);
  EXPECT_EQ(p.frameIndexAt(0.049), 1);
  EXPECT_EQ(p.frameIndexAt(9.999), 299);
  EXPECT_EQ(p.frameIndexAt(10.0), -1);
  EXPECT_EQ(p.frameIndexAt(11.0), -1);
  EXPECT_EQ(p.frameIndexAt(-0.5), -1);
  EXPECT_FALSE(p.contains(300));
  EXPECT_TRUE(p.contains(299));
  EXPECT_FALSE(p.contains(-1));
}

TEST(VideoPropertiesTest, FrameIndexOutsideInt64RangeIsRejected) {
  VideoProperties p;
  p.fps = 30.0;
  p.total_frames = 300;
  EXPECT_EQ(p.frameIndexAt(1e300), -1);
  EXPECT_EQ(p.frameIndexAt(-1e300), -1);
  EXPECT_EQ(p.frameIndexAt(std::numeric_limits<double>::infinity()), -1);
  EXPECT_EQ(p.frameIndexAt(std::numeric_limits<double>::quiet_NaN()), -1);
  EXPECT_FALSE(p.contains(p.frameIndexAt(1e300)));
}

TEST(VideoPropertiesTest, DurationIsZeroWithoutFrameRate) {
  EXPECT_DOUBLE_EQ(VideoProperties::durationOf(300, 30.0), 10.0);
  EXPECT_DOUBLE_EQ(VideoProperties::durationOf(300, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(VideoProperties::durationOf(300, -1.0), 0.0);
  EXPECT_DOUBLE_EQ(VideoProperties::durationOf(0, 25.0), 0.0);
}

TEST(FlaggedLabelTest, ComparesCaseInsensitively) {
  EXPECT_FALSE(isFlaggedLabel("normal", "normal"));
  EXPECT_FALSE(isFlaggedLabel("Normal", "normal"));
  EXPECT_FALSE(isFlaggedLabel("NORMAL", "normal"));
  EXPECT_TRUE(isFlaggedLabel("nsfw", "normal"));
  EXPECT_TRUE(isFlaggedLabel("normalish", "normal"));
  EXPECT_TRUE(isFlaggedLabel("", "normal"));
}

}  // namespace
}  // namespace vision

namespace vidguard {
namespace {

TEST(ScanErrorTest, Classification) {
  EXPECT_TRUE(isTransient(ScanError::FrameReadError));
  EXPECT_TRUE(isTransient(ScanError::ClassificationFailed));
  EXPECT_FALSE(isTransient(ScanError::VideoClosed));

  EXPECT_TRUE(isSessionGone(ScanError::VideoClosed));
  EXPECT_TRUE(isSessionGone(ScanError::SessionNotFound));
  EXPECT_TRUE(isSessionGone(ScanError::VideoNotInitialized));
  EXPECT_FALSE(isSessionGone(ScanError::ClassifierUnavailable));

  ScanException ex(ScanError::EmptyVideo, "Could not read video frames");
  EXPECT_EQ(ex.code(), ScanError::EmptyVideo);
  EXPECT_STREQ(ex.what(), "Could not read video frames");
  EXPECT_EQ(toString(ScanError::EmptyVideo), "EmptyVideo");
}

}  // namespace
}  // namespace vidguard
