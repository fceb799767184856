#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "obstacle_avoidance/range_preprocessor.hpp"

TEST(RangePreprocessorTest, UniformScanGivesUniformSectors)
{
  RangePreprocessor pre(RangePreprocessor::Params{});
  const RangeScan scan(360, 1.25f);

  const ClearanceSnapshot c = pre.preprocess(scan);
  EXPECT_DOUBLE_EQ(c.oblique_left, 1.25);
  EXPECT_DOUBLE_EQ(c.oblique_right, 1.25);
  EXPECT_DOUBLE_EQ(c.left, 1.25);
  EXPECT_DOUBLE_EQ(c.right, 1.25);
  EXPECT_DOUBLE_EQ(c.closest, 1.25);
  // Trailing front slice is half weighted
  EXPECT_DOUBLE_EQ(c.front, 1.5 * 1.25);
}

TEST(RangePreprocessorTest, ClampsToMaxRange)
{
  RangePreprocessor pre(RangePreprocessor::Params{});
  RangeScan scan(360, 12.0f);
  scan[5] = std::numeric_limits<float>::infinity();
  scan[300] = std::numeric_limits<float>::quiet_NaN();
  // Below range_min on some drivers
  scan[60] = -std::numeric_limits<float>::infinity();

  const ClearanceSnapshot c = pre.preprocess(scan);
  EXPECT_DOUBLE_EQ(c.oblique_left, 3.5);
  EXPECT_DOUBLE_EQ(c.oblique_right, 3.5);
  EXPECT_DOUBLE_EQ(c.left, 3.5);
  EXPECT_DOUBLE_EQ(c.right, 3.5);
  EXPECT_DOUBLE_EQ(c.front, 5.25);
  EXPECT_DOUBLE_EQ(c.closest, 3.5);
}

TEST(RangePreprocessorTest, SectorsCoverExpectedIndices)
{
  RangePreprocessor pre(RangePreprocessor::Params{});
  RangeScan scan(360, 3.5f);
  for (std::size_t i = 30; i < 85; ++i) {
    scan[i] = 1.0f;  // exactly the left sector
  }

  const ClearanceSnapshot c = pre.preprocess(scan);
  EXPECT_DOUBLE_EQ(c.left, 1.0);
  EXPECT_DOUBLE_EQ(c.right, 3.5);
  EXPECT_DOUBLE_EQ(c.oblique_right, 3.5);
  // 40 of the 70 oblique-left samples overlap the left sector
  EXPECT_NEAR(c.oblique_left, (40 * 1.0 + 30 * 3.5) / 70.0, 1e-12);
  EXPECT_DOUBLE_EQ(c.front, 3.5 + 3.5 / 2.0);
  EXPECT_DOUBLE_EQ(c.closest, 1.0);
}

TEST(RangePreprocessorTest, FrontCombinesBothEndsOfScan)
{
  RangePreprocessor pre(RangePreprocessor::Params{});
  RangeScan scan(360, 3.5f);
  for (std::size_t i = 0; i < 20; ++i) {
    scan[i] = 1.0f;
  }
  for (std::size_t i = 340; i < 360; ++i) {
    scan[i] = 2.0f;
  }
  for (std::size_t i = 275; i < 330; ++i) {
    scan[i] = 0.5f;  // right sector
  }

  const ClearanceSnapshot c = pre.preprocess(scan);
  EXPECT_DOUBLE_EQ(c.front, 1.0 + 2.0 / 2.0);
  EXPECT_DOUBLE_EQ(c.right, 0.5);
  EXPECT_NEAR(c.oblique_right, (20 * 2.0 + 40 * 0.5 + 10 * 3.5) / 70.0, 1e-12);
}

TEST(RangePreprocessorTest, ScalesSectorsWithResolution)
{
  RangePreprocessor::Params params;
  params.scan_samples = 720;
  RangePreprocessor pre(params);

  RangeScan scan(720, 3.5f);
  for (std::size_t i = 60; i < 170; ++i) {
    scan[i] = 0.75f;
  }

  const ClearanceSnapshot c = pre.preprocess(scan);
  EXPECT_DOUBLE_EQ(c.left, 0.75);
  EXPECT_DOUBLE_EQ(c.right, 3.5);
}

TEST(RangePreprocessorTest, RejectsWrongLength)
{
  RangePreprocessor pre(RangePreprocessor::Params{});
  EXPECT_THROW(pre.preprocess(RangeScan(359, 1.0f)), InvalidScanError);
  EXPECT_THROW(pre.preprocess(RangeScan()), InvalidScanError);
}

TEST(RangePreprocessorTest, RejectsNegativeRange)
{
  RangePreprocessor pre(RangePreprocessor::Params{});
  RangeScan scan(360, 1.0f);
  scan[42] = -0.1f;
  EXPECT_THROW(pre.preprocess(scan), InvalidScanError);

  scan[42] = -std::numeric_limits<float>::infinity();
  EXPECT_NO_THROW(pre.preprocess(scan));
}

TEST(RangePreprocessorTest, TryPreprocessReportsWithoutThrowing)
{
  RangePreprocessor pre(RangePreprocessor::Params{});
  std::string error;

  RangeScan scan(360, 1.0f);
  scan[42] = -0.1f;
  EXPECT_FALSE(pre.try_preprocess(scan, error).has_value());
  EXPECT_NE(error.find("index 42"), std::string::npos);

  error.clear();
  EXPECT_FALSE(pre.try_preprocess(RangeScan(10, 1.0f), error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  scan[42] = 1.0f;
  const auto c = pre.try_preprocess(scan, error);
  ASSERT_TRUE(c.has_value());
  EXPECT_TRUE(error.empty());
  EXPECT_DOUBLE_EQ(c->left, 1.0);
}

TEST(RangePreprocessorTest, RejectsInvalidGeometry)
{
  RangePreprocessor::Params zero_front;
  zero_front.front_sector_deg = 0.0;
  EXPECT_THROW(RangePreprocessor{zero_front}, std::invalid_argument);

  RangePreprocessor::Params wide_side;
  wide_side.side_offset_deg = 330.0;
  EXPECT_THROW(RangePreprocessor{wide_side}, std::invalid_argument);

  RangePreprocessor::Params no_samples;
  no_samples.scan_samples = 0;
  EXPECT_THROW(RangePreprocessor{no_samples}, std::invalid_argument);
}
