#include <algorithm>

#include <gtest/gtest.h>

#include "errors.hh"
#include "knots.hh"

using namespace Geometry;

TEST(ChordLength, ProportionalToDistance) {
  PointVector points = { {0, 0, 0}, {1, 0, 0}, {1, 3, 0}, {1, 3, 0}, {1, 3, 4} };
  auto params = chordLengthParameters(points);
  ASSERT_EQ(params.size(), 5u);
  EXPECT_DOUBLE_EQ(params[0], 0);
  EXPECT_DOUBLE_EQ(params[1], 0.125);
  EXPECT_DOUBLE_EQ(params[2], 0.5);
  EXPECT_DOUBLE_EQ(params[3], 0.5);
  EXPECT_DOUBLE_EQ(params[4], 1);
}

TEST(ChordLength, DegenerateThrows) {
  PointVector points(4, Point3D(1, 2, 3));
  EXPECT_THROW(chordLengthParameters(points), GeometryError);
}

TEST(ApproximationKnots, ClampedAndSorted) {
  std::vector<double> params;
  for (size_t i = 0; i <= 40; ++i)
    params.push_back(i / 40.0);
  size_t p = 3, n = 12;
  auto knots = approximationKnots(params, p, n);
  ASSERT_EQ(knots.size(), n + p + 1);
  for (size_t i = 0; i <= p; ++i) {
    EXPECT_EQ(knots[i], 0);
    EXPECT_EQ(knots[knots.size() - 1 - i], 1);
  }
  EXPECT_TRUE(std::is_sorted(knots.begin(), knots.end()));
  for (size_t i = p + 1; i < n; ++i) {
    EXPECT_GT(knots[i], 0);
    EXPECT_LT(knots[i], 1);
  }
}

TEST(ApproximationKnots, InterpolationHasNoEmptySpans) {
  std::vector<double> params = { 0, 0.1, 0.3, 0.6, 0.8, 1 };
  auto knots = approximationKnots(params, 2, params.size());
  ASSERT_EQ(knots.size(), 9u);
  for (size_t i = 3; i < 6; ++i)
    EXPECT_LT(knots[i-1], knots[i]);
}

TEST(ApproximationKnots, RejectsBadCounts) {
  std::vector<double> params = { 0, 0.5, 1 };
  EXPECT_THROW(approximationKnots(params, 3, 3), GeometryError);
  EXPECT_THROW(approximationKnots(params, 1, 4), GeometryError);
}
