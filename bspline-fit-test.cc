#include <gtest/gtest.h>

#include "bspline-fit.hh"
#include "closest-point.hh"
#include "knots.hh"
#include "test-fixtures.hh"

using namespace Geometry;

static double polygonRoughness(const BSCurve &curve) {
  const auto &cpts = curve.controlPoints();
  double sum = 0;
  for (size_t i = 1; i + 1 < cpts.size(); ++i)
    sum += (cpts[i] - (cpts[i-1] + cpts[i+1]) / 2).normSqr();
  return sum;
}

TEST(BSplineFit, ReproducesLine) {
  PointVector samples;
  for (size_t i = 0; i <= 10; ++i) {
    double t = i / 10.0;
    samples.emplace_back(2 * t * t, 4 * t * t, -t * t);
  }
  auto params = chordLengthParameters(samples);
  size_t p = 3, n = 6;
  PointVector cpts(n, samples.front());
  cpts.back() = samples.back();
  BSCurve curve(p, approximationKnots(params, p, n), cpts);
  auto constraint = [&](size_t i) -> MoveConstraint {
    if (i == 0 || i == n - 1)
      return MoveType::Fixed();
    return MoveType::Free();
  };
  bsplineFit(curve, samples, params, constraint, 0);

  for (size_t k = 0; k < samples.size(); ++k)
    EXPECT_NEAR((curve.eval(params[k]) - samples[k]).norm(), 0, 1e-9);
  EXPECT_NEAR((curve.controlPoints().front() - samples.front()).norm(), 0, 1e-15);
  EXPECT_NEAR((curve.controlPoints().back() - samples.back()).norm(), 0, 1e-15);
}

TEST(BSplineFit, SmoothnessFairsControlPolygon) {
  PointVector samples;
  for (size_t i = 0; i <= 30; ++i)
    samples.emplace_back(i, (i % 2) * 0.5, 0);
  auto params = chordLengthParameters(samples);
  size_t p = 3, n = 16;
  auto knots = approximationKnots(params, p, n);
  auto all_free = [](size_t) -> MoveConstraint { return MoveType::Free(); };

  BSCurve rough(p, knots, PointVector(n));
  bsplineFit(rough, samples, params, all_free, 0);
  BSCurve smooth(p, knots, PointVector(n));
  bsplineFit(smooth, samples, params, all_free, 1);

  EXPECT_LT(polygonRoughness(smooth), polygonRoughness(rough));
}

TEST(BSplineFit, ClosedCircle) {
  auto samples = circlePoints(1, 0.5, 60);
  samples.push_back(samples.front());
  auto curve = fitClosedBSpline(samples, 3, 16, 0, 2);

  double lo = curve.basis().low(), hi = curve.basis().high();
  EXPECT_NEAR((curve.eval(lo) - curve.eval(hi)).norm(), 0, 1e-12);
  EXPECT_NEAR((curve.eval(lo) - samples.front()).norm(), 0, 1e-12);
  EXPECT_LT(maxDeviation(curve, samples, chordLengthParameters(samples)), 5e-3);
}

TEST(BSplineFit, ProjectionFindsFootPoint) {
  BSCurve line(1, { 0, 0, 1, 1 }, { {0, 0, 0}, {10, 0, 0} });
  double u = 0.9;
  double distance = projectToCurve(line, Point3D(3, 2, 0), u, 20, 1e-12);
  EXPECT_NEAR(u, 0.3, 1e-9);
  EXPECT_NEAR(distance, 2, 1e-9);
}
