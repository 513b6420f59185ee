#include <BRep_Tool.hxx>

#include <gtest/gtest.h>

#include "closed-curve.hh"
#include "errors.hh"
#include "test-fixtures.hh"

using namespace Geometry;

TEST(CloseLoop, AppendsFirstPoint) {
  auto points = circlePoints(2, 1, 12);
  EXPECT_TRUE(closeLoop(points, 1e-6));
  ASSERT_EQ(points.size(), 13u);
  EXPECT_EQ((points.back() - points.front()).norm(), 0);
}

TEST(CloseLoop, KeepsClosedData) {
  auto points = circlePoints(2, 1, 12);
  points.push_back(points.front() + Vector3D(1e-8, 0, 0));
  auto copy = points;
  EXPECT_FALSE(closeLoop(points, 1e-6));
  ASSERT_EQ(points.size(), copy.size());
  EXPECT_EQ((points.back() - copy.back()).norm(), 0);
}

TEST(FitClosedCurve, NoCloseLeavesOpenCurve) {
  CurveOptions options;
  options.close = false;
  auto curve = fitClosedCurve(circlePoints(1, 0, 24), options);
  EXPECT_GT(curve->StartPoint().Distance(curve->EndPoint()), 0.1);
  EXPECT_THROW(makeClosedWire(curve, options.tolerance), GeometryError);
}

TEST(FitClosedCurve, KernelApproximationIsClosed) {
  CurveOptions options;
  auto curve = fitClosedCurve(circlePoints(1, 0, 36), options);
  EXPECT_LT(curve->StartPoint().Distance(curve->EndPoint()), options.tolerance);
  auto wire = makeClosedWire(curve, options.tolerance);
  EXPECT_TRUE(BRep_Tool::IsClosed(wire));
}

TEST(FitClosedCurve, LeastSquaresIsClosed) {
  CurveOptions options;
  options.method = FitMethod::LeastSquares;
  options.control_points = 12;
  auto curve = fitClosedCurve(circlePoints(3, 2, 40), options);
  EXPECT_EQ(curve->NbPoles(), 12);
  EXPECT_EQ(curve->Degree(), 3);
  EXPECT_LT(curve->StartPoint().Distance(curve->EndPoint()), 1e-12);
  auto wire = makeClosedWire(curve, options.tolerance);
  EXPECT_TRUE(BRep_Tool::IsClosed(wire));
}

TEST(FitClosedCurve, TooFewPoints) {
  CurveOptions options;
  PointVector two = { {0, 0, 0}, {1, 0, 0} };
  EXPECT_THROW(fitClosedCurve(two, options), GeometryError);
  options.method = FitMethod::LeastSquares;
  options.control_points = 10;
  EXPECT_THROW(fitClosedCurve(circlePoints(1, 0, 5), options), GeometryError);
}

TEST(CurveConversion, KeepsShape) {
  BSCurve curve(3, { 0, 0, 0, 0, 0.4, 1, 1, 1, 1 },
                { {0, 0, 0}, {1, 2, 0}, {3, 2, 1}, {4, 0, 1}, {5, -1, 0} });
  auto kernel = toKernelCurve(curve);
  EXPECT_EQ(kernel->NbKnots(), 3);
  EXPECT_EQ(kernel->NbPoles(), 5);
  for (double u : { 0.0, 0.2, 0.4, 0.7, 1.0 }) {
    auto p = curve.eval(u);
    auto q = kernel->Value(u);
    EXPECT_NEAR(q.Distance(gp_Pnt(p[0], p[1], p[2])), 0, 1e-12);
  }
  auto back = fromKernelCurve(kernel);
  EXPECT_EQ(back.basis().knots(), curve.basis().knots());
  EXPECT_NEAR((back.eval(0.55) - curve.eval(0.55)).norm(), 0, 1e-12);
}

TEST(FitMethodNames, Parse) {
  EXPECT_EQ(parseFitMethod("kernel"), FitMethod::Kernel);
  EXPECT_EQ(parseFitMethod("lsq"), FitMethod::LeastSquares);
  EXPECT_THROW(parseFitMethod("spline"), std::invalid_argument);
}
