#pragma once

#include <functional>
#include <variant>

#include <geometry.hh>

namespace MoveType {
  struct Free {};  // control point is a free variable
  struct Fixed {}; // control point keeps its current position
};
using MoveConstraint = std::variant<MoveType::Free, MoveType::Fixed>;

// Least-squares fit of the control points:
// C(params[k]) = samples[k], plus a discrete second-difference
// penalty of weight `smoothness` on the control polygon.
void bsplineFit(Geometry::BSCurve &curve, const Geometry::PointVector &samples,
                const std::vector<double> &params,
                const std::function<MoveConstraint(size_t)> &constraint,
                double smoothness);

// Fits a clamped B-spline curve of degree `p` with `n` control points
// whose first and last control points are both `samples.front()`.
// The fit is repeated `iterations` times, each time after moving the
// parameters to the foot points on the previous curve.
Geometry::BSCurve fitClosedBSpline(const Geometry::PointVector &samples,
                                   size_t p, size_t n, double smoothness,
                                   size_t iterations);
