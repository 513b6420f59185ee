#pragma once

#include <geometry.hh>

// Newton iteration for the foot point of `point` on `curve`, starting at `u`.
// `u` is updated in place and kept inside the parameter domain;
// returns the distance between the point and its projection.
double projectToCurve(const Geometry::BSCurve &curve, const Geometry::Point3D &point,
                      double &u, size_t max_iteration, double distance_tol);

// Largest distance between `points` and `curve`, projecting from
// the given initial parameters (mapped linearly from [0,1] into the domain).
double maxDeviation(const Geometry::BSCurve &curve, const Geometry::PointVector &points,
                    const std::vector<double> &params);
