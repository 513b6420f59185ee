#include <algorithm>
#include <cmath>

#include "closest-point.hh"

using namespace Geometry;

double projectToCurve(const BSCurve &curve, const Point3D &point, double &u,
                      size_t max_iteration, double distance_tol) {
  VectorVector der;
  auto lo = curve.basis().low();
  auto hi = curve.basis().high();

  for (size_t iteration = 0; iteration < max_iteration; ++iteration) {
    auto deviation = curve.eval(u, 2, der) - point;
    auto distance = deviation.norm();
    if (distance < distance_tol)
      break;

    double scaled_error = der[1] * deviation;
    double denominator = der[2] * deviation + der[1] * der[1];
    if (std::abs(denominator) < epsilon)
      break;

    double old = u;
    u -= scaled_error / denominator;
    u = std::min(std::max(u, lo), hi);

    if ((der[1] * (u - old)).norm() < distance_tol)
      break;
  }

  return (curve.eval(u) - point).norm();
}

double maxDeviation(const BSCurve &curve, const PointVector &points,
                    const std::vector<double> &params) {
  double lo = curve.basis().low(), hi = curve.basis().high();
  double result = 0;
  for (size_t i = 0; i < points.size(); ++i) {
    double u = lo + params[i] * (hi - lo);
    result = std::max(result, projectToCurve(curve, points[i], u, 20, 1e-10));
  }
  return result;
}
