#include <algorithm>

#include "errors.hh"
#include "knots.hh"

using namespace Geometry;

std::vector<double> chordLengthParameters(const PointVector &points) {
  std::vector<double> result;
  result.reserve(points.size());
  result.push_back(0);
  for (size_t i = 1; i < points.size(); ++i)
    result.push_back(result.back() + (points[i] - points[i-1]).norm());

  double length = result.back();
  if (length < epsilon)
    throw GeometryError("degenerate section: all points coincide");
  for (auto &u : result)
    u /= length;
  result.back() = 1;
  return result;
}

std::vector<double> approximationKnots(const std::vector<double> &params,
                                       size_t p, size_t n) {
  if (n <= p || n > params.size())
    throw GeometryError("cannot fit " + std::to_string(n) + " control points of degree " +
                        std::to_string(p) + " to " + std::to_string(params.size()) + " points");

  std::vector<double> result;
  std::fill_n(std::back_inserter(result), p + 1, 0);

  // Interior knots: `n - p - 1` of them, each a weighted mean of two neighbouring
  // parameters, spaced `d` apart in parameter index
  double d = (double)params.size() / (n - p);
  for (size_t j = 1; j < n - p; ++j) {
    size_t i = (size_t)(j * d);
    double alpha = j * d - i;
    double knot = (1 - alpha) * params[i-1] + alpha * params[i];
    knot = std::min(std::max(knot, result.back()), 1.0);
    result.push_back(knot);
  }

  std::fill_n(std::back_inserter(result), p + 1, 1);
  return result;
}
