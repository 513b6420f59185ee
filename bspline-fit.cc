#include <map>

#include <Eigen/Dense>

#include "bspline-fit.hh"
#include "closest-point.hh"
#include "errors.hh"
#include "knots.hh"

using namespace Geometry;

using VecMap = Eigen::Map<const Eigen::Vector3d>;

// Least-squares fit, one right-hand side column per coordinate:
//
// ||Ax - b||^2 -> min
//
// Fixed control points are moved to the right-hand side.

void bsplineFit(BSCurve &curve, const PointVector &samples, const std::vector<double> &params,
                const std::function<MoveConstraint(size_t)> &constraint,
                double smoothness) {
  const auto &basis = curve.basis();
  size_t p = basis.degree();
  auto &cpts = curve.controlPoints();
  size_t n = cpts.size();
  double lo = basis.low(), hi = basis.high();

  std::map<size_t, size_t> index_map;
  size_t nvars = 0;
  for (size_t i = 0; i < n; ++i)
    if (std::holds_alternative<MoveType::Free>(constraint(i)))
      index_map[i] = nvars++;
  if (nvars == 0)
    return;

  size_t n_smoothing = smoothness == 0 ? 0 : n - 2;
  size_t n_rows = samples.size() + n_smoothing;
  Eigen::MatrixXd A(n_rows, nvars), b(n_rows, 3);

  A.setZero(); b.setZero();

  auto addValue = [&](size_t row, size_t i, double x) {
    if (std::holds_alternative<MoveType::Fixed>(constraint(i)))
      b.row(row) -= VecMap(cpts[i].data()).transpose() * x;
    else
      A(row, index_map.at(i)) += x;
  };

  for (size_t k = 0; k < samples.size(); ++k) {
    double u = lo + params[k] * (hi - lo);
    size_t span = basis.findSpan(u);
    DoubleVector coeff;
    basis.basisFunctions(span, u, coeff);
    b.row(k) += VecMap(samples[k].data()).transpose();
    for (size_t j = 0; j <= p; ++j)
      addValue(k, span - p + j, coeff[j]);
  }

  if (smoothness != 0) {
    size_t row = samples.size();
    for (size_t i = 1; i < n - 1; ++i) {
      addValue(row, i, smoothness);
      addValue(row, i - 1, -0.5 * smoothness);
      addValue(row, i + 1, -0.5 * smoothness);
      row++;
    }
  }

  Eigen::MatrixXd x = A.colPivHouseholderQr().solve(b);
  if (!x.allFinite())
    throw GeometryError("least-squares curve fit is singular");

  for (auto [i, k] : index_map)
    cpts[i] = Point3D(x(k, 0), x(k, 1), x(k, 2));
}

BSCurve fitClosedBSpline(const PointVector &samples, size_t p, size_t n, double smoothness,
                         size_t iterations) {
  auto params = chordLengthParameters(samples);
  auto knots = approximationKnots(params, p, n);

  PointVector cpts(n, samples.front());
  BSCurve curve(p, knots, cpts);
  auto constraint = [&](size_t i) -> MoveConstraint {
    if (i == 0 || i == n - 1)
      return MoveType::Fixed();
    return MoveType::Free();
  };

  bsplineFit(curve, samples, params, constraint, smoothness);
  for (size_t iteration = 0; iteration < iterations; ++iteration) {
    // The closing sample stays at u = 1, the first one at u = 0
    for (size_t k = 1; k + 1 < samples.size(); ++k)
      projectToCurve(curve, samples[k], params[k], 10, 1e-12);
    bsplineFit(curve, samples, params, constraint, smoothness);
  }

  return curve;
}
