#include <algorithm>

#include <BRep_Builder.hxx>
#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <GeomAPI_PointsToBSpline.hxx>
#include <Precision.hxx>
#include <Standard_Failure.hxx>
#include <TColgp_Array1OfPnt.hxx>
#include <TColStd_Array1OfInteger.hxx>
#include <TColStd_Array1OfReal.hxx>
#include <TopoDS_Vertex.hxx>

#include "bspline-fit.hh"
#include "closed-curve.hh"
#include "errors.hh"

using namespace Geometry;

bool closeLoop(PointVector &points, double tolerance) {
  if (points.empty())
    return false;
  if ((points.back() - points.front()).norm() <= tolerance)
    return false;
  points.push_back(points.front());
  return true;
}

static gp_Pnt toPnt(const Point3D &p) {
  return gp_Pnt(p[0], p[1], p[2]);
}

Handle(Geom_BSplineCurve) toKernelCurve(const BSCurve &curve) {
  const auto &knots = curve.basis().knots();
  const auto &cpts = curve.controlPoints();

  DoubleVector values;
  std::vector<int> multiplicities;
  for (auto k : knots)
    if (!values.empty() && k == values.back())
      multiplicities.back()++;
    else {
      values.push_back(k);
      multiplicities.push_back(1);
    }

  TColgp_Array1OfPnt poles(1, (int)cpts.size());
  for (size_t i = 0; i < cpts.size(); ++i)
    poles.SetValue((int)i + 1, toPnt(cpts[i]));
  TColStd_Array1OfReal kernel_knots(1, (int)values.size());
  TColStd_Array1OfInteger kernel_mults(1, (int)values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    kernel_knots.SetValue((int)i + 1, values[i]);
    kernel_mults.SetValue((int)i + 1, multiplicities[i]);
  }

  try {
    return new Geom_BSplineCurve(poles, kernel_knots, kernel_mults,
                                 (int)curve.basis().degree());
  } catch (const Standard_Failure &e) {
    throw GeometryError(std::string("invalid B-spline curve: ") + e.GetMessageString());
  }
}

BSCurve fromKernelCurve(const Handle(Geom_BSplineCurve) &curve) {
  if (curve->IsPeriodic() || curve->IsRational())
    throw GeometryError("only non-periodic, non-rational curves can be converted");

  size_t p = curve->Degree();
  size_t n = curve->NbPoles();
  TColStd_Array1OfReal flat(1, (int)(n + p + 1));
  curve->KnotSequence(flat);

  DoubleVector knots;
  for (int i = flat.Lower(); i <= flat.Upper(); ++i)
    knots.push_back(flat.Value(i));
  PointVector cpts;
  for (int i = 1; i <= (int)n; ++i) {
    const auto &pole = curve->Pole(i);
    cpts.emplace_back(pole.X(), pole.Y(), pole.Z());
  }
  return BSCurve(p, knots, cpts);
}

static Handle(Geom_BSplineCurve) approximate(const PointVector &points) {
  TColgp_Array1OfPnt array(1, (int)points.size());
  for (size_t i = 0; i < points.size(); ++i)
    array.SetValue((int)i + 1, toPnt(points[i]));

  try {
    GeomAPI_PointsToBSpline approx(array, 3, 8, GeomAbs_C2, 1.0e-3);
    if (!approx.IsDone())
      throw GeometryError("B-spline approximation did not converge");
    return approx.Curve();
  } catch (const Standard_Failure &e) {
    throw GeometryError(std::string("B-spline approximation failed: ") + e.GetMessageString());
  }
}

Handle(Geom_BSplineCurve) fitClosedCurve(const PointVector &points,
                                         const CurveOptions &options) {
  if (points.size() < 3)
    throw GeometryError("a closed curve needs at least 3 points, got " +
                        std::to_string(points.size()));

  PointVector samples = points;
  if (options.close)
    closeLoop(samples, options.tolerance);

  if (options.method == FitMethod::Kernel)
    return approximate(samples);

  size_t n = options.control_points;
  if (n == 0)
    n = std::min<size_t>(samples.size(), 24);
  auto curve = fitClosedBSpline(samples, options.degree, n, options.smoothness,
                                options.iterations);
  return toKernelCurve(curve);
}

TopoDS_Wire makeClosedWire(const Handle(Geom_BSplineCurve) &curve, double tolerance) {
  gp_Pnt start = curve->StartPoint(), end = curve->EndPoint();
  double gap = start.Distance(end);
  if (gap > tolerance)
    throw GeometryError("section curve is open (end gap " + std::to_string(gap) + ")");

  try {
    TopoDS_Vertex vertex;
    BRep_Builder().MakeVertex(vertex, start, std::max(tolerance, Precision::Confusion()));
    BRepBuilderAPI_MakeEdge edge(curve, vertex, vertex,
                                 curve->FirstParameter(), curve->LastParameter());
    if (!edge.IsDone())
      throw GeometryError("edge construction failed");
    BRepBuilderAPI_MakeWire wire(edge.Edge());
    if (!wire.IsDone())
      throw GeometryError("wire construction failed");
    return wire.Wire();
  } catch (const Standard_Failure &e) {
    throw GeometryError(std::string("wire construction failed: ") + e.GetMessageString());
  }
}

FitMethod parseFitMethod(const std::string &name) {
  if (name == "kernel")
    return FitMethod::Kernel;
  if (name == "lsq")
    return FitMethod::LeastSquares;
  throw std::invalid_argument("Unknown fit method: " + name);
}
