#pragma once

#include <string>

#include <Geom_BSplineCurve.hxx>
#include <TopoDS_Wire.hxx>

#include <geometry.hh>

enum class FitMethod { Kernel, LeastSquares };

struct CurveOptions {
  bool close = true;          // append the first point to open loops
  double tolerance = 1e-6;    // largest end gap treated as closed
  FitMethod method = FitMethod::Kernel;
  size_t degree = 3;          // least-squares only
  size_t control_points = 0;  //   0 means min(#points, 24)
  double smoothness = 0;      //   weight of the control polygon fairing
  size_t iterations = 2;      //   parameter correction steps
};

// Appends a copy of the first point when the last one is farther from it
// than `tolerance`. Returns true if a point was added.
bool closeLoop(Geometry::PointVector &points, double tolerance);

Handle(Geom_BSplineCurve) fitClosedCurve(const Geometry::PointVector &points,
                                         const CurveOptions &options);

// Single-edge wire; the curve ends may be up to `tolerance` apart,
// they are joined by one vertex of that tolerance.
TopoDS_Wire makeClosedWire(const Handle(Geom_BSplineCurve) &curve, double tolerance);

// Conversions between libgeom and OpenCASCADE B-spline curves (non-rational)
Handle(Geom_BSplineCurve) toKernelCurve(const Geometry::BSCurve &curve);
Geometry::BSCurve fromKernelCurve(const Handle(Geom_BSplineCurve) &curve);

FitMethod parseFitMethod(const std::string &name);
