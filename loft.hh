#pragma once

#include <string>
#include <vector>

#include <Geom_BSplineCurve.hxx>
#include <TopoDS_Shape.hxx>

#include <geometry.hh>

#include "closed-curve.hh"
#include "section.hh"

struct LoftOptions {
  CurveOptions curve;
  bool solid = true;               // false: open shell, no end caps
  bool ruled = false;              // false: smooth through all sections
  bool check_compatibility = true; // let the kernel align wire orientations
};

LoftOptions parseLoftOptions(const std::vector<std::string> &switches);

// Base name of the case directory, also with a trailing separator
std::string caseLabel(const std::string &case_dir);

// <case_dir>/blade_<label>.step
std::string defaultOutput(const std::string &case_dir, const std::string &label);

class BladeLoft {
public:
  size_t readCase(std::string case_dir);  // returns the number of sections
  TopoDS_Shape build(const std::vector<std::string> &switches);
  TopoDS_Shape build(const LoftOptions &options);

  std::vector<Geometry::BSCurve> fittedCurves() const;

private:
  std::vector<Section> sections;                  // in spanwise order
  std::vector<Handle(Geom_BSplineCurve)> curves;  // filled by build()
};
