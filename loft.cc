#include <filesystem>
#include <iostream>

#include <BRepOffsetAPI_ThruSections.hxx>
#include <Standard_Failure.hxx>

#include "closest-point.hh"
#include "errors.hh"
#include "knots.hh"
#include "loft.hh"
#include "switches.hh"

using namespace Geometry;

LoftOptions parseLoftOptions(const std::vector<std::string> &switches) {
  LoftOptions options;
  auto &curve = options.curve;

  std::string method;
  parseSwitch<std::string>(switches, "fit", &method, "kernel");
  curve.method = parseFitMethod(method);
  curve.close = !parseFlag(switches, "no-close");
  parseSwitch<double>(switches, "tolerance", &curve.tolerance, 1e-6);
  parseSwitch<size_t>(switches, "degree", &curve.degree, 3);
  parseSwitch<size_t>(switches, "cpts", &curve.control_points, 0);
  parseSwitch<double>(switches, "smoothness", &curve.smoothness, 0);
  parseSwitch<size_t>(switches, "iterations", &curve.iterations, 2);

  options.solid = !parseFlag(switches, "shell");
  options.ruled = parseFlag(switches, "ruled");
  options.check_compatibility = !parseFlag(switches, "no-compatibility");
  return options;
}

std::string caseLabel(const std::string &case_dir) {
  std::error_code ec;
  auto path = std::filesystem::absolute(case_dir, ec);
  if (ec)
    path = case_dir;
  path = path.lexically_normal();
  if (path.filename().empty())
    path = path.parent_path();
  return path.filename().string();
}

std::string defaultOutput(const std::string &case_dir, const std::string &label) {
  return (std::filesystem::path(case_dir) / ("blade_" + label + ".step")).string();
}

size_t BladeLoft::readCase(std::string case_dir) {
  auto filenames = findSections(case_dir);
  std::cout << "Found " << filenames.size() << " sections in " << case_dir << ":" << std::endl;

  sections.clear();
  curves.clear();
  for (const auto &filename : filenames) {
    Section s;
    s.filename = filename;
    s.index = sectionIndex(filename);
    s.points = readSection(filename);
    std::cout << "\t" << std::filesystem::path(filename).filename().string()
              << " (" << s.points.size() << " points)" << std::endl;
    sections.push_back(std::move(s));
  }
  return sections.size();
}

TopoDS_Shape BladeLoft::build(const std::vector<std::string> &switches) {
  return build(parseLoftOptions(switches));
}

TopoDS_Shape BladeLoft::build(const LoftOptions &options) {
  if (sections.empty())
    throw SectionNotFoundError("no sections to loft");
  if (sections.size() < 2)
    throw LoftError("a loft needs at least 2 sections, got " + std::to_string(sections.size()));

  curves.clear();
  std::vector<TopoDS_Wire> wires;
  for (const auto &s : sections) {
    auto curve = fitClosedCurve(s.points, options.curve);

    PointVector samples = s.points;
    bool closed_here = options.curve.close && closeLoop(samples, options.curve.tolerance);
    double deviation = maxDeviation(fromKernelCurve(curve), samples,
                                    chordLengthParameters(samples));
    std::cout << "Section " << s.index << ": degree " << curve->Degree() << ", "
              << curve->NbPoles() << " control points, max. deviation " << deviation
              << (closed_here ? " (loop closed)" : "") << std::endl;

    wires.push_back(makeClosedWire(curve, options.curve.tolerance));
    curves.push_back(curve);
  }

  try {
    BRepOffsetAPI_ThruSections loft(options.solid, options.ruled);
    loft.CheckCompatibility(options.check_compatibility);
    for (const auto &wire : wires)
      loft.AddWire(wire);
    loft.Build();
    if (!loft.IsDone())
      throw LoftError("loft through " + std::to_string(wires.size()) + " sections failed");
    std::cout << "Loft through " << wires.size() << " sections completed" << std::endl;
    return loft.Shape();
  } catch (const Standard_Failure &e) {
    throw LoftError(std::string("loft failed: ") + e.GetMessageString());
  }
}

std::vector<BSCurve> BladeLoft::fittedCurves() const {
  std::vector<BSCurve> result;
  for (const auto &curve : curves)
    result.push_back(fromKernelCurve(curve));
  return result;
}
