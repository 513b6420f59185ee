#include <iostream>

#include <BRepCheck_Analyzer.hxx>
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <Standard_Failure.hxx>
#include <TopAbs_ShapeEnum.hxx>
#include <TopExp_Explorer.hxx>

#include "shape-check.hh"

static size_t countSubShapes(const TopoDS_Shape &shape, TopAbs_ShapeEnum type) {
  size_t count = 0;
  for (TopExp_Explorer ex(shape, type); ex.More(); ex.Next())
    count++;
  return count;
}

ShapeReport checkShape(const TopoDS_Shape &shape) {
  ShapeReport report;
  if (shape.IsNull()) {
    report.error = "empty shape";
    return report;
  }

  try {
    report.valid = BRepCheck_Analyzer(shape).IsValid();

    GProp_GProps volume_props, surface_props;
    BRepGProp::VolumeProperties(shape, volume_props);
    BRepGProp::SurfaceProperties(shape, surface_props);
    report.volume = volume_props.Mass();
    report.area = surface_props.Mass();
  } catch (const Standard_Failure &e) {
    report.valid = false;
    report.error = e.GetMessageString();
  }

  report.solids = countSubShapes(shape, TopAbs_SOLID);
  report.shells = countSubShapes(shape, TopAbs_SHELL);
  report.faces = countSubShapes(shape, TopAbs_FACE);
  return report;
}

void printShapeReport(const ShapeReport &report, const std::string &label) {
  if (!report.error.empty()) {
    std::cerr << "Warning: shape check of " << label << " failed: " << report.error << std::endl;
    return;
  }
  std::cout << "Shape of " << label << ": " << report.solids << " solid(s), "
            << report.shells << " shell(s), " << report.faces << " face(s)" << std::endl;
  std::cout << "Volume of " << label << ": " << report.volume << std::endl;
  std::cout << "Surface area of " << label << ": " << report.area << std::endl;
  if (!report.valid)
    std::cerr << "Warning: the kernel reports the shape as invalid" << std::endl;
  if (report.volume <= 0)
    std::cerr << "Warning: volume <= 0, the shape may be an open shell" << std::endl;
}
