#pragma once

#include <string>

#include <TopoDS_Shape.hxx>

struct ShapeReport {
  bool valid = false;
  double volume = 0;
  double area = 0;
  size_t solids = 0, shells = 0, faces = 0;
  std::string error;  // set when the kernel could not analyse the shape
};

// Never throws; kernel failures end up in `error`
ShapeReport checkShape(const TopoDS_Shape &shape);

// Prints the volume and a warning for an invalid shape or a volume <= 0,
// which usually means the loft produced an open shell.
void printShapeReport(const ShapeReport &report, const std::string &label);
