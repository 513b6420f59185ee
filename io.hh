#pragma once

#include <string>
#include <vector>

#include <TopoDS_Shape.hxx>

#include <geometry.hh>

// Polylines of the section curves in VTK format, with the section number
// and the curvature as point data; `resolution` segments per curve (>= 1)
void writeCurves(const std::vector<Geometry::BSCurve> &curves,
                 std::string filename, size_t resolution);

// Throws ExportError; an existing file is overwritten
void writeSTEP(const TopoDS_Shape &shape, std::string filename);
