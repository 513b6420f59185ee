#include <cmath>
#include <fstream>
#include <stdexcept>

#include <IFSelect_ReturnStatus.hxx>
#include <Standard_Failure.hxx>
#include <STEPControl_Writer.hxx>

#include "errors.hh"
#include "io.hh"

using namespace Geometry;

void writeCurves(const std::vector<BSCurve> &curves, std::string filename, size_t resolution) {
  if (resolution < 1)
    throw std::invalid_argument("curve resolution must be at least 1");
  std::ofstream f(filename);
  f.exceptions(std::ios::failbit | std::ios::badbit);
  f << "# vtk DataFile Version 2.0" << std::endl;
  f << "Section curves with curvature values" << std::endl;
  f << "ASCII" << std::endl;
  f << "DATASET POLYDATA" << std::endl;

  auto parameter = [&](const BSCurve &curve, size_t i) {
    double lo = curve.basis().low(), hi = curve.basis().high();
    return lo + (double)i / resolution * (hi - lo);
  };

  f << "POINTS " << curves.size() * (resolution + 1) << " float" << std::endl;
  for (const auto &curve : curves)
    for (size_t i = 0; i <= resolution; ++i)
      f << curve.eval(parameter(curve, i)) << std::endl;

  f << "LINES " << curves.size() << " " << curves.size() * (resolution + 2) << std::endl;
  for (size_t j = 0; j < curves.size(); ++j) {
    f << resolution + 1;
    for (size_t i = 0; i <= resolution; ++i)
      f << ' ' << j * (resolution + 1) + i;
    f << std::endl;
  }

  f << "POINT_DATA " << curves.size() * (resolution + 1) << std::endl;
  f << "SCALARS section int 1" << std::endl;
  f << "LOOKUP_TABLE default" << std::endl;
  for (size_t j = 0; j < curves.size(); ++j)
    for (size_t i = 0; i <= resolution; ++i)
      f << j << std::endl;

  f << "SCALARS curvature float 1" << std::endl;
  f << "LOOKUP_TABLE default" << std::endl;
  for (const auto &curve : curves)
    for (size_t i = 0; i <= resolution; ++i) {
      VectorVector der;
      curve.eval(parameter(curve, i), 2, der);
      double speed = der[1].norm();
      f << (speed < epsilon ? 0.0 : (der[1] ^ der[2]).norm() / std::pow(speed, 3)) << std::endl;
    }
}

void writeSTEP(const TopoDS_Shape &shape, std::string filename) {
  if (shape.IsNull())
    throw ExportError("nothing to export to " + filename);

  try {
    STEPControl_Writer writer;
    if (writer.Transfer(shape, STEPControl_AsIs) != IFSelect_RetDone)
      throw ExportError("STEP transfer failed");
    if (writer.Write(filename.c_str()) != IFSelect_RetDone)
      throw ExportError("failed to write STEP file " + filename);
  } catch (const Standard_Failure &e) {
    throw ExportError("STEP export to " + filename + " failed: " + e.GetMessageString());
  }
}
