#include <cmath>

#include <gtest/gtest.h>

#include "errors.hh"
#include "io.hh"
#include "loft.hh"
#include "shape-check.hh"
#include "test-fixtures.hh"

using namespace Geometry;

// Circles of radius 1 at z = 0, 1, 2; the loft is a cylinder of volume 2 pi
static void writeCylinderCase(const TempCase &c) {
  c.writeSection("sec1.dat", circlePoints(1, 0, 48));
  c.writeSection("sec2.dat", circlePoints(1, 1, 48));
  c.writeSection("sec3.dat", circlePoints(1, 2, 48));
}

TEST(BladeLoft, CylinderVolume) {
  TempCase c;
  writeCylinderCase(c);
  BladeLoft loft;
  EXPECT_EQ(loft.readCase(c.dir()), 3u);
  auto shape = loft.build(std::vector<std::string>{});

  auto report = checkShape(shape);
  EXPECT_TRUE(report.valid);
  EXPECT_EQ(report.solids, 1u);
  EXPECT_NEAR(report.volume, 2 * M_PI, 0.02 * 2 * M_PI);
  EXPECT_EQ(loft.fittedCurves().size(), 3u);
}

TEST(BladeLoft, LeastSquaresCone) {
  TempCase c;
  c.writeSection("sec1.dat", circlePoints(2, 0, 60));
  c.writeSection("sec2.dat", circlePoints(1, 3, 60));
  BladeLoft loft;
  loft.readCase(c.dir());
  auto shape = loft.build(std::vector<std::string>{ "--fit=lsq", "--cpts=16", "--ruled" });

  // Frustum: pi h (R^2 + R r + r^2) / 3
  auto report = checkShape(shape);
  EXPECT_EQ(report.solids, 1u);
  EXPECT_NEAR(report.volume, 7 * M_PI, 0.02 * 7 * M_PI);
}

TEST(BladeLoft, ShellHasNoSolid) {
  TempCase c;
  writeCylinderCase(c);
  BladeLoft loft;
  loft.readCase(c.dir());
  auto shape = loft.build(std::vector<std::string>{ "--shell" });
  auto report = checkShape(shape);
  EXPECT_EQ(report.solids, 0u);
  EXPECT_GE(report.shells, 1u);
  EXPECT_NEAR(report.area, 4 * M_PI, 0.02 * 4 * M_PI);
}

TEST(BladeLoft, Failures) {
  TempCase c;
  BladeLoft loft;
  EXPECT_THROW(loft.readCase(c.dir()), SectionNotFoundError);
  EXPECT_THROW(loft.build(std::vector<std::string>{}), SectionNotFoundError);

  c.writeSection("sec1.dat", circlePoints(1, 0, 24));
  loft.readCase(c.dir());
  EXPECT_THROW(loft.build(std::vector<std::string>{}), LoftError);

  c.writeText("sec2.dat", "0 0\n1 1\n");
  EXPECT_THROW(loft.readCase(c.dir()), DataFormatError);
}

TEST(BladeLoft, OpenSectionsWithoutClosing) {
  TempCase c;
  writeCylinderCase(c);
  BladeLoft loft;
  loft.readCase(c.dir());
  EXPECT_THROW(loft.build(std::vector<std::string>{ "--no-close" }), GeometryError);
}

TEST(WriteSTEP, CreatesAndOverwrites) {
  TempCase c;
  writeCylinderCase(c);
  BladeLoft loft;
  loft.readCase(c.dir());
  auto shape = loft.build(std::vector<std::string>{});

  auto filename = c.file("blade_case_0001.step");
  writeSTEP(shape, filename);
  ASSERT_TRUE(std::filesystem::exists(filename));
  auto size = std::filesystem::file_size(filename);
  EXPECT_GT(size, 0u);

  writeSTEP(shape, filename);
  EXPECT_GT(std::filesystem::file_size(filename), 0u);

  std::ifstream f(filename);
  std::string header;
  std::getline(f, header);
  EXPECT_EQ(header, "ISO-10303-21;");
}

TEST(WriteSTEP, Failures) {
  TempCase c;
  EXPECT_THROW(writeSTEP(TopoDS_Shape(), c.file("empty.step")), ExportError);

  writeCylinderCase(c);
  BladeLoft loft;
  loft.readCase(c.dir());
  auto shape = loft.build(std::vector<std::string>{});
  EXPECT_THROW(writeSTEP(shape, c.file("no-such-dir/blade.step")), ExportError);
}

TEST(WriteCurves, VTKPolylines) {
  TempCase c;
  writeCylinderCase(c);
  BladeLoft loft;
  loft.readCase(c.dir());
  loft.build(std::vector<std::string>{ "--fit=lsq" });
  writeCurves(loft.fittedCurves(), c.file("curves.vtk"), 20);

  std::ifstream f(c.file("curves.vtk"));
  std::string line;
  bool points = false;
  while (std::getline(f, line))
    if (line == "POINTS 63 float")
      points = true;
  EXPECT_TRUE(points);
}

TEST(CaseNames, DefaultOutputPath) {
  EXPECT_EQ(caseLabel("case_0001/"), "case_0001");
  EXPECT_EQ(caseLabel("/data/cases/case_0007"), "case_0007");
  EXPECT_EQ(defaultOutput("case_0001/", caseLabel("case_0001/")),
            "case_0001/blade_case_0001.step");
  EXPECT_EQ(defaultOutput("/data/cases/case_0007", "run2"), "/data/cases/case_0007/blade_run2.step");
}

TEST(BladeLoft, ExportToDefaultOutput) {
  TempCase c;
  writeCylinderCase(c);
  BladeLoft loft;
  loft.readCase(c.dir());
  auto filename = defaultOutput(c.dir(), caseLabel(c.dir()));
  writeSTEP(loft.build(std::vector<std::string>{}), filename);
  EXPECT_EQ(std::filesystem::path(filename).parent_path(), std::filesystem::path(c.dir()));
  EXPECT_GT(std::filesystem::file_size(filename), 0u);
}

TEST(BladeLoft, SwitchValues) {
  auto options = parseLoftOptions({ "--shell=false", "--ruled=no", "--no-close=0" });
  EXPECT_TRUE(options.solid);
  EXPECT_FALSE(options.ruled);
  EXPECT_TRUE(options.curve.close);
  options = parseLoftOptions({ "--shell", "--ruled=yes", "--no-compatibility" });
  EXPECT_FALSE(options.solid);
  EXPECT_TRUE(options.ruled);
  EXPECT_FALSE(options.check_compatibility);
}

TEST(ShapeCheck, EmptyShapeIsReportedNotThrown) {
  ShapeReport report;
  EXPECT_NO_THROW(report = checkShape(TopoDS_Shape()));
  EXPECT_FALSE(report.valid);
  EXPECT_FALSE(report.error.empty());
  EXPECT_NO_THROW(printShapeReport(report, "empty"));
}

TEST(WriteCurves, RejectsZeroResolution) {
  TempCase c;
  BSCurve line(1, { 0, 0, 1, 1 }, { {0, 0, 0}, {1, 0, 0} });
  EXPECT_THROW(writeCurves({ line }, c.file("curves.vtk"), 0), std::invalid_argument);
  EXPECT_FALSE(std::filesystem::exists(c.file("curves.vtk")));
}
