#pragma once

#include <cmath>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <geometry.hh>

// Scratch case directory, removed on destruction
class TempCase {
public:
  TempCase() {
    std::random_device rd;
    path = std::filesystem::temp_directory_path() /
      ("bladeloft-" + std::to_string(rd()) + "-" + std::to_string(rd()));
    std::filesystem::create_directories(path);
  }
  ~TempCase() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  std::string dir() const { return path.string(); }
  std::string file(std::string name) const { return (path / name).string(); }

  void writeText(std::string name, std::string text) const {
    std::ofstream f(file(name));
    f << text;
  }

  void writeSection(std::string name, const Geometry::PointVector &points) const {
    std::ofstream f(file(name));
    f.precision(17);
    for (const auto &p : points)
      f << p[0] << ' ' << p[1] << ' ' << p[2] << std::endl;
  }

private:
  std::filesystem::path path;
};

// `n` points of a circle in the plane z = `z`, without the closing point
inline Geometry::PointVector circlePoints(double radius, double z, size_t n) {
  Geometry::PointVector result;
  for (size_t i = 0; i < n; ++i) {
    double alpha = 2 * M_PI * i / n;
    result.emplace_back(radius * std::cos(alpha), radius * std::sin(alpha), z);
  }
  return result;
}
