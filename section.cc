#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include "errors.hh"
#include "section.hh"

using namespace Geometry;

namespace fs = std::filesystem;

PointVector readSection(const std::string &filename) {
  std::ifstream f(filename);
  if (!f)
    throw DataFormatError("cannot open section file " + filename);

  PointVector points;
  size_t columns = 0, line_number = 0;
  std::string line;
  while (std::getline(f, line)) {
    line_number++;
    auto comment = line.find('#');
    if (comment != std::string::npos)
      line.erase(comment);
    std::istringstream ss(line);
    std::vector<double> row;
    std::string token;
    while (ss >> token) {
      size_t used = 0;
      double x = 0;
      try {
        x = std::stod(token, &used);
      } catch (const std::logic_error &) {
        used = 0;
      }
      if (used != token.size())
        throw DataFormatError(filename + ":" + std::to_string(line_number) +
                              ": not a number: " + token);
      row.push_back(x);
    }
    if (row.empty())
      continue;
    if (columns == 0)
      columns = row.size();
    if (row.size() != columns)
      throw DataFormatError(filename + ":" + std::to_string(line_number) + ": expected " +
                            std::to_string(columns) + " columns, got " +
                            std::to_string(row.size()));
    if (columns < 3)
      throw DataFormatError(filename + " does not have at least 3 columns");
    points.emplace_back(row[0], row[1], row[2]);
  }

  if (points.empty())
    throw DataFormatError(filename + " contains no data");
  return points;
}

// Digits of the file name without leading zeros; shorter means smaller
static std::string sectionDigits(const std::string &filename) {
  auto name = fs::path(filename).filename().string();
  std::string digits;
  for (char c : name)
    if (std::isdigit(static_cast<unsigned char>(c)) && !(digits.empty() && c == '0'))
      digits.push_back(c);
  return digits;
}

static bool sectionLess(const std::string &a, const std::string &b) {
  auto da = sectionDigits(a), db = sectionDigits(b);
  if (da.size() != db.size())
    return da.size() < db.size();
  if (da != db)
    return da < db;
  return a < b;
}

size_t sectionIndex(const std::string &filename) {
  auto digits = sectionDigits(filename);
  if (digits.size() > std::numeric_limits<size_t>::digits10)
    throw DataFormatError("section number of " + filename + " is too large");
  size_t index = 0;
  for (char c : digits)
    index = index * 10 + (c - '0');
  return index;
}

std::vector<std::string> findSections(const std::string &case_dir) {
  std::error_code ec;
  if (!fs::is_directory(case_dir, ec))
    throw SectionNotFoundError("case directory " + case_dir + " does not exist");

  std::vector<std::string> result;
  fs::directory_iterator it(case_dir, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto &entry = *it;
    std::error_code status_ec;
    if (!entry.is_regular_file(status_ec))
      continue;
    auto name = entry.path().filename().string();
    if (name.size() < 7 || name.compare(0, 3, "sec") != 0 ||
        name.compare(name.size() - 4, 4, ".dat") != 0)
      continue;
    if (std::none_of(name.begin(), name.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
      continue;
    result.push_back(entry.path().string());
  }
  if (ec)
    throw SectionNotFoundError("cannot read case directory " + case_dir + ": " + ec.message());

  if (result.empty())
    throw SectionNotFoundError("no numbered sec*.dat files found in " + case_dir);

  std::sort(result.begin(), result.end(), sectionLess);
  return result;
}
