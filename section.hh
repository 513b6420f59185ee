#pragma once

#include <string>
#include <vector>

#include <geometry.hh>

struct Section {
  std::string filename;
  size_t index;                  // spanwise position, see sectionIndex()
  Geometry::PointVector points;  // in curve traversal order
};

// Reads the first three columns of a whitespace-delimited numeric table.
// All rows must have the same number (>= 3) of columns; blank lines are skipped.
// Throws DataFormatError.
Geometry::PointVector readSection(const std::string &filename);

// All digits of the file name (without directory) read as one number:
// sec1 -> 1, sec10 -> 10, sec2b3 -> 23
size_t sectionIndex(const std::string &filename);

// The sec*.dat files of `case_dir` having a digit in their name,
// in increasing sectionIndex() order.
// Throws SectionNotFoundError when there are none.
std::vector<std::string> findSections(const std::string &case_dir);
