#pragma once

#include <stdexcept>
#include <string>

// Every failure of the pipeline is one of these; the driver reports the
// message and exits. Kernel exceptions are converted at the call site.

class BladeLoftError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// No usable sec*.dat file in the case directory
class SectionNotFoundError : public BladeLoftError {
public:
  using BladeLoftError::BladeLoftError;
};

// Malformed section table
class DataFormatError : public BladeLoftError {
public:
  using BladeLoftError::BladeLoftError;
};

// Curve, edge or wire construction failed
class GeometryError : public BladeLoftError {
public:
  using BladeLoftError::BladeLoftError;
};

class LoftError : public BladeLoftError {
public:
  using BladeLoftError::BladeLoftError;
};

// STEP transfer or write failed
class ExportError : public BladeLoftError {
public:
  using BladeLoftError::BladeLoftError;
};
