#pragma once

#include <vector>

#include <geometry.hh>

// Chord-length parameters of a polyline, normalized to [0,1].
// Throws GeometryError when the polyline has zero length.
std::vector<double> chordLengthParameters(const Geometry::PointVector &points);

// Generates a clamped knot vector in [0,1] for a degree-`p` basis
// with `n` control points, approximating data at `params`.
// - Interior knots are averages of the parameters, so that
//   every knot span contains at least one parameter value
// - Requires p < n <= params.size()
std::vector<double> approximationKnots(const std::vector<double> &params,
                                       size_t p, size_t n);
