#ifndef CURVELOOP_MATH_POLYGON_HPP
#define CURVELOOP_MATH_POLYGON_HPP

#include "vec3.hpp"
#include "tolerance.hpp"
#include <vector>

namespace curveloop {

// Signed area of a ring projected onto the XY plane (shoelace formula).
// The ring may or may not repeat its first point at the end.
// Positive for counter-clockwise winding.
double signed_area(const std::vector<Vec3>& ring);

// Counter-clockwise test for a closed ring in the XY plane.
// Degenerate (zero area) rings are not counter-clockwise.
bool is_ccw(const std::vector<Vec3>& ring);

// Unit vector in the direction of v, or zero if v is shorter than tol.zero
Vec3 unitize(const Vec3& v, const Tolerance& tol = Tolerance::defaults());

// Sum of segment lengths
double polyline_length(const std::vector<Vec3>& points);

}  // namespace curveloop

#endif // CURVELOOP_MATH_POLYGON_HPP
