#ifndef CURVELOOP_HPP
#define CURVELOOP_HPP

// curveloop public API
// Closed loops from a soup of curve entities, their discretization and
// arc-length resampling

#include <math/vec3.hpp>
#include <math/tolerance.hpp>
#include <math/polygon.hpp>
#include <entities/vertices.hpp>
#include <entities/resolution.hpp>
#include <entities/curve.hpp>
#include <entities/line.hpp>
#include <entities/arc.hpp>
#include <entities/bezier.hpp>
#include <traversal/vertex_graph.hpp>
#include <traversal/traversal.hpp>
#include <sampling/path_sample.hpp>
#include <common/errors.hpp>
#include <common/settings.hpp>

namespace curveloop {

// Usage:
//   Vertices vertices = Vertices::planar({{0, 0}, {1, 0}, {1, 1}, {0, 1}});
//   EntityList entities;
//   entities.push_back(std::make_unique<Line>(std::vector<VertexId>{0, 1, 2}));
//   entities.push_back(std::make_unique<Arc>(std::vector<VertexId>{2, 3, 0}));
//
//   // Entity index loops; entity points are reordered in place
//   std::vector<EntityPath> paths = extract_closed_paths(entities, vertices);
//
//   // One counter-clockwise polyline per loop
//   std::vector<Vec3> outline = discretize_path(entities, vertices, paths[0]);
//
//   // 100 evenly spaced points along it
//   std::vector<Vec3> even = resample(outline, 100);

}  // namespace curveloop

#endif // CURVELOOP_HPP
