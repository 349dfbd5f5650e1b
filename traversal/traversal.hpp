#ifndef CURVELOOP_TRAVERSAL_TRAVERSAL_HPP
#define CURVELOOP_TRAVERSAL_TRAVERSAL_HPP

#include "vertex_graph.hpp"
#include <entities/curve.hpp>
#include <entities/resolution.hpp>
#include <entities/vertices.hpp>
#include <math/vec3.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace curveloop {

// Ordered entity indices forming one closed loop
using EntityPath = std::vector<EntityId>;

// Counters filled by path extraction, for diagnostics
struct TraversalStats {
    size_t closed_entities = 0;     // Entities that are loops by themselves
    size_t cycles_found = 0;        // Cycles in the vertex graph basis
    size_t degenerate_cycles = 0;   // Cycles with fewer than 2 vertices (skipped)
    size_t duplicate_entities = 0;  // Repeated entity hits dropped while resolving cycles
    size_t paths = 0;               // Entity paths returned
};

// Which of two connected entities must be reversed so that a ends where b starts.
// Takes the end points of both; returns {reverse_a, reverse_b}.
// Throws InconsistentTopology if they share no end point.
std::pair<bool, bool> edge_direction(const NodePair& a, const NodePair& b);

// Turn a cycle of vertex ids into an ordered entity path.
//
// With vertices, the path follows the cycle when it winds counter-clockwise
// (XY projection) and runs backwards otherwise. Entities are reversed in
// place so that every entity ends where the next one starts; reversals that
// happened before a failure stay applied.
//
// Throws InvalidArgument for an empty cycle and InconsistentTopology when a
// cycle edge is missing from the graph or two neighbours do not touch.
EntityPath resolve_vertex_cycle(const VertexPath& vertex_path,
                                const VertexGraph& graph,
                                EntityList& entities,
                                const Vertices* vertices = nullptr,
                                TraversalStats* stats = nullptr);

// Every closed loop in the entity list: one single-entity path per closed
// entity followed by one path per cycle of the vertex graph.
// Reorders entity points in place; not safe to run concurrently on the
// same entities.
std::vector<EntityPath> extract_closed_paths(EntityList& entities,
                                             const Vertices& vertices,
                                             TraversalStats* stats = nullptr);

// Connected points along an entity path. Shared points between consecutive
// entities appear once. 2D results are counter-clockwise.
// Throws InvalidArgument for an empty path.
std::vector<Vec3> discretize_path(const EntityList& entities,
                                  const Vertices& vertices,
                                  const EntityPath& path,
                                  double scale = 1.0,
                                  const Resolution& res = Resolution::defaults());

// Extract every closed path and discretize it
std::vector<std::vector<Vec3>> discretize_paths(EntityList& entities,
                                                const Vertices& vertices,
                                                double scale = 1.0,
                                                const Resolution& res = Resolution::defaults());

}  // namespace curveloop

#endif // CURVELOOP_TRAVERSAL_TRAVERSAL_HPP
