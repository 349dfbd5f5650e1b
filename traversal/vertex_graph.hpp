#ifndef CURVELOOP_TRAVERSAL_VERTEX_GRAPH_HPP
#define CURVELOOP_TRAVERSAL_VERTEX_GRAPH_HPP

#include <entities/curve.hpp>
#include <cstdint>
#include <set>
#include <unordered_map>
#include <vector>

namespace curveloop {

using VertexPath = std::vector<VertexId>;

// Undirected simple graph over vertex ids. Every edge carries the index of
// the entity that contributed it. Nodes live in a dense arena in first-seen
// order; vertex ids are mapped onto it.
class VertexGraph {
public:
    VertexGraph() = default;

    // Connect a and b. Adding an existing pair again replaces its entity label.
    // a == b stores a self-loop.
    void add_edge(VertexId a, VertexId b, EntityId entity);

    bool has_node(VertexId v) const;
    bool has_edge(VertexId a, VertexId b) const;

    // Entity labeling edge (a, b); throws InconsistentTopology if not connected
    EntityId edge_entity(VertexId a, VertexId b) const;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edge_count_; }

    // Vertex ids in first-seen order
    const std::vector<VertexId>& nodes() const { return nodes_; }

    std::vector<VertexId> neighbors(VertexId v) const;

    // Number of incident edge ends; a self-loop counts twice
    size_t degree(VertexId v) const;

    // All vertices reachable from v, v first
    std::vector<VertexId> connected_component(VertexId v) const;

    // Independent simple cycles generating every cycle of the graph,
    // found from a spanning tree of each connected component.
    // A self-loop is reported as a single-vertex cycle.
    std::vector<VertexPath> cycle_basis() const;

private:
    using NodeIndex = uint32_t;

    struct Adjacent {
        NodeIndex node;
        EntityId entity;
    };

    NodeIndex node_index(VertexId v) const;
    NodeIndex ensure_node(VertexId v);
    const Adjacent* find_adjacent(NodeIndex a, NodeIndex b) const;

    std::vector<VertexId> nodes_;
    std::unordered_map<VertexId, NodeIndex> index_;
    std::vector<std::vector<Adjacent>> adjacency_;
    size_t edge_count_ = 0;
};

// Graph of all open entities plus the indices of self-closed ones
struct VertexGraphResult {
    VertexGraph graph;
    std::vector<EntityId> closed;
};

VertexGraphResult build_vertex_graph(const EntityList& entities);

// Split of graph nodes into those on clean degree-2 loops and the rest.
// A node of degree other than 2 breaks its whole connected component.
struct Connectivity {
    std::set<VertexId> broken;
    std::set<VertexId> okay;
};

Connectivity classify_connectivity(const VertexGraph& graph);

}  // namespace curveloop

#endif // CURVELOOP_TRAVERSAL_VERTEX_GRAPH_HPP
