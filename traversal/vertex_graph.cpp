#include "vertex_graph.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace curveloop {

VertexGraph::NodeIndex VertexGraph::node_index(VertexId v) const {
    auto it = index_.find(v);
    if (it == index_.end()) {
        throw std::out_of_range("VertexGraph: vertex " + std::to_string(v) + " not in graph");
    }
    return it->second;
}

VertexGraph::NodeIndex VertexGraph::ensure_node(VertexId v) {
    auto it = index_.find(v);
    if (it != index_.end()) {
        return it->second;
    }
    NodeIndex id = static_cast<NodeIndex>(nodes_.size());
    nodes_.push_back(v);
    adjacency_.emplace_back();
    index_[v] = id;
    return id;
}

const VertexGraph::Adjacent* VertexGraph::find_adjacent(NodeIndex a, NodeIndex b) const {
    for (const auto& adj : adjacency_[a]) {
        if (adj.node == b) {
            return &adj;
        }
    }
    return nullptr;
}

void VertexGraph::add_edge(VertexId a, VertexId b, EntityId entity) {
    NodeIndex ia = ensure_node(a);
    NodeIndex ib = ensure_node(b);

    // Repeated pair: relabel in place, last entity wins
    bool relabeled = false;
    for (auto& adj : adjacency_[ia]) {
        if (adj.node == ib) {
            adj.entity = entity;
            relabeled = true;
        }
    }
    if (relabeled) {
        for (auto& adj : adjacency_[ib]) {
            if (adj.node == ia) {
                adj.entity = entity;
            }
        }
        return;
    }

    adjacency_[ia].push_back({ib, entity});
    if (ia != ib) {
        adjacency_[ib].push_back({ia, entity});
    }
    ++edge_count_;
}

bool VertexGraph::has_node(VertexId v) const {
    return index_.find(v) != index_.end();
}

bool VertexGraph::has_edge(VertexId a, VertexId b) const {
    if (!has_node(a) || !has_node(b)) {
        return false;
    }
    return find_adjacent(node_index(a), node_index(b)) != nullptr;
}

EntityId VertexGraph::edge_entity(VertexId a, VertexId b) const {
    if (has_node(a) && has_node(b)) {
        const Adjacent* adj = find_adjacent(node_index(a), node_index(b));
        if (adj) {
            return adj->entity;
        }
    }
    throw InconsistentTopology("VertexGraph: no edge between vertex " +
                               std::to_string(a) + " and vertex " + std::to_string(b));
}

std::vector<VertexId> VertexGraph::neighbors(VertexId v) const {
    std::vector<VertexId> result;
    for (const auto& adj : adjacency_[node_index(v)]) {
        result.push_back(nodes_[adj.node]);
    }
    return result;
}

size_t VertexGraph::degree(VertexId v) const {
    NodeIndex id = node_index(v);
    size_t result = adjacency_[id].size();
    if (find_adjacent(id, id)) {
        ++result;
    }
    return result;
}

std::vector<VertexId> VertexGraph::connected_component(VertexId v) const {
    NodeIndex start = node_index(v);
    std::vector<bool> seen(nodes_.size(), false);
    std::vector<NodeIndex> queue{start};
    seen[start] = true;

    for (size_t head = 0; head < queue.size(); ++head) {
        for (const auto& adj : adjacency_[queue[head]]) {
            if (!seen[adj.node]) {
                seen[adj.node] = true;
                queue.push_back(adj.node);
            }
        }
    }

    std::vector<VertexId> result;
    result.reserve(queue.size());
    for (NodeIndex id : queue) {
        result.push_back(nodes_[id]);
    }
    return result;
}

std::vector<VertexPath> VertexGraph::cycle_basis() const {
    std::vector<VertexPath> cycles;

    const size_t n = nodes_.size();
    std::vector<bool> done(n, false);
    std::vector<bool> visited(n, false);
    std::vector<NodeIndex> pred(n, 0);
    // used[x] holds the tree neighbours of x whose edge to x is already accounted for
    std::vector<std::unordered_set<NodeIndex>> used(n);

    for (NodeIndex root = 0; root < n; ++root) {
        if (done[root]) {
            continue;
        }

        std::vector<NodeIndex> component{root};
        std::vector<NodeIndex> stack{root};
        pred[root] = root;
        visited[root] = true;

        // Depth-first spanning tree; every non-tree edge closes one cycle
        while (!stack.empty()) {
            NodeIndex z = stack.back();
            stack.pop_back();

            for (const auto& adj : adjacency_[z]) {
                NodeIndex nbr = adj.node;
                if (!visited[nbr]) {
                    pred[nbr] = z;
                    stack.push_back(nbr);
                    visited[nbr] = true;
                    used[nbr] = {z};
                    component.push_back(nbr);
                } else if (nbr == z) {
                    cycles.push_back({nodes_[z]});
                } else if (used[z].count(nbr) == 0) {
                    const auto& pn = used[nbr];
                    VertexPath cycle{nodes_[nbr], nodes_[z]};
                    NodeIndex p = pred[z];
                    while (pn.count(p) == 0) {
                        cycle.push_back(nodes_[p]);
                        p = pred[p];
                    }
                    cycle.push_back(nodes_[p]);
                    cycles.push_back(std::move(cycle));
                    used[nbr].insert(z);
                }
            }
        }

        for (NodeIndex id : component) {
            done[id] = true;
        }
    }

    logging::get_logger()->debug("Cycle basis: {} cycles over {} nodes, {} edges",
                                 cycles.size(), n, edge_count_);
    return cycles;
}

VertexGraphResult build_vertex_graph(const EntityList& entities) {
    VertexGraphResult result;

    for (size_t index = 0; index < entities.size(); ++index) {
        const Curve& entity = *entities[index];
        EntityId id = static_cast<EntityId>(index);
        if (entity.closed()) {
            result.closed.push_back(id);
            continue;
        }
        for (const auto& [a, b] : entity.nodes()) {
            result.graph.add_edge(a, b, id);
        }
    }

    logging::get_logger()->debug("Vertex graph: {} nodes, {} edges, {} closed entities",
                                 result.graph.node_count(),
                                 result.graph.edge_count(),
                                 result.closed.size());
    return result;
}

Connectivity classify_connectivity(const VertexGraph& graph) {
    Connectivity result;

    for (VertexId node : graph.nodes()) {
        if (graph.degree(node) == 2) {
            continue;
        }
        if (result.broken.count(node)) {
            continue;
        }
        for (VertexId member : graph.connected_component(node)) {
            result.broken.insert(member);
        }
    }

    for (VertexId node : graph.nodes()) {
        if (!result.broken.count(node)) {
            result.okay.insert(node);
        }
    }

    logging::get_logger()->debug("Connectivity: {} broken, {} okay nodes",
                                 result.broken.size(), result.okay.size());
    return result;
}

}  // namespace curveloop
