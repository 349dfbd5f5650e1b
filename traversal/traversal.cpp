#include "traversal.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <math/polygon.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace curveloop {

namespace {

Curve& entity_at(EntityList& entities, EntityId id) {
    if (id >= entities.size() || !entities[id]) {
        throw std::out_of_range("Entity index " + std::to_string(id) + " out of range");
    }
    return *entities[id];
}

const Curve& entity_at(const EntityList& entities, EntityId id) {
    if (id >= entities.size() || !entities[id]) {
        throw std::out_of_range("Entity index " + std::to_string(id) + " out of range");
    }
    return *entities[id];
}

}  // namespace

std::pair<bool, bool> edge_direction(const NodePair& a, const NodePair& b) {
    if (a.first == b.first) {
        return {true, false};
    } else if (a.first == b.second) {
        return {true, true};
    } else if (a.second == b.first) {
        return {false, false};
    } else if (a.second == b.second) {
        return {false, true};
    }
    throw InconsistentTopology("Edges are not connected: (" +
                               std::to_string(a.first) + ", " + std::to_string(a.second) +
                               ") and (" +
                               std::to_string(b.first) + ", " + std::to_string(b.second) + ")");
}

EntityPath resolve_vertex_cycle(const VertexPath& vertex_path,
                                const VertexGraph& graph,
                                EntityList& entities,
                                const Vertices* vertices,
                                TraversalStats* stats) {
    auto log = logging::get_logger();

    if (vertex_path.empty()) {
        throw InvalidArgument("resolve_vertex_cycle: empty vertex path");
    }

    bool forward = true;
    if (vertices) {
        std::vector<Vec3> ring = vertices->gather(vertex_path);
        ring.push_back(ring.front());
        forward = is_ccw(ring);
    }

    // Entity of every cycle edge, wrap-around included, first hit kept
    const size_t count = vertex_path.size();
    EntityPath entity_path;
    entity_path.reserve(count);
    std::unordered_set<EntityId> seen;
    size_t duplicates = 0;
    for (size_t i = 0; i < count; ++i) {
        VertexId a = vertex_path[i];
        VertexId b = vertex_path[(i + 1) % count];
        EntityId entity = graph.edge_entity(a, b);
        if (seen.insert(entity).second) {
            entity_path.push_back(entity);
        } else {
            ++duplicates;
        }
    }

    if (duplicates > 0) {
        log->debug("Cycle of {} vertices revisited {} entity edges", count, duplicates);
        if (stats) {
            stats->duplicate_entities += duplicates;
        }
    }

    if (!forward) {
        std::reverse(entity_path.begin(), entity_path.end());
    }

    // Align every entity so it ends where its successor begins.
    // A path made of one entity keeps that entity's direction.
    const size_t length = entity_path.size();
    if (length > 1) {
        for (size_t i = 0; i < length; ++i) {
            Curve& a = entity_at(entities, entity_path[i]);
            Curve& b = entity_at(entities, entity_path[(i + 1) % length]);
            auto [reverse_a, reverse_b] = edge_direction(a.end_points(), b.end_points());
            if (reverse_a) {
                a.reverse();
            }
            if (reverse_b) {
                b.reverse();
            }
        }
    }

    return entity_path;
}

std::vector<EntityPath> extract_closed_paths(EntityList& entities,
                                             const Vertices& vertices,
                                             TraversalStats* stats) {
    auto log = logging::get_logger();

    VertexGraphResult built = build_vertex_graph(entities);

    std::vector<EntityPath> paths;
    for (EntityId index : built.closed) {
        paths.push_back({index});
    }

    std::vector<VertexPath> cycles = built.graph.cycle_basis();
    size_t degenerate = 0;
    for (const auto& cycle : cycles) {
        // Fewer than 2 vertices encloses nothing
        if (cycle.size() < 2) {
            ++degenerate;
            continue;
        }
        paths.push_back(resolve_vertex_cycle(cycle, built.graph, entities, &vertices, stats));
    }

    if (degenerate > 0) {
        log->debug("Skipped {} degenerate cycles", degenerate);
    }
    log->debug("Extracted {} closed paths ({} closed entities, {} graph cycles)",
               paths.size(), built.closed.size(), cycles.size());

    if (stats) {
        stats->closed_entities += built.closed.size();
        stats->cycles_found += cycles.size();
        stats->degenerate_cycles += degenerate;
        stats->paths += paths.size();
    }

    return paths;
}

std::vector<Vec3> discretize_path(const EntityList& entities,
                                  const Vertices& vertices,
                                  const EntityPath& path,
                                  double scale,
                                  const Resolution& res) {
    if (path.empty()) {
        throw InvalidArgument("Cannot discretize empty path");
    }

    std::vector<Vec3> discrete;
    if (path.size() == 1) {
        discrete = entity_at(entities, path.front()).discretize(vertices, scale, res);
    } else {
        for (size_t i = 0; i < path.size(); ++i) {
            std::vector<Vec3> current = entity_at(entities, path[i]).discretize(vertices, scale, res);
            // The next entity starts where this one ends; keep that point once
            size_t keep = current.size();
            if (i + 1 < path.size() && keep > 0) {
                --keep;
            }
            discrete.insert(discrete.end(), current.begin(), current.begin() + keep);
        }
    }

    if (vertices.dimension() == 2 && !is_ccw(discrete)) {
        std::reverse(discrete.begin(), discrete.end());
    }

    logging::get_logger()->trace("Discretized path of {} entities into {} points",
                                 path.size(), discrete.size());
    return discrete;
}

std::vector<std::vector<Vec3>> discretize_paths(EntityList& entities,
                                                const Vertices& vertices,
                                                double scale,
                                                const Resolution& res) {
    std::vector<std::vector<Vec3>> result;
    for (const auto& path : extract_closed_paths(entities, vertices)) {
        result.push_back(discretize_path(entities, vertices, path, scale, res));
    }
    return result;
}

}  // namespace curveloop
