#include <gtest/gtest.h>
#include <traversal/vertex_graph.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <set>

using namespace curveloop;
using namespace curveloop::test;

namespace {

// Consecutive vertices of the cycle (wrap-around included) are graph edges
bool cycle_follows_edges(const VertexGraph& graph, const VertexPath& cycle) {
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (!graph.has_edge(cycle[i], cycle[(i + 1) % cycle.size()])) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ============================================
// Graph construction
// ============================================

TEST(VertexGraphTest, AddEdge) {
    VertexGraph graph;
    graph.add_edge(0, 1, 3);
    graph.add_edge(1, 2, 4);

    EXPECT_EQ(graph.node_count(), 3u);
    EXPECT_EQ(graph.edge_count(), 2u);
    EXPECT_TRUE(graph.has_edge(0, 1));
    EXPECT_TRUE(graph.has_edge(1, 0));
    EXPECT_FALSE(graph.has_edge(0, 2));
    EXPECT_EQ(graph.edge_entity(0, 1), 3u);
    EXPECT_EQ(graph.edge_entity(2, 1), 4u);
    EXPECT_EQ(graph.nodes(), (std::vector<VertexId>{0, 1, 2}));
}

TEST(VertexGraphTest, NodesKeepFirstSeenOrder) {
    VertexGraph graph;
    graph.add_edge(42, 7, 0);
    graph.add_edge(7, 100, 1);
    EXPECT_EQ(graph.nodes(), (std::vector<VertexId>{42, 7, 100}));
}

TEST(VertexGraphTest, RepeatedEdgeTakesLastLabel) {
    VertexGraph graph;
    graph.add_edge(0, 1, 5);
    graph.add_edge(1, 0, 7);

    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.edge_entity(0, 1), 7u);
    EXPECT_EQ(graph.edge_entity(1, 0), 7u);
    EXPECT_EQ(graph.degree(0), 1u);
}

TEST(VertexGraphTest, SelfLoop) {
    VertexGraph graph;
    graph.add_edge(3, 3, 2);

    EXPECT_EQ(graph.node_count(), 1u);
    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_TRUE(graph.has_edge(3, 3));
    EXPECT_EQ(graph.degree(3), 2u);
    EXPECT_EQ(graph.neighbors(3), (std::vector<VertexId>{3}));
}

TEST(VertexGraphTest, UnknownVertex) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);

    EXPECT_FALSE(graph.has_node(9));
    EXPECT_FALSE(graph.has_edge(0, 9));
    EXPECT_THROW(graph.degree(9), std::out_of_range);
    EXPECT_THROW(graph.neighbors(9), std::out_of_range);
    EXPECT_THROW(graph.edge_entity(0, 9), InconsistentTopology);
}

TEST(VertexGraphTest, MissingEdgeBetweenKnownVertices) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(1, 2, 1);
    EXPECT_THROW(graph.edge_entity(0, 2), InconsistentTopology);
}

TEST(VertexGraphTest, ConnectedComponent) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(1, 2, 1);
    graph.add_edge(5, 6, 2);

    auto component = graph.connected_component(2);
    ASSERT_EQ(component.size(), 3u);
    EXPECT_EQ(component.front(), 2u);
    EXPECT_EQ(std::set<VertexId>(component.begin(), component.end()),
              (std::set<VertexId>{0, 1, 2}));

    EXPECT_EQ(graph.connected_component(6).size(), 2u);
}

// ============================================
// Cycle basis
// ============================================

TEST(CycleBasisTest, Square) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(1, 2, 1);
    graph.add_edge(2, 3, 2);
    graph.add_edge(3, 0, 3);

    auto cycles = graph.cycle_basis();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (VertexPath{1, 2, 3, 0}));
    EXPECT_TRUE(cycle_follows_edges(graph, cycles[0]));
}

TEST(CycleBasisTest, TreeHasNoCycles) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(1, 2, 1);
    graph.add_edge(1, 3, 2);
    EXPECT_TRUE(graph.cycle_basis().empty());
}

TEST(CycleBasisTest, EmptyGraph) {
    VertexGraph graph;
    EXPECT_TRUE(graph.cycle_basis().empty());
}

TEST(CycleBasisTest, TriangleWithTail) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(1, 2, 1);
    graph.add_edge(2, 0, 2);
    graph.add_edge(2, 3, 3);

    auto cycles = graph.cycle_basis();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].size(), 3u);
    EXPECT_EQ(std::set<VertexId>(cycles[0].begin(), cycles[0].end()),
              (std::set<VertexId>{0, 1, 2}));
    EXPECT_TRUE(cycle_follows_edges(graph, cycles[0]));
}

TEST(CycleBasisTest, DisjointLoops) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(1, 2, 1);
    graph.add_edge(2, 0, 2);
    graph.add_edge(10, 11, 3);
    graph.add_edge(11, 12, 4);
    graph.add_edge(12, 13, 5);
    graph.add_edge(13, 10, 6);

    auto cycles = graph.cycle_basis();
    ASSERT_EQ(cycles.size(), 2u);
    std::vector<size_t> sizes{cycles[0].size(), cycles[1].size()};
    std::sort(sizes.begin(), sizes.end());
    EXPECT_EQ(sizes, (std::vector<size_t>{3, 4}));
    for (const auto& cycle : cycles) {
        EXPECT_TRUE(cycle_follows_edges(graph, cycle));
    }
}

TEST(CycleBasisTest, SharedEdgeGivesIndependentCycles) {
    // Two triangles glued along 1-2: edges - nodes + components = 2
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(1, 2, 1);
    graph.add_edge(2, 0, 2);
    graph.add_edge(1, 3, 3);
    graph.add_edge(3, 2, 4);

    auto cycles = graph.cycle_basis();
    ASSERT_EQ(cycles.size(), 2u);
    for (const auto& cycle : cycles) {
        EXPECT_GE(cycle.size(), 3u);
        EXPECT_TRUE(cycle_follows_edges(graph, cycle));
        std::set<VertexId> unique(cycle.begin(), cycle.end());
        EXPECT_EQ(unique.size(), cycle.size());
    }
}

TEST(CycleBasisTest, SelfLoopIsSingleVertexCycle) {
    VertexGraph graph;
    graph.add_edge(0, 1, 0);
    graph.add_edge(3, 3, 1);

    auto cycles = graph.cycle_basis();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (VertexPath{3}));
}

// ============================================
// Entity graph
// ============================================

TEST(BuildVertexGraphTest, ClosedEntitiesStayOutOfGraph) {
    EntityList entities = make_lines({{0, 1}, {1, 2}, {2, 3}, {3, 0}, {4, 5, 6, 4}});
    entities.push_back(std::make_unique<Arc>(std::vector<VertexId>{7, 8, 9}, true));

    VertexGraphResult result = build_vertex_graph(entities);
    EXPECT_EQ(result.closed, (std::vector<EntityId>{4, 5}));
    EXPECT_EQ(result.graph.node_count(), 4u);
    EXPECT_EQ(result.graph.edge_count(), 4u);
    EXPECT_FALSE(result.graph.has_node(4));
    EXPECT_FALSE(result.graph.has_node(7));
}

TEST(BuildVertexGraphTest, PolylineContributesEverySegment) {
    EntityList entities = make_lines({{0, 1, 2, 3}});
    VertexGraphResult result = build_vertex_graph(entities);

    EXPECT_EQ(result.graph.edge_count(), 3u);
    EXPECT_EQ(result.graph.edge_entity(0, 1), 0u);
    EXPECT_EQ(result.graph.edge_entity(2, 3), 0u);
    EXPECT_FALSE(result.graph.has_edge(0, 3));
}

TEST(BuildVertexGraphTest, ArcConnectsOnlyItsEnds) {
    EntityList entities;
    entities.push_back(std::make_unique<Arc>(std::vector<VertexId>{0, 1, 2}));

    VertexGraphResult result = build_vertex_graph(entities);
    EXPECT_TRUE(result.closed.empty());
    EXPECT_TRUE(result.graph.has_edge(0, 2));
    EXPECT_FALSE(result.graph.has_node(1));
}

TEST(BuildVertexGraphTest, EmptyEntityList) {
    EntityList entities;
    VertexGraphResult result = build_vertex_graph(entities);
    EXPECT_EQ(result.graph.node_count(), 0u);
    EXPECT_TRUE(result.closed.empty());
}

// ============================================
// Connectivity
// ============================================

TEST(ConnectivityTest, CleanLoopIsOkay) {
    EntityList entities = square_lines();
    VertexGraphResult built = build_vertex_graph(entities);

    Connectivity result = classify_connectivity(built.graph);
    EXPECT_TRUE(result.broken.empty());
    EXPECT_EQ(result.okay, (std::set<VertexId>{0, 1, 2, 3}));
}

TEST(ConnectivityTest, BranchBreaksWholeComponent) {
    EntityList entities = make_lines({{0, 1}, {1, 2}, {2, 0}, {2, 3}});
    VertexGraphResult built = build_vertex_graph(entities);

    Connectivity result = classify_connectivity(built.graph);
    EXPECT_EQ(result.broken, (std::set<VertexId>{0, 1, 2, 3}));
    EXPECT_TRUE(result.okay.empty());
}

TEST(ConnectivityTest, OpenSegmentNextToLoop) {
    EntityList entities = make_lines({{0, 1}, {1, 2}, {2, 3}, {3, 0}, {10, 11}});
    VertexGraphResult built = build_vertex_graph(entities);

    Connectivity result = classify_connectivity(built.graph);
    EXPECT_EQ(result.broken, (std::set<VertexId>{10, 11}));
    EXPECT_EQ(result.okay, (std::set<VertexId>{0, 1, 2, 3}));
}
