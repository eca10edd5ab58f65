#include <gtest/gtest.h>

#include "Errors.h"
#include "GraphAssembler.h"

using namespace graphscan;

namespace {

Node node_with_id(int id, float x)
{
    Node node;
    node.id = id;
    node.shape = Shape::circle({x, 50.0F}, 10.0F);
    node.confidence = 0.8;
    return node;
}

Edge edge_with(int id, int source, int target)
{
    Edge edge;
    edge.id = id;
    edge.source = source;
    edge.target = target;
    edge.confidence = 0.7;
    return edge;
}

} // namespace

TEST(GraphAssemblerTest, EmptyInputIsAValidResult)
{
    const auto result = GraphAssembler().assemble({}, {}, QualityReport(), DetectionDiagnostics());
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(result->nodes.empty());
    EXPECT_TRUE(result->edges.empty());
    EXPECT_EQ(result->labelCount(), 0);
}

TEST(GraphAssemblerTest, ResequencesIdsAndRemapsEdges)
{
    std::vector<Node> nodes {node_with_id(7, 10.0F), node_with_id(3, 40.0F), node_with_id(11, 70.0F)};
    std::vector<Edge> edges {edge_with(5, 7, 11), edge_with(9, 3, 7)};

    const auto result = GraphAssembler().assemble(nodes, edges, QualityReport(), DetectionDiagnostics());
    ASSERT_EQ(result->nodes.size(), 3u);
    EXPECT_EQ(result->nodes[0].id, 0);
    EXPECT_EQ(result->nodes[1].id, 1);
    EXPECT_EQ(result->nodes[2].id, 2);
    EXPECT_FLOAT_EQ(result->nodes[1].shape.center.x, 40.0F);

    ASSERT_EQ(result->edges.size(), 2u);
    EXPECT_EQ(result->edges[0].id, 0);
    EXPECT_EQ(result->edges[0].source, 0);
    EXPECT_EQ(result->edges[0].target, 2);
    EXPECT_EQ(result->edges[1].id, 1);
    EXPECT_EQ(result->edges[1].source, 1);
    EXPECT_EQ(result->edges[1].target, 0);

    for (const auto &edge : result->edges) {
        EXPECT_NE(result->findNode(edge.source), nullptr);
        EXPECT_NE(result->findNode(edge.target), nullptr);
    }
}

TEST(GraphAssemblerTest, DanglingEdgeIsRejected)
{
    std::vector<Node> nodes {node_with_id(0, 10.0F), node_with_id(1, 40.0F)};
    EXPECT_THROW(GraphAssembler().assemble(nodes, {edge_with(0, 0, 4)}, QualityReport(), DetectionDiagnostics()),
                 InconsistentGraph);
}

TEST(GraphAssemblerTest, DuplicateNodeIdIsRejected)
{
    std::vector<Node> nodes {node_with_id(2, 10.0F), node_with_id(2, 40.0F)};
    EXPECT_THROW(GraphAssembler().assemble(nodes, {}, QualityReport(), DetectionDiagnostics()), InconsistentGraph);
}

TEST(GraphAssemblerTest, SelfLoopIsRejected)
{
    std::vector<Node> nodes {node_with_id(0, 10.0F)};
    EXPECT_THROW(GraphAssembler().assemble(nodes, {edge_with(0, 0, 0)}, QualityReport(), DetectionDiagnostics()),
                 InconsistentGraph);
}

TEST(GraphAssemblerTest, CarriesQualityAndDiagnostics)
{
    QualityReport quality;
    quality.level = QualityLevel::Medium;
    quality.contrast = 0.6;
    DetectionDiagnostics diagnostics;
    diagnostics.imageHash = "abc_def";
    diagnostics.labelsUnavailable = true;

    const auto result = GraphAssembler().assemble({}, {}, quality, diagnostics);
    EXPECT_EQ(result->quality, quality);
    EXPECT_EQ(result->diagnostics.imageHash, "abc_def");
    EXPECT_TRUE(result->diagnostics.labelsUnavailable);
}

TEST(GraphAssemblerTest, VerifyAcceptsAssembledGraph)
{
    const auto result = GraphAssembler().assemble({node_with_id(0, 10.0F), node_with_id(1, 60.0F)},
                                                  {edge_with(0, 0, 1)}, QualityReport(), DetectionDiagnostics());
    EXPECT_NO_THROW(GraphAssembler::verify(*result));
}

TEST(GraphAssemblerTest, VerifyRejectsBrokenGraphs)
{
    DetectionResult dangling;
    dangling.nodes = {node_with_id(0, 10.0F), node_with_id(1, 60.0F)};
    dangling.edges = {edge_with(0, 0, 7)};
    EXPECT_THROW(GraphAssembler::verify(dangling), InconsistentGraph);

    DetectionResult duplicateNodes;
    duplicateNodes.nodes = {node_with_id(3, 10.0F), node_with_id(3, 60.0F)};
    EXPECT_THROW(GraphAssembler::verify(duplicateNodes), InconsistentGraph);

    DetectionResult duplicateEdges;
    duplicateEdges.nodes = {node_with_id(0, 10.0F), node_with_id(1, 60.0F), node_with_id(2, 110.0F)};
    duplicateEdges.edges = {edge_with(4, 0, 1), edge_with(4, 1, 2)};
    EXPECT_THROW(GraphAssembler::verify(duplicateEdges), InconsistentGraph);

    DetectionResult selfLoop;
    selfLoop.nodes = {node_with_id(0, 10.0F)};
    selfLoop.edges = {edge_with(0, 0, 0)};
    EXPECT_THROW(GraphAssembler::verify(selfLoop), InconsistentGraph);
}
