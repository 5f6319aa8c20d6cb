#include <gtest/gtest.h>
#include "graph/graph_builder.hpp"

using namespace cg;

class GraphBuilderTest : public ::testing::Test {
protected:
    Vocabulary vocab = Vocabulary::from_frequencies(
        {{"alpha", 9}, {"beta", 8}, {"gamma", 7}, {"delta", 6}}, 10);

    CooccurrenceTable make_table() {
        CooccurrenceTable table;
        table.occurrences = {5, 4, 3, 2};
        table.pairs[make_term_pair(0, 1)] = 3;
        table.pairs[make_term_pair(0, 2)] = 1;
        table.pairs[make_term_pair(1, 2)] = 2;
        table.pairs[make_term_pair(2, 3)] = 3;
        table.pairs[make_term_pair(0, 3)] = 5;
        return table;
    }
};

TEST_F(GraphBuilderTest, OneNodePerVocabularyTerm) {
    GraphBuilder builder;
    ConceptGraph graph = builder.build(vocab, make_table());

    ASSERT_EQ(graph.num_nodes(), 4u);
    EXPECT_EQ(graph.nodes[0].label, "alpha");
    EXPECT_EQ(graph.nodes[0].count, 5u);
    EXPECT_EQ(graph.nodes[3].label, "delta");
    EXPECT_EQ(graph.nodes[3].count, 2u);
    for (size_t i = 0; i < graph.nodes.size(); ++i) {
        EXPECT_EQ(graph.nodes[i].id, i);
    }
}

TEST_F(GraphBuilderTest, PrunesEdgesAtOrBelowThreshold) {
    GraphBuilder builder;
    ConceptGraph graph = builder.build(vocab, make_table());

    EXPECT_EQ(graph.num_edges(), 4u);
    for (const auto& edge : graph.edges) {
        EXPECT_GT(edge.weight, 1u);
    }
    EXPECT_EQ(builder.statistics().candidate_edges, 5u);
    EXPECT_EQ(builder.statistics().weak_edges_pruned, 1u);
    EXPECT_EQ(builder.statistics().edges_truncated, 0u);
}

TEST_F(GraphBuilderTest, SortsByWeightThenEndpoints) {
    GraphBuilder builder;
    ConceptGraph graph = builder.build(vocab, make_table());

    ASSERT_EQ(graph.num_edges(), 4u);
    EXPECT_EQ(graph.edges[0].source, 0u);
    EXPECT_EQ(graph.edges[0].target, 3u);
    EXPECT_EQ(graph.edges[0].weight, 5u);

    // Equal weight 3: (0,1) before (2,3)
    EXPECT_EQ(graph.edges[1].source, 0u);
    EXPECT_EQ(graph.edges[1].target, 1u);
    EXPECT_EQ(graph.edges[2].source, 2u);
    EXPECT_EQ(graph.edges[2].target, 3u);

    EXPECT_EQ(graph.edges[3].weight, 2u);

    for (size_t i = 1; i < graph.edges.size(); ++i) {
        EXPECT_GE(graph.edges[i - 1].weight, graph.edges[i].weight);
    }
}

TEST_F(GraphBuilderTest, CapsEdgeCount) {
    GraphBuildOptions options;
    options.max_edges = 2;
    GraphBuilder builder(options);
    ConceptGraph graph = builder.build(vocab, make_table());

    ASSERT_EQ(graph.num_edges(), 2u);
    EXPECT_EQ(graph.edges[0].weight, 5u);
    EXPECT_EQ(graph.edges[1].weight, 3u);
    EXPECT_EQ(builder.statistics().edges_truncated, 2u);
}

TEST_F(GraphBuilderTest, CustomThreshold) {
    GraphBuildOptions options;
    options.min_edge_weight = 3;
    GraphBuilder builder(options);
    ConceptGraph graph = builder.build(vocab, make_table());

    ASSERT_EQ(graph.num_edges(), 1u);
    EXPECT_EQ(graph.edges[0].weight, 5u);
}

TEST_F(GraphBuilderTest, ResultPassesValidation) {
    GraphBuilder builder;
    ConceptGraph graph = builder.build(vocab, make_table());

    std::string error;
    EXPECT_TRUE(graph.validate(error)) << error;
    for (const auto& edge : graph.edges) {
        EXPECT_LT(edge.source, edge.target);
    }
}

TEST_F(GraphBuilderTest, EmptyVocabularyGivesEmptyGraph) {
    GraphBuilder builder;
    ConceptGraph graph = builder.build(Vocabulary{}, CooccurrenceTable{});

    EXPECT_TRUE(graph.empty());
    EXPECT_EQ(graph.num_edges(), 0u);
}

TEST_F(GraphBuilderTest, DefaultCapIs180) {
    GraphBuildOptions options;
    EXPECT_EQ(options.max_edges, 180u);
    EXPECT_EQ(options.min_edge_weight, 1u);
}
