#include "graph/graph_builder.hpp"
#include <algorithm>
#include <utility>

namespace cg {

GraphBuilder::GraphBuilder(GraphBuildOptions options)
    : options_(options) {}

ConceptGraph GraphBuilder::build(const Vocabulary& vocabulary, const CooccurrenceTable& table) {
    stats_ = GraphBuildStatistics{};
    ConceptGraph graph;

    graph.nodes.reserve(vocabulary.size());
    for (size_t id = 0; id < vocabulary.size(); ++id) {
        ConceptNode node;
        node.id = id;
        node.label = vocabulary.term(id);
        node.count = id < table.occurrences.size() ? table.occurrences[id] : 0;
        graph.nodes.push_back(std::move(node));
    }

    stats_.candidate_edges = table.pairs.size();
    for (const auto& [pair, weight] : table.pairs) {
        if (pair.first == pair.second ||
            pair.second >= graph.nodes.size()) {
            continue;
        }
        if (weight <= options_.min_edge_weight) {
            stats_.weak_edges_pruned++;
            continue;
        }
        graph.edges.push_back({pair.first, pair.second, weight});
    }

    std::sort(graph.edges.begin(), graph.edges.end(),
        [](const ConceptEdge& a, const ConceptEdge& b) {
            if (a.weight != b.weight) return a.weight > b.weight;
            if (a.source != b.source) return a.source < b.source;
            return a.target < b.target;
        });

    if (graph.edges.size() > options_.max_edges) {
        stats_.edges_truncated = graph.edges.size() - options_.max_edges;
        graph.edges.resize(options_.max_edges);
    }

    return graph;
}

} // namespace cg
