#pragma once

#include "graph/concept_graph.hpp"
#include "graph/cooccurrence.hpp"
#include "graph/vocabulary.hpp"

namespace cg {

/**
 * @brief Edge pruning thresholds
 */
struct GraphBuildOptions {
    size_t min_edge_weight = 1;    ///< Edges must be strictly heavier than this
    size_t max_edges = 180;        ///< Cap applied after sorting by weight
};

/**
 * @brief Counts from the most recent build
 */
struct GraphBuildStatistics {
    size_t candidate_edges = 0;    ///< Distinct co-occurring pairs
    size_t weak_edges_pruned = 0;  ///< Pairs at or below min_edge_weight
    size_t edges_truncated = 0;    ///< Pairs dropped by the max_edges cap
};

/**
 * @brief Assembles a ConceptGraph from a vocabulary and its co-occurrence table
 *
 * One node per vocabulary entry, in id order, carrying its occurrence count.
 * Edges keep pairs heavier than min_edge_weight, sorted by descending weight
 * (then by source and target) and capped at max_edges.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(GraphBuildOptions options = {});

    ConceptGraph build(const Vocabulary& vocabulary, const CooccurrenceTable& table);

    const GraphBuildStatistics& statistics() const { return stats_; }

private:
    GraphBuildOptions options_;
    GraphBuildStatistics stats_;
};

} // namespace cg
