#pragma once

#include "graph/concept_graph.hpp"
#include <cstdint>

namespace cg {

/**
 * @brief Parameters of the Fruchterman-Reingold simulation
 */
struct LayoutParams {
    double width = 1200.0;            ///< Canvas width
    double height = 800.0;            ///< Canvas height
    int max_iterations = 400;         ///< Upper bound on simulation steps
    double initial_temperature_divisor = 10.0;  ///< t0 = min(width, height) / divisor
    double cooling_factor = 0.96;     ///< t *= cooling_factor after each step
    double min_temperature = 0.5;     ///< Stop once t falls below this
    double min_distance = 0.01;       ///< Clamp for near-coincident nodes
    uint64_t seed = 37;               ///< Seed for initial positions
};

/**
 * @brief Outcome of a layout run
 */
struct LayoutResult {
    int iterations = 0;
    double final_temperature = 0.0;
    double ideal_edge_length = 0.0;
};

/**
 * @brief Force-directed placement of graph nodes
 *
 * Nodes start at uniformly random positions drawn from a fixed seed, so the
 * same graph always produces the same picture. Each step every node pair
 * repels with force k^2/d and every edge pulls its endpoints together with
 * the same k^2/d law, where k = sqrt(width * height / N) (at least 1). The
 * per-axis displacement is clamped to the current temperature, positions are
 * clamped to the canvas, and the temperature decays geometrically.
 *
 * Repulsion is O(N^2) per step; the node cap upstream keeps N small.
 */
class ForceLayout {
public:
    explicit ForceLayout(LayoutParams params = {});

    /**
     * @brief Write x and y of every node in place
     *
     * An empty graph is left untouched. Edges must reference valid node ids.
     */
    LayoutResult run(ConceptGraph& graph) const;

    const LayoutParams& params() const { return params_; }

private:
    LayoutParams params_;
};

} // namespace cg
