#pragma once

#include "graph/concept_graph.hpp"
#include <string>

namespace cg {

/**
 * @brief Static SVG rendering of a laid-out concept graph
 *
 * Output is a fixed-size canvas: a style block and white background, then
 * one line per edge, then one circle and text label per node, so labels sit
 * above the lines. Coordinates are written with one decimal.
 */
class SvgRenderer {
public:
    SvgRenderer(double width = 1200.0, double height = 800.0);

    std::string render(const ConceptGraph& graph) const;

    /**
     * @brief Render and write to a file
     * @throws std::runtime_error if the file cannot be written
     */
    void export_svg(const ConceptGraph& graph, const std::string& filename) const;

    /**
     * @brief clamp(1 + ln(weight), 1, 6)
     */
    static double stroke_width(size_t weight);

    /**
     * @brief 4 + max(0, log2(count))
     */
    static double node_radius(size_t count);

    /**
     * @brief Escape '&', '<' and '>' for element text
     */
    static std::string escape_xml(const std::string& text);

private:
    double width_;
    double height_;

    std::string header() const;
};

} // namespace cg
