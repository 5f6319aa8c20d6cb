#include "render/svg_renderer.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cg {

SvgRenderer::SvgRenderer(double width, double height)
    : width_(width), height_(height) {}

double SvgRenderer::stroke_width(size_t weight) {
    return std::clamp(1.0 + std::log(static_cast<double>(weight)), 1.0, 6.0);
}

double SvgRenderer::node_radius(size_t count) {
    return 4.0 + std::max(0.0, std::log2(static_cast<double>(count)));
}

std::string SvgRenderer::escape_xml(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            default: result += c; break;
        }
    }
    return result;
}

std::string SvgRenderer::header() const {
    std::stringstream ss;
    ss << "<svg viewBox=\"0 0 " << width_ << " " << height_
       << "\" xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width_
       << "\" height=\"" << height_ << "\">\n";
    ss << "<style>\n";
    ss << "text { font: 12px system-ui, sans-serif; fill: #222; }\n";
    ss << ".line { stroke: #999; stroke-opacity: .6; }\n";
    ss << ".node { fill: #3b82f6; }\n";
    ss << "</style>\n";
    ss << "<rect x=\"0\" y=\"0\" width=\"" << width_ << "\" height=\"" << height_
       << "\" fill=\"white\" />\n";
    return ss.str();
}

std::string SvgRenderer::render(const ConceptGraph& graph) const {
    std::stringstream ss;
    ss << header();
    ss << std::fixed;

    for (const auto& edge : graph.edges) {
        if (edge.source >= graph.nodes.size() || edge.target >= graph.nodes.size()) {
            throw std::invalid_argument("Cannot render edge to a missing node");
        }
        const auto& a = graph.nodes[edge.source];
        const auto& b = graph.nodes[edge.target];
        ss << std::setprecision(1)
           << "<line class=\"line\" x1=\"" << a.x << "\" y1=\"" << a.y
           << "\" x2=\"" << b.x << "\" y2=\"" << b.y << "\" stroke-width=\""
           << std::setprecision(2) << stroke_width(edge.weight) << "\" />";
    }

    ss << std::setprecision(1);
    for (const auto& node : graph.nodes) {
        ss << "<circle class=\"node\" cx=\"" << node.x << "\" cy=\"" << node.y
           << "\" r=\"" << node_radius(node.count) << "\"/>";
        ss << "<text x=\"" << node.x << "\" y=\"" << node.y
           << "\" dx=\"6\" dy=\"4\">" << escape_xml(node.label) << "</text>";
    }

    ss << "</svg>";
    return ss.str();
}

void SvgRenderer::export_svg(const ConceptGraph& graph, const std::string& filename) const {
    const std::string svg = render(graph);

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << svg;
    file.close();
    if (file.fail()) {
        throw std::runtime_error("Failed to write file: " + filename);
    }
}

} // namespace cg
