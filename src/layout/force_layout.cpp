#include "layout/force_layout.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cg {

ForceLayout::ForceLayout(LayoutParams params)
    : params_(params) {
    if (params_.width <= 0.0 || params_.height <= 0.0) {
        throw std::invalid_argument("Layout canvas must have positive width and height");
    }
    if (params_.cooling_factor <= 0.0 || params_.cooling_factor >= 1.0) {
        throw std::invalid_argument("Cooling factor must be in (0, 1)");
    }
}

LayoutResult ForceLayout::run(ConceptGraph& graph) const {
    LayoutResult result;
    auto& nodes = graph.nodes;
    const size_t n = nodes.size();
    if (n == 0) {
        return result;
    }

    for (const auto& edge : graph.edges) {
        if (edge.source >= n || edge.target >= n) {
            throw std::invalid_argument("Edge (" + std::to_string(edge.source) + ", " +
                                        std::to_string(edge.target) + ") references a missing node");
        }
    }

    const double w = params_.width;
    const double h = params_.height;
    const double k = std::max(std::sqrt((w * h) / static_cast<double>(n)), 1.0);
    const double k_squared = k * k;
    result.ideal_edge_length = k;

    std::mt19937_64 rng(params_.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (auto& node : nodes) {
        node.x = unit(rng) * w;
        node.y = unit(rng) * h;
    }

    double t = std::min(w, h) / params_.initial_temperature_divisor;
    std::vector<std::pair<double, double>> disp(n);

    for (int iter = 0; iter < params_.max_iterations; ++iter) {
        std::fill(disp.begin(), disp.end(), std::make_pair(0.0, 0.0));

        // Repulsion between every unordered pair
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                const double dx = nodes[i].x - nodes[j].x;
                const double dy = nodes[i].y - nodes[j].y;
                const double dist = std::max(std::sqrt(dx * dx + dy * dy), params_.min_distance);
                const double force = k_squared / dist;
                const double fx = dx / dist * force;
                const double fy = dy / dist * force;
                disp[i].first += fx;
                disp[i].second += fy;
                disp[j].first -= fx;
                disp[j].second -= fy;
            }
        }

        // Attraction along edges, same k^2/d magnitude
        for (const auto& edge : graph.edges) {
            const size_t i = edge.source;
            const size_t j = edge.target;
            const double dx = nodes[i].x - nodes[j].x;
            const double dy = nodes[i].y - nodes[j].y;
            const double dist = std::max(std::sqrt(dx * dx + dy * dy), params_.min_distance);
            const double force = k_squared / dist;
            const double fx = dx / dist * force;
            const double fy = dy / dist * force;
            disp[i].first -= fx;
            disp[i].second -= fy;
            disp[j].first += fx;
            disp[j].second += fy;
        }

        for (size_t i = 0; i < n; ++i) {
            const double dx = std::clamp(disp[i].first, -t, t);
            const double dy = std::clamp(disp[i].second, -t, t);
            nodes[i].x = std::clamp(nodes[i].x + dx, 0.0, w);
            nodes[i].y = std::clamp(nodes[i].y + dy, 0.0, h);
        }

        result.iterations = iter + 1;
        t *= params_.cooling_factor;
        if (t < params_.min_temperature) {
            break;
        }
    }

    result.final_temperature = t;
    return result;
}

} // namespace cg
