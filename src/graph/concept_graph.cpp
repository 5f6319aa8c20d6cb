#include "graph/concept_graph.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace cg {

// ==========================================
// ConceptNode / ConceptEdge Implementation
// ==========================================

nlohmann::ordered_json ConceptNode::to_json() const {
    nlohmann::ordered_json j;
    j["id"] = id;
    j["label"] = label;
    j["count"] = count;
    j["x"] = x;
    j["y"] = y;
    return j;
}

ConceptNode ConceptNode::from_json(const nlohmann::json& j) {
    ConceptNode node;
    node.id = j.at("id").get<size_t>();
    node.label = j.at("label").get<std::string>();
    node.count = j.value("count", static_cast<size_t>(0));
    node.x = j.value("x", 0.0);
    node.y = j.value("y", 0.0);
    return node;
}

nlohmann::ordered_json ConceptEdge::to_json() const {
    nlohmann::ordered_json j;
    j["source"] = source;
    j["target"] = target;
    j["weight"] = weight;
    return j;
}

ConceptEdge ConceptEdge::from_json(const nlohmann::json& j) {
    ConceptEdge edge;
    edge.source = j.at("source").get<size_t>();
    edge.target = j.at("target").get<size_t>();
    edge.weight = j.at("weight").get<size_t>();
    return edge;
}

// ==========================================
// GraphStatistics Implementation
// ==========================================

nlohmann::ordered_json GraphStatistics::to_json() const {
    nlohmann::ordered_json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["total_weight"] = total_weight;
    j["max_weight"] = max_weight;
    j["min_weight"] = min_weight;
    j["avg_degree"] = avg_degree;
    j["max_degree"] = max_degree;
    j["isolated_nodes"] = isolated_nodes;
    return j;
}

void GraphStatistics::print(std::ostream& out) const {
    out << "  Nodes: " << num_nodes << "\n";
    out << "  Edges: " << num_edges << "\n";
    out << "  Total edge weight: " << total_weight << "\n";
    if (num_edges > 0) {
        out << "  Edge weight range: " << min_weight << " - " << max_weight << "\n";
    }
    out << "  Average degree: " << avg_degree << "\n";
    out << "  Max degree: " << max_degree << "\n";
    out << "  Isolated nodes: " << isolated_nodes << "\n";
}

// ==========================================
// ConceptGraph Implementation
// ==========================================

bool ConceptGraph::validate(std::string& error_message) const {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].id != i) {
            error_message = "Node at index " + std::to_string(i) +
                            " has id " + std::to_string(nodes[i].id);
            return false;
        }
    }

    std::set<std::pair<size_t, size_t>> seen;
    for (const auto& edge : edges) {
        if (edge.source >= nodes.size() || edge.target >= nodes.size()) {
            error_message = "Edge (" + std::to_string(edge.source) + ", " +
                            std::to_string(edge.target) + ") references a missing node";
            return false;
        }
        if (edge.source >= edge.target) {
            error_message = "Edge (" + std::to_string(edge.source) + ", " +
                            std::to_string(edge.target) + ") is not stored as source < target";
            return false;
        }
        if (!seen.insert({edge.source, edge.target}).second) {
            error_message = "Duplicate edge (" + std::to_string(edge.source) + ", " +
                            std::to_string(edge.target) + ")";
            return false;
        }
    }

    return true;
}

std::vector<size_t> ConceptGraph::compute_degrees() const {
    std::vector<size_t> degrees(nodes.size(), 0);
    for (const auto& edge : edges) {
        degrees[edge.source]++;
        degrees[edge.target]++;
    }
    return degrees;
}

GraphStatistics ConceptGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = nodes.size();
    stats.num_edges = edges.size();

    if (!edges.empty()) {
        stats.min_weight = std::numeric_limits<size_t>::max();
        for (const auto& edge : edges) {
            stats.total_weight += edge.weight;
            stats.max_weight = std::max(stats.max_weight, edge.weight);
            stats.min_weight = std::min(stats.min_weight, edge.weight);
        }
    }

    auto degrees = compute_degrees();
    if (!degrees.empty()) {
        size_t total_degree = 0;
        for (size_t degree : degrees) {
            total_degree += degree;
            stats.max_degree = std::max(stats.max_degree, degree);
            if (degree == 0) stats.isolated_nodes++;
        }
        stats.avg_degree = static_cast<double>(total_degree) / degrees.size();
    }

    return stats;
}

nlohmann::ordered_json ConceptGraph::to_json() const {
    nlohmann::ordered_json j;

    nlohmann::ordered_json node_list = nlohmann::ordered_json::array();
    for (const auto& node : nodes) {
        node_list.push_back(node.to_json());
    }

    nlohmann::ordered_json edge_list = nlohmann::ordered_json::array();
    for (const auto& edge : edges) {
        edge_list.push_back(edge.to_json());
    }

    j["nodes"] = node_list;
    j["edges"] = edge_list;
    return j;
}

void ConceptGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
    if (file.fail()) {
        throw std::runtime_error("Failed to write file: " + filename);
    }
}

ConceptGraph ConceptGraph::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("nodes") || !j.contains("edges")) {
        throw std::runtime_error("Graph JSON must contain 'nodes' and 'edges'");
    }

    ConceptGraph graph;
    try {
        for (const auto& node_json : j["nodes"]) {
            graph.nodes.push_back(ConceptNode::from_json(node_json));
        }
        for (const auto& edge_json : j["edges"]) {
            graph.edges.push_back(ConceptEdge::from_json(edge_json));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed graph JSON: ") + e.what());
    }

    std::string error;
    if (!graph.validate(error)) {
        throw std::runtime_error("Invalid graph: " + error);
    }

    return graph;
}

ConceptGraph ConceptGraph::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + filename + ": " + e.what());
    }
    file.close();

    return from_json(j);
}

} // namespace cg
