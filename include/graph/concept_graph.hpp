#ifndef CONCEPT_GRAPH_HPP
#define CONCEPT_GRAPH_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <nlohmann/json.hpp>

namespace cg {

/**
 * @brief A vocabulary term placed on the canvas
 *
 * Node identity is positional: id equals the node's index in ConceptGraph::nodes
 * and is assigned by vocabulary rank (0 = most frequent term).
 */
struct ConceptNode {
    size_t id = 0;                 // Dense index, 0..N-1
    std::string label;             // The term (unigram or bigram)
    size_t count = 0;              // Occurrences inside the windowed scan
    double x = 0.0;                // Layout position
    double y = 0.0;

    nlohmann::ordered_json to_json() const;
    static ConceptNode from_json(const nlohmann::json& j);
};

/**
 * @brief Undirected co-occurrence edge, stored with source < target
 */
struct ConceptEdge {
    size_t source = 0;
    size_t target = 0;
    size_t weight = 0;             // Co-occurrences within the sliding window

    nlohmann::ordered_json to_json() const;
    static ConceptEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Summary numbers about a concept graph
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t total_weight = 0;
    size_t max_weight = 0;
    size_t min_weight = 0;
    double avg_degree = 0.0;
    size_t max_degree = 0;
    size_t isolated_nodes = 0;

    nlohmann::ordered_json to_json() const;
    void print(std::ostream& out) const;
};

/**
 * @brief Weighted co-occurrence graph over the selected vocabulary
 *
 * Built once per run by GraphBuilder. After construction only the layout
 * engine touches it, and only to write node positions.
 */
class ConceptGraph {
public:
    std::vector<ConceptNode> nodes;
    std::vector<ConceptEdge> edges;

    size_t num_nodes() const { return nodes.size(); }
    size_t num_edges() const { return edges.size(); }
    bool empty() const { return nodes.empty(); }

    /**
     * @brief Check the structural invariants
     * @param error_message Filled with the first violation found
     *
     * Edge endpoints must be valid node indices, source < target (which also
     * rules out self-loops), and no (source, target) pair may repeat. Node ids
     * must match their index.
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Degree of every node, indexed by node id
     */
    std::vector<size_t> compute_degrees() const;

    GraphStatistics compute_statistics() const;

    // ==========================================
    // Import/Export
    // ==========================================

    /**
     * @brief Serialize as {"nodes": [...], "edges": [...]} in that key order
     */
    nlohmann::ordered_json to_json() const;

    /**
     * @brief Write to_json() pretty printed with a two-space indent
     * @throws std::runtime_error if the file cannot be written
     */
    void export_to_json(const std::string& filename) const;

    /**
     * @brief Parse a graph, rejecting input that breaks the invariants
     * @throws std::runtime_error on missing fields or invalid structure
     */
    static ConceptGraph from_json(const nlohmann::json& j);

    /**
     * @brief Load a graph previously written by export_to_json
     */
    static ConceptGraph load_from_json(const std::string& filename);
};

} // namespace cg

#endif // CONCEPT_GRAPH_HPP
