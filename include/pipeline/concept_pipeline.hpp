#pragma once

#include "graph/concept_graph.hpp"
#include "graph/graph_builder.hpp"
#include "layout/force_layout.hpp"
#include "text/markdown_reader.hpp"
#include "text/tokenizer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cg {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for the concept graph pipeline
 */
struct PipelineConfig {
    // Input / output
    std::string input_root = "content/blog";        ///< Corpus root, searched recursively
    std::string output_directory = "static/graph";  ///< Created if absent
    std::vector<std::string> extensions = {".md"};  ///< Document file extensions
    std::string json_filename = "graph.json";
    std::string svg_filename = "graph.svg";

    // Tokenization
    size_t min_token_length = 3;                    ///< Shorter words are dropped
    std::vector<std::string> stopwords;             ///< Replaces the built-in list when non-empty
    std::vector<std::string> extra_stopwords;       ///< Added to the active list

    // Graph
    size_t max_nodes = 30;                          ///< Vocabulary size cap
    size_t window = 12;                             ///< Co-occurrence window in filtered terms
    size_t min_edge_weight = 1;                     ///< Edges must be strictly heavier
    size_t edge_multiplier = 6;                     ///< Edge cap = max_nodes * edge_multiplier

    // Layout
    double canvas_width = 1200.0;
    double canvas_height = 800.0;
    int layout_iterations = 400;
    double initial_temperature_divisor = 10.0;
    double cooling_factor = 0.96;
    double min_temperature = 0.5;
    uint64_t layout_seed = 37;

    bool verbose = true;                            ///< Progress output on stdout

    /**
     * @brief Load configuration from JSON file; absent keys keep defaults
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static PipelineConfig from_json_file(const std::string& path);

    static PipelineConfig from_json(const nlohmann::json& j);

    void to_json_file(const std::string& path) const;

    nlohmann::ordered_json to_json() const;

    bool validate(std::string& error_message) const;

    StopwordSet active_stopwords() const;
    LayoutParams layout_params() const;
    GraphBuildOptions build_options() const;
};

// ============================================================================
// Pipeline Statistics
// ============================================================================

/**
 * @brief Statistics from pipeline execution
 */
struct PipelineStatistics {
    // Documents
    int documents_found = 0;
    int documents_processed = 0;
    int documents_failed = 0;
    size_t total_words = 0;

    // Terms and graph
    size_t total_terms = 0;
    size_t distinct_terms = 0;
    size_t vocabulary_size = 0;
    size_t cooccurring_pairs = 0;
    size_t weak_edges_pruned = 0;
    size_t edges_truncated = 0;
    size_t final_nodes = 0;
    size_t final_edges = 0;
    int layout_iterations = 0;

    // Timing
    double total_time_seconds = 0.0;
    double reading_time_seconds = 0.0;
    double analysis_time_seconds = 0.0;
    double layout_time_seconds = 0.0;

    void print_summary() const;

    nlohmann::ordered_json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

/**
 * @brief Paths written by write_outputs
 */
struct PipelineOutputs {
    std::string json_path;
    std::string svg_path;
};

// ============================================================================
// Concept Pipeline
// ============================================================================

/**
 * @brief End-to-end concept graph generation
 *
 * Markdown → text → terms → vocabulary → co-occurrence → graph → layout →
 * graph.json + graph.svg. Every stage finishes before the next begins.
 */
class ConceptPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit ConceptPipeline(const PipelineConfig& config);

    /**
     * @brief Read every document under root
     *
     * A document that cannot be read or decoded is reported on stderr and
     * contributes empty text instead of failing the run.
     */
    std::vector<TextDocument> read_documents(const std::string& root);

    /**
     * @brief Run the analytic stages over plain texts, layout included
     */
    ConceptGraph build_graph(const std::vector<std::string>& texts);

    /**
     * @brief read_documents followed by build_graph
     */
    ConceptGraph process_directory(const std::string& root);

    /**
     * @brief Write graph.json and graph.svg into output_dir
     * @throws std::runtime_error if the directory cannot be created or a write fails
     */
    PipelineOutputs write_outputs(const ConceptGraph& graph, const std::string& output_dir);

    /**
     * @brief Full run using config input_root and output_directory
     */
    PipelineOutputs run();

    void set_progress_callback(ProgressCallback callback);

    PipelineStatistics get_statistics() const { return stats_; }
    void reset_statistics();

    const PipelineConfig& get_config() const { return config_; }
    const Tokenizer& tokenizer() const { return tokenizer_; }

private:
    PipelineConfig config_;
    PipelineStatistics stats_;
    ProgressCallback progress_callback_;

    MarkdownReader reader_;
    Tokenizer tokenizer_;

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );
};

// ============================================================================
// Utility Functions
// ============================================================================

PipelineConfig create_default_config();

/**
 * @brief Create a directory and its parents
 * @throws std::runtime_error carrying the underlying cause
 */
void ensure_directory(const std::string& path);

} // namespace cg
