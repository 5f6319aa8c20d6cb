#include "pipeline/concept_pipeline.hpp"
#include "graph/cooccurrence.hpp"
#include "graph/vocabulary.hpp"
#include "render/svg_renderer.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const cg::PipelineConfig& validated(const cg::PipelineConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    return config;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

namespace cg {

// ============================================================================
// PipelineConfig
// ============================================================================

PipelineConfig PipelineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    return from_json(j);
}

PipelineConfig PipelineConfig::from_json(const json& j) {
    PipelineConfig config;

    try {
        // Input / output
        if (j.contains("input_root")) config.input_root = j["input_root"].get<std::string>();
        if (j.contains("output_directory")) config.output_directory = j["output_directory"].get<std::string>();
        if (j.contains("extensions")) config.extensions = j["extensions"].get<std::vector<std::string>>();
        if (j.contains("json_filename")) config.json_filename = j["json_filename"].get<std::string>();
        if (j.contains("svg_filename")) config.svg_filename = j["svg_filename"].get<std::string>();

        // Tokenization
        if (j.contains("min_token_length")) config.min_token_length = j["min_token_length"].get<size_t>();
        if (j.contains("stopwords")) config.stopwords = j["stopwords"].get<std::vector<std::string>>();
        if (j.contains("extra_stopwords")) config.extra_stopwords = j["extra_stopwords"].get<std::vector<std::string>>();

        // Graph
        if (j.contains("max_nodes")) config.max_nodes = j["max_nodes"].get<size_t>();
        if (j.contains("window")) config.window = j["window"].get<size_t>();
        if (j.contains("min_edge_weight")) config.min_edge_weight = j["min_edge_weight"].get<size_t>();
        if (j.contains("edge_multiplier")) config.edge_multiplier = j["edge_multiplier"].get<size_t>();

        // Layout
        if (j.contains("canvas_width")) config.canvas_width = j["canvas_width"].get<double>();
        if (j.contains("canvas_height")) config.canvas_height = j["canvas_height"].get<double>();
        if (j.contains("layout_iterations")) config.layout_iterations = j["layout_iterations"].get<int>();
        if (j.contains("initial_temperature_divisor")) {
            config.initial_temperature_divisor = j["initial_temperature_divisor"].get<double>();
        }
        if (j.contains("cooling_factor")) config.cooling_factor = j["cooling_factor"].get<double>();
        if (j.contains("min_temperature")) config.min_temperature = j["min_temperature"].get<double>();
        if (j.contains("layout_seed")) config.layout_seed = j["layout_seed"].get<uint64_t>();

        if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

nlohmann::ordered_json PipelineConfig::to_json() const {
    nlohmann::ordered_json j;

    j["input_root"] = input_root;
    j["output_directory"] = output_directory;
    j["extensions"] = extensions;
    j["json_filename"] = json_filename;
    j["svg_filename"] = svg_filename;

    j["min_token_length"] = min_token_length;
    j["stopwords"] = stopwords;
    j["extra_stopwords"] = extra_stopwords;

    j["max_nodes"] = max_nodes;
    j["window"] = window;
    j["min_edge_weight"] = min_edge_weight;
    j["edge_multiplier"] = edge_multiplier;

    j["canvas_width"] = canvas_width;
    j["canvas_height"] = canvas_height;
    j["layout_iterations"] = layout_iterations;
    j["initial_temperature_divisor"] = initial_temperature_divisor;
    j["cooling_factor"] = cooling_factor;
    j["min_temperature"] = min_temperature;
    j["layout_seed"] = layout_seed;

    j["verbose"] = verbose;
    return j;
}

void PipelineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
    file.close();

    if (file.fail()) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

bool PipelineConfig::validate(std::string& error_message) const {
    if (extensions.empty()) {
        error_message = "At least one document extension is required";
        return false;
    }

    if (json_filename.empty() || svg_filename.empty()) {
        error_message = "Output file names must not be empty";
        return false;
    }

    if (max_nodes == 0) {
        error_message = "max_nodes must be at least 1";
        return false;
    }

    if (edge_multiplier > 0 &&
        max_nodes > std::numeric_limits<size_t>::max() / edge_multiplier) {
        error_message = "max_nodes * edge_multiplier is too large";
        return false;
    }

    if (window == 0) {
        error_message = "window must be at least 1";
        return false;
    }

    if (canvas_width <= 0.0 || canvas_height <= 0.0) {
        error_message = "Canvas width and height must be positive";
        return false;
    }

    if (layout_iterations < 0) {
        error_message = "layout_iterations must not be negative";
        return false;
    }

    if (initial_temperature_divisor <= 0.0) {
        error_message = "initial_temperature_divisor must be positive";
        return false;
    }

    if (cooling_factor <= 0.0 || cooling_factor >= 1.0) {
        error_message = "cooling_factor must be between 0 and 1 (exclusive)";
        return false;
    }

    if (min_temperature <= 0.0) {
        error_message = "min_temperature must be positive";
        return false;
    }

    return true;
}

StopwordSet PipelineConfig::active_stopwords() const {
    StopwordSet words = stopwords.empty() ? default_stopwords() : StopwordSet{};
    for (const auto& word : stopwords) {
        words.insert(to_lower_ascii(word));
    }
    for (const auto& word : extra_stopwords) {
        words.insert(to_lower_ascii(word));
    }
    return words;
}

LayoutParams PipelineConfig::layout_params() const {
    LayoutParams params;
    params.width = canvas_width;
    params.height = canvas_height;
    params.max_iterations = layout_iterations;
    params.initial_temperature_divisor = initial_temperature_divisor;
    params.cooling_factor = cooling_factor;
    params.min_temperature = min_temperature;
    params.seed = layout_seed;
    return params;
}

GraphBuildOptions PipelineConfig::build_options() const {
    GraphBuildOptions options;
    options.min_edge_weight = min_edge_weight;
    options.max_edges = max_nodes * edge_multiplier;
    return options;
}

// ============================================================================
// PipelineStatistics
// ============================================================================

void PipelineStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Concept Graph Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Documents:\n";
    std::cout << "  Found: " << documents_found << "\n";
    std::cout << "  Processed: " << documents_processed << "\n";
    std::cout << "  Failed: " << documents_failed << "\n";
    std::cout << "  Words: " << total_words << "\n\n";

    std::cout << "Terms:\n";
    std::cout << "  Total terms: " << total_terms << "\n";
    std::cout << "  Distinct terms: " << distinct_terms << "\n";
    std::cout << "  Vocabulary: " << vocabulary_size << "\n\n";

    std::cout << "Edges:\n";
    std::cout << "  Co-occurring pairs: " << cooccurring_pairs << "\n";
    std::cout << "  Pruned as weak: " << weak_edges_pruned << "\n";
    std::cout << "  Dropped by cap: " << edges_truncated << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Reading: " << reading_time_seconds << " seconds\n";
    std::cout << "  Analysis: " << analysis_time_seconds << " seconds\n";
    std::cout << "  Layout: " << layout_time_seconds << " seconds ("
              << layout_iterations << " iterations)\n\n";

    std::cout << "Final Graph:\n";
    std::cout << "  Nodes: " << final_nodes << "\n";
    std::cout << "  Edges: " << final_edges << "\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

nlohmann::ordered_json PipelineStatistics::to_json() const {
    nlohmann::ordered_json j;

    j["documents"] = {
        {"found", documents_found},
        {"processed", documents_processed},
        {"failed", documents_failed},
        {"words", total_words}
    };

    j["terms"] = {
        {"total", total_terms},
        {"distinct", distinct_terms},
        {"vocabulary", vocabulary_size}
    };

    j["edges"] = {
        {"cooccurring_pairs", cooccurring_pairs},
        {"weak_pruned", weak_edges_pruned},
        {"truncated", edges_truncated}
    };

    j["timing"] = {
        {"total_seconds", total_time_seconds},
        {"reading_seconds", reading_time_seconds},
        {"analysis_seconds", analysis_time_seconds},
        {"layout_seconds", layout_time_seconds},
        {"layout_iterations", layout_iterations}
    };

    j["graph"] = {
        {"nodes", final_nodes},
        {"edges", final_edges}
    };

    return j;
}

// ============================================================================
// ConceptPipeline
// ============================================================================

ConceptPipeline::ConceptPipeline(const PipelineConfig& config)
    : config_(validated(config)),
      tokenizer_(config_.active_stopwords(), config_.min_token_length) {
    reader_.set_verbose(false);
}

void ConceptPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void ConceptPipeline::reset_statistics() {
    stats_ = PipelineStatistics{};
}

void ConceptPipeline::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
}

std::vector<TextDocument> ConceptPipeline::read_documents(const std::string& root) {
    auto start = std::chrono::steady_clock::now();

    auto files = find_documents(root, config_.extensions);
    stats_.documents_found += static_cast<int>(files.size());

    if (config_.verbose) {
        std::cout << "Found " << files.size() << " documents in " << root << "\n";
    }

    std::vector<TextDocument> documents;
    documents.reserve(files.size());

    for (size_t i = 0; i < files.size(); ++i) {
        report_progress("Reading", static_cast<int>(i + 1), static_cast<int>(files.size()), files[i]);

        try {
            documents.push_back(reader_.load_document(files[i], root));
            stats_.documents_processed++;
            stats_.total_words += documents.back().word_count;
        } catch (const std::exception& e) {
            stats_.documents_failed++;
            std::cerr << "Warning: " << e.what() << " (treated as empty)\n";

            TextDocument empty;
            empty.file_path = files[i];
            empty.document_id = files[i];
            documents.push_back(std::move(empty));
        }
    }

    stats_.reading_time_seconds += seconds_since(start);
    return documents;
}

ConceptGraph ConceptPipeline::build_graph(const std::vector<std::string>& texts) {
    auto analysis_start = std::chrono::steady_clock::now();

    report_progress("Tokenizing", 0, static_cast<int>(texts.size()));
    std::vector<std::vector<std::string>> term_streams;
    term_streams.reserve(texts.size());
    for (const auto& text : texts) {
        term_streams.push_back(tokenizer_.tokenize(text));
        stats_.total_terms += term_streams.back().size();
    }

    report_progress("Selecting vocabulary", 0, 1);
    Vocabulary vocabulary = Vocabulary::select(term_streams, config_.max_nodes);
    stats_.distinct_terms = vocabulary.candidate_count();
    stats_.vocabulary_size = vocabulary.size();

    report_progress("Counting co-occurrences", 0, static_cast<int>(term_streams.size()));
    CooccurrenceAccumulator accumulator(vocabulary, config_.window);
    for (const auto& terms : term_streams) {
        accumulator.add_document(terms);
    }
    CooccurrenceTable table = accumulator.release();

    report_progress("Building graph", 0, 1);
    GraphBuilder builder(config_.build_options());
    ConceptGraph graph = builder.build(vocabulary, table);

    const auto& build_stats = builder.statistics();
    stats_.cooccurring_pairs = build_stats.candidate_edges;
    stats_.weak_edges_pruned = build_stats.weak_edges_pruned;
    stats_.edges_truncated = build_stats.edges_truncated;
    stats_.analysis_time_seconds += seconds_since(analysis_start);

    if (config_.verbose) {
        std::cout << "Vocabulary: " << vocabulary.size() << " of "
                  << vocabulary.candidate_count() << " distinct terms; "
                  << graph.num_edges() << " edges kept\n";
    }

    report_progress("Layout", 0, 1);
    auto layout_start = std::chrono::steady_clock::now();
    ForceLayout layout(config_.layout_params());
    LayoutResult layout_result = layout.run(graph);
    stats_.layout_iterations = layout_result.iterations;
    stats_.layout_time_seconds += seconds_since(layout_start);

    stats_.final_nodes = graph.num_nodes();
    stats_.final_edges = graph.num_edges();
    return graph;
}

ConceptGraph ConceptPipeline::process_directory(const std::string& root) {
    auto documents = read_documents(root);

    std::vector<std::string> texts;
    texts.reserve(documents.size());
    for (auto& doc : documents) {
        texts.push_back(std::move(doc.text));
    }

    return build_graph(texts);
}

PipelineOutputs ConceptPipeline::write_outputs(const ConceptGraph& graph,
                                               const std::string& output_dir) {
    ensure_directory(output_dir);

    PipelineOutputs outputs;
    outputs.json_path = (fs::path(output_dir) / config_.json_filename).string();
    outputs.svg_path = (fs::path(output_dir) / config_.svg_filename).string();

    graph.export_to_json(outputs.json_path);

    SvgRenderer renderer(config_.canvas_width, config_.canvas_height);
    renderer.export_svg(graph, outputs.svg_path);

    std::cout << "Wrote " << outputs.svg_path << "\n";
    std::cout << "Wrote " << outputs.json_path << "\n";

    return outputs;
}

PipelineOutputs ConceptPipeline::run() {
    auto start = std::chrono::steady_clock::now();

    ConceptGraph graph = process_directory(config_.input_root);
    PipelineOutputs outputs = write_outputs(graph, config_.output_directory);

    stats_.total_time_seconds += seconds_since(start);
    if (config_.verbose) {
        stats_.print_summary();
    }
    return outputs;
}

// ============================================================================
// Utility Functions
// ============================================================================

PipelineConfig create_default_config() {
    return PipelineConfig{};
}

void ensure_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + path + ": " + ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        throw std::runtime_error("Output path is not a directory: " + path);
    }
}

} // namespace cg
