#include "cli/cli.hpp"
#include "graph/concept_graph.hpp"
#include "layout/force_layout.hpp"
#include "pipeline/concept_pipeline.hpp"
#include "render/svg_renderer.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using namespace cg;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Config file first, then explicit flags on top
PipelineConfig resolve_config(const Args& args) {
    PipelineConfig config = args.has("config")
        ? PipelineConfig::from_json_file(args.require("config"))
        : create_default_config();

    config.input_root = args.option_or_positional("input", 0, config.input_root);
    config.output_directory = args.option_or_positional("output", 1, config.output_directory);

    if (args.has("max-nodes")) config.max_nodes = args.get("max-nodes").as_size();
    if (args.has("window")) config.window = args.get("window").as_size();
    if (args.has("seed")) config.layout_seed = args.get("seed").as_size();
    if (args.get("quiet").as_flag()) config.verbose = false;

    return config;
}

// ============== conceptgraph generate ==============
int cmd_generate(const Args& args) {
    PipelineConfig config = resolve_config(args);

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: invalid configuration: " << error << "\n";
        return 1;
    }

    if (config.verbose) {
        std::cout << "Building concept graph from: " << config.input_root << "\n";
    }

    auto start = std::chrono::steady_clock::now();

    ConceptPipeline pipeline(config);
    if (config.verbose) {
        pipeline.set_progress_callback([](const std::string& stage, int current, int total,
                                          const std::string&) {
            std::cout << "  [" << stage << "] " << current << "/" << total << "\r" << std::flush;
        });
    }
    pipeline.run();

    if (config.verbose) {
        std::cout << "Done in " << format_duration(std::chrono::steady_clock::now() - start) << "\n";
    }
    return 0;
}

// ============== conceptgraph render ==============
int cmd_render(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.require("output");

    PipelineConfig config = args.has("config")
        ? PipelineConfig::from_json_file(args.require("config"))
        : create_default_config();
    if (args.has("seed")) config.layout_seed = args.get("seed").as_size();

    std::cout << "Loading graph from: " << input_path << "\n";
    ConceptGraph graph = ConceptGraph::load_from_json(input_path);
    std::cout << "Loaded " << graph.num_nodes() << " nodes and " << graph.num_edges() << " edges\n";

    if (args.get("relayout").as_flag()) {
        ForceLayout layout(config.layout_params());
        LayoutResult result = layout.run(graph);
        std::cout << "Recomputed layout in " << result.iterations << " iterations\n";
    }

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        ensure_directory(out_path.parent_path().string());
    }

    SvgRenderer renderer(config.canvas_width, config.canvas_height);
    renderer.export_svg(graph, output_path);

    std::cout << "Wrote " << output_path << "\n";
    return 0;
}

// ============== conceptgraph stats ==============
int cmd_stats(const Args& args) {
    std::string input_path = args.require("input");

    ConceptGraph graph = ConceptGraph::load_from_json(input_path);
    auto stats = graph.compute_statistics();

    if (args.get("json").as_flag()) {
        std::cout << stats.to_json().dump(2) << "\n";
        return 0;
    }

    std::cout << "Graph statistics for " << input_path << ":\n";
    stats.print(std::cout);

    if (!graph.edges.empty()) {
        std::cout << "\nStrongest pairs:\n";
        size_t shown = std::min<size_t>(graph.edges.size(), 10);
        for (size_t i = 0; i < shown; ++i) {
            const auto& edge = graph.edges[i];
            std::cout << "  " << graph.nodes[edge.source].label << " -- "
                      << graph.nodes[edge.target].label << " (" << edge.weight << ")\n";
        }
    }
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("conceptgraph", "1.0.0");

    // conceptgraph generate
    cli.register_command({
        "generate",
        "Build graph.json and graph.svg from a directory of Markdown documents",
        {
            {"input", "i", "Corpus root directory (same as the first positional argument)", "content/blog", false, false},
            {"output", "o", "Output directory (same as the second positional argument)", "static/graph", false, false},
            {"config", "c", "JSON configuration file", "", false, false},
            {"max-nodes", "n", "Number of terms kept in the vocabulary", "30", false, false},
            {"window", "w", "Co-occurrence window in vocabulary terms", "12", false, false},
            {"seed", "s", "Seed for initial layout positions", "37", false, false},
            {"quiet", "q", "Only report written files and errors", "", false, true}
        },
        cmd_generate,
        "[root] [outdir]",
        2
    });

    // conceptgraph render
    cli.register_command({
        "render",
        "Render an existing graph.json to SVG",
        {
            {"input", "i", "Graph JSON file", "", true, false},
            {"output", "o", "SVG output path", "", true, false},
            {"config", "c", "JSON configuration file (canvas and layout settings)", "", false, false},
            {"relayout", "r", "Recompute node positions before rendering", "", false, true},
            {"seed", "s", "Seed for initial layout positions when relaying out", "37", false, false}
        },
        cmd_render
    });

    // conceptgraph stats
    cli.register_command({
        "stats",
        "Print statistics about a graph.json",
        {
            {"input", "i", "Graph JSON file", "", true, false},
            {"json", "j", "Print statistics as JSON", "", false, true}
        },
        cmd_stats
    });

    return cli.run(argc, argv);
}
