#include "pipeline/concept_pipeline.hpp"
#include "render/svg_renderer.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace cg;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    print_separator("Concept Graph from In-Memory Texts");

    std::vector<std::string> texts = {
        "Rust ownership makes memory safety a compile time property. "
        "Ownership and borrowing rules prevent data races in concurrent code.",
        "Concurrent code needs careful memory ordering. Data races appear "
        "when memory ordering is ignored in lock free structures.",
        "Lock free structures trade simplicity for throughput. Memory safety "
        "still matters in lock free code and in concurrent queues."
    };

    PipelineConfig config = create_default_config();
    config.max_nodes = 12;
    config.verbose = false;

    ConceptPipeline pipeline(config);
    pipeline.set_progress_callback(progress_handler);

    ConceptGraph graph = pipeline.build_graph(texts);

    print_separator("Nodes");
    for (const auto& node : graph.nodes) {
        std::cout << "  [" << node.id << "] " << node.label
                  << " (count " << node.count << ") at "
                  << node.x << ", " << node.y << "\n";
    }

    print_separator("Edges");
    for (const auto& edge : graph.edges) {
        std::cout << "  " << graph.nodes[edge.source].label << " -- "
                  << graph.nodes[edge.target].label << " : " << edge.weight << "\n";
    }

    if (argc > 1) {
        const std::string output_dir = argv[1];
        try {
            pipeline.write_outputs(graph, output_dir);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    } else {
        std::cout << "\nPass an output directory to write graph.json and graph.svg.\n";
    }

    return 0;
}
