#include <filesystem>
#include <iostream>
#include <string>
#include "form_structure/form_structure.hpp"
#include "form_structure/io/json_io.hpp"

using namespace form_structure;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " <detections.json> <output_dir> [reorganization.json] [config.json]\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string input_path = argv[1];
    const std::filesystem::path output_dir = argv[2];
    const std::string reorg_path = (argc > 3) ? argv[3] : "";
    const std::string config_path = (argc > 4) ? argv[4] : "";

    try {
        PipelineOptions options;
        if (!config_path.empty()) {
            options = pipeline_options_from_json(load_json_file(config_path));
        }
        options.hierarchy.verbose = true;
        options.tables.verbose = true;

        std::cout << "Loading detections from " << input_path << "\n";
        ParseResult parsed = parse_detections(load_json_file(input_path));
        for (const auto& warning : parsed.warnings) {
            std::cerr << "[Input] " << warning << "\n";
        }
        std::cout << "  Detections: " << parsed.detections.size() << "\n";

        DocumentPipeline pipeline(std::move(options));
        DocumentResult result = reorg_path.empty()
            ? pipeline.process(parsed.detections)
            : pipeline.process(parsed.detections, reorganization_from_json(load_json_file(reorg_path)));

        std::cout << "\nDocument hierarchy:\n";
        print_hierarchy(result.hierarchy, std::cout);

        std::filesystem::create_directories(output_dir);
        save_json_file((output_dir / "document_structure.json").string(), hierarchy_to_json(result.hierarchy));
        save_json_file((output_dir / "extracted_tables.json").string(), tables_to_json(result.extracted_tables));
        save_json_file((output_dir / "processed_tables.json").string(), tables_to_json(result.processed_tables));
        save_json_file((output_dir / "final_structured_document.json").string(), hierarchy_to_json(result.document));

        std::cout << "\nResults:\n";
        std::cout << "  Tables: " << result.extracted_tables.size() << "\n";
        std::cout << "  Warnings: " << (parsed.warnings.size() + result.warnings.size()) << "\n";
        std::cout << "  Output: " << output_dir.string() << "\n";
    } catch (const ValidationError& e) {
        std::cerr << "Validation error: " << e.what() << "\n";
        return 1;
    } catch (const ParseError& e) {
        std::cerr << "Input error: " << e.what() << "\n";
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Output error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
