#include "form_structure/pipeline/document_pipeline.hpp"
#include <iostream>
#include <utility>

namespace form_structure {

DocumentPipeline::DocumentPipeline()
    : DocumentPipeline(PipelineOptions{}) {}

DocumentPipeline::DocumentPipeline(PipelineOptions options)
    : builder_(ContainmentClassifier(std::move(options.containment)), options.hierarchy),
      layout_engine_(std::move(options.tables)) {}

DocumentResult DocumentPipeline::process(const std::vector<Detection>& detections) const {
    return finish(builder_.build(detections));
}

DocumentResult DocumentPipeline::process(
    const std::vector<Detection>& detections,
    const Reorganization& reorganization
) const {
    return finish(builder_.build(detections, reorganization));
}

DocumentResult DocumentPipeline::finish(HierarchyResult built) const {
    DocumentResult result;
    result.warnings = std::move(built.warnings);
    result.skipped_ids = std::move(built.skipped_ids);
    result.hierarchy = std::move(built.root);

    result.extracted_tables = extract_tables(result.hierarchy);
    result.processed_tables = layout_engine_.process_tables(result.extracted_tables);

    result.document = result.hierarchy;
    size_t merged = merge_processed_tables(result.document, result.processed_tables);

    if (builder_.options().verbose) {
        std::cout << "[DocumentPipeline] tables=" << result.extracted_tables.size()
                  << " merged_fields=" << merged << "\n";
    }
    return result;
}

}  // namespace form_structure
