#pragma once

#include "../containment/containment_config.hpp"
#include "../hierarchy/hierarchy_builder.hpp"
#include "../hierarchy/reorganization.hpp"
#include "../tables/table.hpp"
#include "../tables/table_layout.hpp"
#include <string>
#include <vector>

namespace form_structure {

struct PipelineOptions {
    ContainmentConfig containment{ContainmentConfig::defaults()};
    HierarchyOptions hierarchy;
    TableLayoutConfig tables;
};

struct DocumentResult {
    // Tree as assembled, before table context is merged
    Node hierarchy;
    TableMap extracted_tables;
    TableMap processed_tables;
    // Tree with synthesized table context merged back
    Node document;
    std::vector<std::string> warnings;
    std::vector<std::string> skipped_ids;
};

// Hierarchy assembly followed by per-table context synthesis.
// Synthesis for a table only starts once its membership is known, and
// the merge only runs after every table is processed.
class DocumentPipeline {
public:
    DocumentPipeline();
    explicit DocumentPipeline(PipelineOptions options);

    [[nodiscard]] DocumentResult process(const std::vector<Detection>& detections) const;

    [[nodiscard]] DocumentResult process(
        const std::vector<Detection>& detections,
        const Reorganization& reorganization
    ) const;

    [[nodiscard]] const HierarchyBuilder& builder() const { return builder_; }
    [[nodiscard]] const TableLayoutEngine& layout_engine() const { return layout_engine_; }

private:
    HierarchyBuilder builder_;
    TableLayoutEngine layout_engine_;

    [[nodiscard]] DocumentResult finish(HierarchyResult built) const;
};

}  // namespace form_structure
