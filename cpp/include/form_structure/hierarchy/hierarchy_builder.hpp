#pragma once

#include "reorganization.hpp"
#include "../containment/containment.hpp"
#include "../core/node.hpp"
#include "../core/types.hpp"
#include <string>
#include <vector>

namespace form_structure {

struct HierarchyOptions {
    // Drop the OCR text of section/table nodes (imprecise header crops)
    bool blank_container_text{true};
    bool verbose{false};
};

struct HierarchyResult {
    Node root;
    std::vector<std::string> warnings;
    std::vector<std::string> skipped_ids;
};

// Outcome of one page in a batch; error is set instead of result when
// building the page threw (duplicate ids, a broken rule table).
struct PageResult {
    std::optional<HierarchyResult> result;
    std::string error;

    [[nodiscard]] bool ok() const { return result.has_value(); }
};

// Assembles the document -> section -> table/checkbox group -> field tree.
//
// Detections are placed largest-first; each one is attached under the
// smallest already placed detection that contains it, or under the root.
class HierarchyBuilder {
public:
    HierarchyBuilder() = default;
    explicit HierarchyBuilder(ContainmentClassifier classifier, HierarchyOptions options = {});

    // Throws DuplicateDetectionError when two detections share an id.
    // Zero-size detections are skipped with a warning.
    [[nodiscard]] HierarchyResult build(const std::vector<Detection>& detections) const;

    // Same as build(), with section edges and text taken from a reorganizer
    [[nodiscard]] HierarchyResult build(
        const std::vector<Detection>& detections,
        const Reorganization& reorganization
    ) const;

    // Independent pages; parallel when built with OpenMP
    [[nodiscard]] std::vector<PageResult> build_pages(
        const std::vector<std::vector<Detection>>& pages
    ) const;

    [[nodiscard]] const ContainmentClassifier& classifier() const { return classifier_; }
    [[nodiscard]] const HierarchyOptions& options() const { return options_; }

private:
    ContainmentClassifier classifier_;
    HierarchyOptions options_;

    [[nodiscard]] HierarchyResult build_impl(
        const std::vector<Detection>& detections,
        const Reorganization* reorganization
    ) const;

    void warn(HierarchyResult& result, const std::string& message) const;
};

}  // namespace form_structure
