#include "form_structure/hierarchy/hierarchy_builder.hpp"
#include "form_structure/core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#ifdef FORM_STRUCTURE_ENABLE_OPENMP
#include <omp.h>
#endif

namespace form_structure {
namespace {

constexpr int kRootParent = -1;

void check_unique_ids(const std::vector<Detection>& detections) {
    std::unordered_set<std::string> seen;
    seen.reserve(detections.size());
    for (const auto& det : detections) {
        if (!seen.insert(det.id).second) {
            throw DuplicateDetectionError(det.id);
        }
    }
}

Node assemble(
    const std::vector<Detection>& placed,
    const std::vector<std::vector<int>>& children_of,
    int idx
) {
    Node node(placed[static_cast<size_t>(idx)]);
    node.children.reserve(children_of[static_cast<size_t>(idx)].size());
    for (int child : children_of[static_cast<size_t>(idx)]) {
        node.children.push_back(assemble(placed, children_of, child));
    }
    return node;
}

}  // namespace

HierarchyBuilder::HierarchyBuilder(ContainmentClassifier classifier, HierarchyOptions options)
    : classifier_(std::move(classifier)), options_(options) {}

HierarchyResult HierarchyBuilder::build(const std::vector<Detection>& detections) const {
    return build_impl(detections, nullptr);
}

HierarchyResult HierarchyBuilder::build(
    const std::vector<Detection>& detections,
    const Reorganization& reorganization
) const {
    return build_impl(detections, &reorganization);
}

void HierarchyBuilder::warn(HierarchyResult& result, const std::string& message) const {
    if (options_.verbose) {
        std::cerr << "[HierarchyBuilder] " << message << "\n";
    }
    result.warnings.push_back(message);
}

HierarchyResult HierarchyBuilder::build_impl(
    const std::vector<Detection>& detections,
    const Reorganization* reorganization
) const {
    check_unique_ids(detections);

    HierarchyResult result;
    result.root = Node::make_root();

    // Drop detections that cannot take part in containment tests
    std::vector<Detection> placed;
    placed.reserve(detections.size());
    for (const auto& det : detections) {
        if (!det.box.is_valid()) {
            warn(result, "skipping detection " + det.id + ": non-positive width or height");
            result.skipped_ids.push_back(det.id);
            continue;
        }
        placed.push_back(det);
    }

    std::unordered_map<std::string, int> index_of;
    for (size_t i = 0; i < placed.size(); ++i) {
        index_of.emplace(placed[i].id, static_cast<int>(i));
    }

    // Reorganizer edges: element index -> section index
    std::unordered_map<int, int> forced_parent;
    std::unordered_set<int> section_keys;
    if (reorganization != nullptr) {
        for (const auto& [section_id, element_ids] : reorganization->structure) {
            auto it = index_of.find(section_id);
            if (it == index_of.end()) {
                warn(result, "reorganization references unknown section " + section_id);
                continue;
            }
            if (placed[static_cast<size_t>(it->second)].cls != DetectionClass::Section) {
                warn(result, "reorganization key " + section_id + " is not a section");
                continue;
            }
            section_keys.insert(it->second);
        }

        for (const auto& [section_id, element_ids] : reorganization->structure) {
            auto sit = index_of.find(section_id);
            if (sit == index_of.end() || section_keys.count(sit->second) == 0) continue;

            for (const auto& element_id : element_ids) {
                auto eit = index_of.find(element_id);
                if (eit == index_of.end()) {
                    warn(result, "reorganization references unknown element " + element_id);
                    continue;
                }
                if (section_keys.count(eit->second) != 0) {
                    warn(result, "section " + element_id + " cannot be nested under " + section_id);
                    continue;
                }
                if (!forced_parent.emplace(eit->second, sit->second).second) {
                    warn(result, "element " + element_id + " assigned to more than one section");
                }
            }
        }

        for (const auto& [id, text] : reorganization->cleaned_text) {
            if (index_of.count(id) == 0) {
                warn(result, "cleaned text for unknown detection " + id);
            }
        }
    }

    // Largest first; ties keep input order
    std::vector<int> order(placed.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return placed[static_cast<size_t>(a)].area() > placed[static_cast<size_t>(b)].area();
    });

    std::vector<int> parent(placed.size(), kRootParent);
    for (size_t k = 0; k < order.size(); ++k) {
        const int idx = order[k];
        const Detection& det = placed[static_cast<size_t>(idx)];

        if (section_keys.count(idx) != 0) {
            continue;
        }
        if (auto it = forced_parent.find(idx); it != forced_parent.end()) {
            parent[static_cast<size_t>(idx)] = it->second;
            continue;
        }

        // Smallest already placed container
        int best = kRootParent;
        float best_area = 0.0f;
        for (size_t j = 0; j < k; ++j) {
            const int cand = order[j];
            const Detection& container = placed[static_cast<size_t>(cand)];
            if (!classifier_.contains(det, container)) continue;
            if (best == kRootParent || container.area() < best_area) {
                best = cand;
                best_area = container.area();
            }
        }
        parent[static_cast<size_t>(idx)] = best;
    }

    for (auto& det : placed) {
        if (options_.blank_container_text &&
            (det.cls == DetectionClass::Section || det.cls == DetectionClass::Table)) {
            det.text.clear();
        }
        if (reorganization != nullptr) {
            if (auto it = reorganization->cleaned_text.find(det.id); it != reorganization->cleaned_text.end()) {
                det.text = it->second;
            }
        }
    }

    std::vector<std::vector<int>> children_of(placed.size());
    std::vector<int> top_level;
    for (int idx : order) {
        int p = parent[static_cast<size_t>(idx)];
        if (p == kRootParent) {
            top_level.push_back(idx);
        } else {
            children_of[static_cast<size_t>(p)].push_back(idx);
        }
    }

    result.root.children.reserve(top_level.size());
    for (int idx : top_level) {
        result.root.children.push_back(assemble(placed, children_of, idx));
    }
    sort_children(result.root);

    if (options_.verbose) {
        std::cout << "[HierarchyBuilder] placed=" << placed.size()
                  << " top_level=" << result.root.children.size()
                  << " skipped=" << result.skipped_ids.size() << "\n";
    }
    return result;
}

std::vector<PageResult> HierarchyBuilder::build_pages(
    const std::vector<std::vector<Detection>>& pages
) const {
    std::vector<PageResult> results(pages.size());
    const int n = static_cast<int>(pages.size());

#ifdef FORM_STRUCTURE_ENABLE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int i = 0; i < n; ++i) {
        // Exceptions must not leave the parallel region
        try {
            results[static_cast<size_t>(i)].result = build(pages[static_cast<size_t>(i)]);
        } catch (const std::exception& e) {
            results[static_cast<size_t>(i)].error = e.what();
        }
    }
    return results;
}

}  // namespace form_structure
