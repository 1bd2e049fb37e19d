#pragma once

#include "types.hpp"
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace form_structure {

// Tree element. The root has type Document and no detection payload;
// every other node owns exactly one detection. Children are kept in
// reading order (top-to-bottom, then left-to-right).
struct Node {
    DetectionClass type{DetectionClass::Document};
    std::optional<Detection> detection;
    std::vector<Node> children;

    Node() = default;
    explicit Node(Detection det)
        : type(det.cls), detection(std::move(det)) {}

    static Node make_root() { return Node{}; }

    [[nodiscard]] bool is_root() const { return !detection.has_value(); }
    [[nodiscard]] bool has_children() const { return !children.empty(); }

    // Empty for the root
    [[nodiscard]] const std::string& id() const;
    [[nodiscard]] float area() const { return detection ? detection->area() : 0.0f; }
};

// Stable sort of every children list by (center y, center x)
void sort_children(Node& node);

// Number of non-root nodes in the subtree
[[nodiscard]] size_t count_detections(const Node& node);

// Depth-first search by detection id
[[nodiscard]] const Node* find_node(const Node& node, const std::string& id);
[[nodiscard]] Node* find_node(Node& node, const std::string& id);

// Depth-first pre-order visit of all non-root nodes with their parent
void visit_nodes(const Node& node, const std::function<void(const Node& child, const Node& parent)>& fn);

// Indented "type: text" dump
void print_hierarchy(const Node& node, std::ostream& out, int level = 0);

}  // namespace form_structure
