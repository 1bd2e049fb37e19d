#include "form_structure/core/node.hpp"
#include <algorithm>
#include <ostream>

namespace form_structure {
namespace {

const std::string kEmptyId;

bool reading_order_less(const Node& a, const Node& b) {
    const Box& ba = a.detection->box;
    const Box& bb = b.detection->box;
    if (ba.y != bb.y) return ba.y < bb.y;
    return ba.x < bb.x;
}

}  // namespace

const std::string& Node::id() const {
    return detection ? detection->id : kEmptyId;
}

void sort_children(Node& node) {
    std::stable_sort(node.children.begin(), node.children.end(), reading_order_less);
    for (auto& child : node.children) {
        sort_children(child);
    }
}

size_t count_detections(const Node& node) {
    size_t count = node.is_root() ? 0 : 1;
    for (const auto& child : node.children) {
        count += count_detections(child);
    }
    return count;
}

const Node* find_node(const Node& node, const std::string& id) {
    if (!node.is_root() && node.detection->id == id) return &node;
    for (const auto& child : node.children) {
        if (const Node* found = find_node(child, id)) return found;
    }
    return nullptr;
}

Node* find_node(Node& node, const std::string& id) {
    return const_cast<Node*>(find_node(static_cast<const Node&>(node), id));
}

void visit_nodes(const Node& node, const std::function<void(const Node& child, const Node& parent)>& fn) {
    for (const auto& child : node.children) {
        fn(child, node);
        visit_nodes(child, fn);
    }
}

void print_hierarchy(const Node& node, std::ostream& out, int level) {
    std::string indent(static_cast<size_t>(level) * 2, ' ');
    out << indent << class_name(node.type);
    if (!node.is_root() && !node.detection->text.empty()) {
        out << ": " << node.detection->text;
    }
    out << "\n";
    for (const auto& child : node.children) {
        print_hierarchy(child, out, level + 1);
    }
}

}  // namespace form_structure
