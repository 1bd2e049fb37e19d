#include "form_structure/tables/table.hpp"

#include <unordered_map>

namespace form_structure {
namespace {

bool is_table_member(DetectionClass cls) {
    return cls == DetectionClass::Field ||
           cls == DetectionClass::CheckboxContext ||
           cls == DetectionClass::Title;
}

// Neither walk descends into nested tables; they own their cells
void collect_fields(const Node& node, std::vector<Detection>& out) {
    for (const auto& child : node.children) {
        if (child.type == DetectionClass::Table) continue;
        if (is_table_member(child.type)) {
            out.push_back(*child.detection);
        }
        collect_fields(child, out);
    }
}

void collect_tables(const Node& node, TableMap& tables) {
    for (const auto& child : node.children) {
        if (child.type == DetectionClass::Table) {
            const Detection& det = *child.detection;
            Table table;
            table.id = det.id;
            table.text = det.text;
            table.confidence = det.confidence;
            table.box = det.box;
            table.parent_id = node.id();
            collect_fields(child, table.fields);
            tables.emplace(table.id, std::move(table));
        }
        collect_tables(child, tables);
    }
}

size_t merge_fields(Node& node, const std::unordered_map<std::string, const std::string*>& text_by_id) {
    size_t changed = 0;
    for (auto& child : node.children) {
        if (child.type == DetectionClass::Table) continue;
        auto it = text_by_id.find(child.id());
        if (it != text_by_id.end() && child.detection->text != *it->second) {
            child.detection->text = *it->second;
            ++changed;
        }
        changed += merge_fields(child, text_by_id);
    }
    return changed;
}

size_t merge_tables(Node& node, const TableMap& processed) {
    size_t changed = 0;
    for (auto& child : node.children) {
        if (child.type == DetectionClass::Table) {
            auto it = processed.find(child.id());
            if (it != processed.end()) {
                std::unordered_map<std::string, const std::string*> text_by_id;
                for (const auto& field : it->second.fields) {
                    text_by_id.emplace(field.id, &field.text);
                }
                changed += merge_fields(child, text_by_id);
            }
        }
        changed += merge_tables(child, processed);
    }
    return changed;
}

}  // namespace

std::string_view table_type_name(TableType type) {
    switch (type) {
        case TableType::SingleHeader: return "single_header";
        case TableType::TwoAxis: return "two_axis";
        case TableType::NumberedRows: return "numbered_rows";
    }
    return "single_header";
}

std::optional<TableType> parse_table_type(std::string_view name) {
    if (name == "single_header") return TableType::SingleHeader;
    if (name == "two_axis") return TableType::TwoAxis;
    if (name == "numbered_rows") return TableType::NumberedRows;
    return std::nullopt;
}

TableMap extract_tables(const Node& root) {
    TableMap tables;
    collect_tables(root, tables);
    return tables;
}

size_t merge_processed_tables(Node& root, const TableMap& processed) {
    return merge_tables(root, processed);
}

}  // namespace form_structure
