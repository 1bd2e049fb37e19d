#pragma once

#include "../core/node.hpp"
#include "../core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace form_structure {

enum class TableType {
    SingleHeader,
    TwoAxis,
    NumberedRows
};

[[nodiscard]] std::string_view table_type_name(TableType type);
[[nodiscard]] std::optional<TableType> parse_table_type(std::string_view name);

// A table node with the flat list of field/checkbox_context/title
// detections found below it, in reading order.
struct Table {
    std::string id;
    std::string text;
    float confidence{0.0f};
    Box box;
    std::string parent_id;
    std::vector<Detection> fields;
    // Set once the layout engine has processed the table
    std::optional<TableType> layout;
};

// Keyed by table id
using TableMap = std::map<std::string, Table>;

// Every table node in the tree, at any depth
[[nodiscard]] TableMap extract_tables(const Node& root);

// Write processed field text back into the tree. A field is only updated
// inside the table node carrying the same id; unknown ids are ignored.
// Returns the number of nodes whose text changed.
size_t merge_processed_tables(Node& root, const TableMap& processed);

}  // namespace form_structure
