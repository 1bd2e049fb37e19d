#pragma once

#include "../containment/containment_config.hpp"
#include "../core/node.hpp"
#include "../core/types.hpp"
#include "../hierarchy/reorganization.hpp"
#include "../pipeline/document_pipeline.hpp"
#include "../tables/table.hpp"
#include "../tables/table_layout.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace form_structure {

struct ParseResult {
    std::vector<Detection> detections;
    std::vector<std::string> warnings;
};

// Reads an array of detection records. Records with missing or
// non-numeric geometry, non-positive size or an unknown class are
// skipped with a warning. Throws DuplicateDetectionError when two
// records share a detection_id, skipped or not.
[[nodiscard]] ParseResult parse_detections(const nlohmann::json& records);

[[nodiscard]] nlohmann::json detection_to_json(const Detection& det);

// "x y width height"
[[nodiscard]] std::string format_box(const Box& box);
[[nodiscard]] std::optional<Box> parse_box(std::string_view text);

// {"type": "document", "children": [...]}; leaves carry no "children"
// key and blanked section/table nodes carry no "text" key.
[[nodiscard]] nlohmann::json hierarchy_to_json(const Node& root);

// Inverse of hierarchy_to_json. Throws MissingRootError when the object
// is not a document root and ParseError for malformed nodes.
[[nodiscard]] Node hierarchy_from_json(const nlohmann::json& root);

// {table_id: {text, confidence, detection_id, box, fields, parent_id}}
[[nodiscard]] nlohmann::json tables_to_json(const TableMap& tables);
[[nodiscard]] TableMap tables_from_json(const nlohmann::json& tables);

// {"structure": {section: [ids]}, "cleaned_text": {id: text}}
[[nodiscard]] Reorganization reorganization_from_json(const nlohmann::json& data);

// Overrides on top of `base`; absent keys keep their value
[[nodiscard]] ContainmentConfig containment_config_from_json(
    const nlohmann::json& data,
    ContainmentConfig base = ContainmentConfig::defaults()
);
[[nodiscard]] TableLayoutConfig table_layout_config_from_json(
    const nlohmann::json& data,
    TableLayoutConfig base = {}
);

// {"containment": {...}, "tables": {...}, "hierarchy": {...}}
[[nodiscard]] PipelineOptions pipeline_options_from_json(const nlohmann::json& data);

// Throws ParseError when the file cannot be read or parsed
[[nodiscard]] nlohmann::json load_json_file(const std::string& path);

// Throws ParseError when the file cannot be written
void save_json_file(const std::string& path, const nlohmann::json& data);

}  // namespace form_structure
