#include "form_structure/io/json_io.hpp"
#include "form_structure/core/errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace form_structure {
namespace {

using json = nlohmann::json;

// Accepts numbers and numeric strings ("12.5")
std::optional<float> read_number(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_number()) return it->get<float>();
    if (it->is_string()) {
        const std::string& s = it->get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        float value = std::strtof(s.c_str(), &end);
        if (end != s.c_str() + s.size()) return std::nullopt;
        return value;
    }
    return std::nullopt;
}

std::string read_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    return {};
}

// OCR text may come back as a plain string or {"cleaned": "..."}
std::string read_text(const json& obj) {
    auto it = obj.find("text");
    if (it == obj.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_object()) return read_string(*it, "cleaned");
    return it->dump();
}

json node_to_json(const Node& node) {
    json out;
    if (node.is_root()) {
        out["type"] = std::string(class_name(DetectionClass::Document));
    } else {
        const Detection& det = *node.detection;
        out["id"] = det.id;
        out["type"] = std::string(class_name(det.cls));
        bool container = det.cls == DetectionClass::Section || det.cls == DetectionClass::Table;
        if (!container || !det.text.empty()) {
            out["text"] = det.text;
        }
        out["box"] = format_box(det.box);
        out["confidence"] = det.confidence;
    }
    if (node.has_children()) {
        json children = json::array();
        for (const auto& child : node.children) {
            children.push_back(node_to_json(child));
        }
        out["children"] = std::move(children);
    }
    return out;
}

Detection detection_from_node_json(const json& obj) {
    if (!obj.is_object()) {
        throw ParseError("hierarchy node is not an object");
    }
    std::string id = read_string(obj, "id");
    if (id.empty()) {
        throw ParseError("hierarchy node without id");
    }
    auto cls = parse_class(read_string(obj, "type"));
    if (!cls) {
        throw ParseError("hierarchy node " + id + " has unknown type");
    }
    auto box = parse_box(read_string(obj, "box"));
    if (!box) {
        throw ParseError("hierarchy node " + id + " has malformed box");
    }
    Detection det(id, *cls, *box, read_number(obj, "confidence").value_or(0.0f), read_text(obj));
    return det;
}

void children_from_json(const json& obj, Node& node) {
    auto it = obj.find("children");
    if (it == obj.end()) return;
    if (!it->is_array()) {
        throw ParseError("children is not an array");
    }
    node.children.reserve(it->size());
    for (const auto& child : *it) {
        Node child_node(detection_from_node_json(child));
        children_from_json(child, child_node);
        node.children.push_back(std::move(child_node));
    }
}

json table_field_to_json(const Detection& det) {
    return json{
        {"id", det.id},
        {"type", std::string(class_name(det.cls))},
        {"text", det.text},
        {"box", format_box(det.box)},
        {"confidence", det.confidence},
    };
}

void read_rule_overrides(const json& data, ContainmentRule& rule) {
    if (auto v = read_number(data, "overlap_threshold")) rule.overlap_threshold = *v;
    if (auto v = read_number(data, "proximity_px")) rule.proximity_px = *v;
    if (auto v = read_number(data, "secondary_threshold")) rule.secondary_threshold = *v;
}

}  // namespace

ParseResult parse_detections(const json& records) {
    ParseResult result;
    if (!records.is_array()) {
        throw ParseError("detections must be a JSON array");
    }

    std::unordered_set<std::string> seen_ids;
    size_t index = 0;
    for (const auto& record : records) {
        const std::string where = "record " + std::to_string(index++);
        if (!record.is_object()) {
            result.warnings.push_back(where + ": not an object, skipped");
            continue;
        }

        std::string id = read_string(record, "detection_id");
        if (id.empty()) {
            result.warnings.push_back(where + ": missing detection_id, skipped");
            continue;
        }
        // Duplicates count even when one of the copies is skipped below
        if (!seen_ids.insert(id).second) {
            throw DuplicateDetectionError(id);
        }

        std::string class_label = read_string(record, "class");
        auto cls = parse_class(class_label);
        if (!cls) {
            result.warnings.push_back("detection " + id + ": unknown class '" + class_label + "', skipped");
            continue;
        }

        auto x = read_number(record, "x");
        auto y = read_number(record, "y");
        auto w = read_number(record, "width");
        auto h = read_number(record, "height");
        if (!x || !y || !w || !h) {
            result.warnings.push_back("detection " + id + ": missing geometry, skipped");
            continue;
        }

        Box box(*x, *y, *w, *h);
        if (!box.is_valid()) {
            result.warnings.push_back("detection " + id + ": non-positive width or height, skipped");
            continue;
        }

        Detection det(id, *cls, box, read_number(record, "confidence").value_or(0.0f), read_text(record));
        std::string parent = read_string(record, "parent_id");
        if (!parent.empty()) det.parent_id = parent;
        det.filename = read_string(record, "filename");
        result.detections.push_back(std::move(det));
    }
    return result;
}

json detection_to_json(const Detection& det) {
    json out{
        {"detection_id", det.id},
        {"class", std::string(class_name(det.cls))},
        {"x", det.box.x},
        {"y", det.box.y},
        {"width", det.box.width},
        {"height", det.box.height},
        {"confidence", det.confidence},
        {"text", det.text},
    };
    if (det.parent_id) out["parent_id"] = *det.parent_id;
    if (!det.filename.empty()) out["filename"] = det.filename;
    return out;
}

std::string format_box(const Box& box) {
    // Enough digits for parse_box to restore the exact floats
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<float>::max_digits10);
    oss << box.x << " " << box.y << " " << box.width << " " << box.height;
    return oss.str();
}

std::optional<Box> parse_box(std::string_view text) {
    std::istringstream iss{std::string(text)};
    Box box;
    if (!(iss >> box.x >> box.y >> box.width >> box.height)) {
        return std::nullopt;
    }
    return box;
}

json hierarchy_to_json(const Node& root) {
    return node_to_json(root);
}

Node hierarchy_from_json(const json& root) {
    if (!root.is_object()) {
        throw MissingRootError("hierarchy is not a JSON object");
    }
    if (read_string(root, "type") != class_name(DetectionClass::Document)) {
        throw MissingRootError("top-level node has type '" + read_string(root, "type") + "'");
    }
    Node node = Node::make_root();
    children_from_json(root, node);
    return node;
}

json tables_to_json(const TableMap& tables) {
    json out = json::object();
    for (const auto& [id, table] : tables) {
        json fields = json::array();
        for (const auto& field : table.fields) {
            fields.push_back(table_field_to_json(field));
        }
        json entry{
            {"text", table.text},
            {"confidence", table.confidence},
            {"detection_id", table.id},
            {"box", format_box(table.box)},
            {"fields", std::move(fields)},
            {"parent_id", table.parent_id},
        };
        if (table.layout) {
            entry["table_type"] = std::string(table_type_name(*table.layout));
        }
        out[id] = std::move(entry);
    }
    return out;
}

TableMap tables_from_json(const json& tables) {
    if (!tables.is_object()) {
        throw ParseError("tables must be a JSON object");
    }
    TableMap out;
    for (const auto& [id, entry] : tables.items()) {
        if (!entry.is_object()) {
            throw ParseError("table " + id + " is not an object");
        }
        Table table;
        table.id = id;
        table.text = read_text(entry);
        table.confidence = read_number(entry, "confidence").value_or(0.0f);
        table.box = parse_box(read_string(entry, "box")).value_or(Box{});
        table.parent_id = read_string(entry, "parent_id");
        if (auto type = parse_table_type(read_string(entry, "table_type"))) {
            table.layout = type;
        }
        if (auto it = entry.find("fields"); it != entry.end() && it->is_array()) {
            for (const auto& field : *it) {
                table.fields.push_back(detection_from_node_json(field));
            }
        }
        out.emplace(id, std::move(table));
    }
    return out;
}

Reorganization reorganization_from_json(const json& data) {
    if (!data.is_object()) {
        throw ParseError("reorganization must be a JSON object");
    }
    Reorganization reorg;
    if (auto it = data.find("structure"); it != data.end() && it->is_object()) {
        for (const auto& [section_id, ids] : it->items()) {
            auto& members = reorg.structure[section_id];
            if (!ids.is_array()) continue;
            for (const auto& id : ids) {
                if (id.is_string()) members.push_back(id.get<std::string>());
            }
        }
    }
    if (auto it = data.find("cleaned_text"); it != data.end() && it->is_object()) {
        for (const auto& [id, text] : it->items()) {
            if (text.is_string()) reorg.cleaned_text[id] = text.get<std::string>();
        }
    }
    return reorg;
}

ContainmentConfig containment_config_from_json(const json& data, ContainmentConfig base) {
    if (!data.is_object()) return base;

    std::string table_fields = read_string(data, "table_field_strategy");
    std::string checkboxes = read_string(data, "checkbox_option_strategy");
    if (!table_fields.empty() || !checkboxes.empty()) {
        base = ContainmentConfig::defaults(
            table_fields == "center_point" ? TableFieldStrategy::CenterPoint : TableFieldStrategy::OverlapRatio,
            checkboxes == "glyph_alignment" ? CheckboxOptionStrategy::GlyphAlignment : CheckboxOptionStrategy::OverlapProximity
        );
    }

    if (auto v = read_number(data, "default_threshold")) base.default_threshold = *v;

    if (auto it = data.find("rules"); it != data.end() && it->is_object()) {
        for (const auto& [name, overrides] : it->items()) {
            ContainmentRule* rule = base.find_rule(name);
            if (rule == nullptr) {
                throw ParseError("unknown containment rule: " + name);
            }
            read_rule_overrides(overrides, *rule);
        }
    }
    return base;
}

TableLayoutConfig table_layout_config_from_json(const json& data, TableLayoutConfig base) {
    if (!data.is_object()) return base;
    if (auto v = read_number(data, "row_tolerance_px")) base.row_tolerance_px = *v;
    if (auto v = read_number(data, "left_margin_px")) base.left_margin_px = *v;
    if (auto it = data.find("fallback_label"); it != data.end() && it->is_string()) {
        base.fallback_label = it->get<std::string>();
    }
    return base;
}

PipelineOptions pipeline_options_from_json(const json& data) {
    PipelineOptions options;
    if (!data.is_object()) return options;
    if (auto it = data.find("containment"); it != data.end()) {
        options.containment = containment_config_from_json(*it);
    }
    if (auto it = data.find("tables"); it != data.end()) {
        options.tables = table_layout_config_from_json(*it);
    }
    if (auto it = data.find("hierarchy"); it != data.end() && it->is_object()) {
        if (auto b = it->find("blank_container_text"); b != it->end() && b->is_boolean()) {
            options.hierarchy.blank_container_text = b->get<bool>();
        }
    }
    return options;
}

json load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ParseError("Failed to open: " + path);
    }
    json data = json::parse(file, nullptr, false);
    if (data.is_discarded()) {
        throw ParseError("Invalid JSON in: " + path);
    }
    return data;
}

void save_json_file(const std::string& path, const json& data) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ParseError("Failed to write: " + path);
    }
    file << data.dump(2) << "\n";
}

}  // namespace form_structure
