#include "form_structure/tables/table_layout.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <regex>
#include <set>
#include <utility>

namespace form_structure {
namespace {

// "12" or "12."
const std::regex kRowNumberPattern(R"(^\s*(\d+)\.?\s*$)");

bool is_row_member(DetectionClass cls) {
    return cls == DetectionClass::Field || cls == DetectionClass::CheckboxContext;
}

bool has_text(const Detection& det) {
    return !is_blank(det.text);
}

std::string row_number(const std::string& label) {
    std::smatch match;
    if (std::regex_match(label, match, kRowNumberPattern)) {
        return match[1].str();
    }
    return trim(label);
}

}  // namespace

TableLayoutEngine::TableLayoutEngine(TableLayoutConfig config)
    : config_(std::move(config)) {}

std::vector<TableRow> TableLayoutEngine::cluster_rows(const std::vector<Detection>& fields) const {
    std::vector<size_t> order;
    order.reserve(fields.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        if (is_row_member(fields[i].cls)) order.push_back(i);
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return fields[a].box.y < fields[b].box.y;
    });

    // A row is anchored at the y of its first member
    std::vector<TableRow> rows;
    for (size_t idx : order) {
        float y = fields[idx].box.y;
        if (rows.empty() || std::abs(y - rows.back().y) >= config_.row_tolerance_px) {
            rows.push_back(TableRow{y, {}});
        }
        rows.back().cells.push_back(idx);
    }

    for (auto& row : rows) {
        std::stable_sort(row.cells.begin(), row.cells.end(), [&](size_t a, size_t b) {
            return fields[a].box.x < fields[b].box.x;
        });
    }
    return rows;
}

TableLayout TableLayoutEngine::analyze(const std::vector<Detection>& fields) const {
    TableLayout layout;
    layout.rows = cluster_rows(fields);
    layout.row_headers.assign(layout.rows.size(), std::nullopt);

    for (size_t r = 0; r < layout.rows.size(); ++r) {
        const auto& cells = layout.rows[r].cells;
        bool non_empty = std::any_of(cells.begin(), cells.end(), [&](size_t i) {
            return has_text(fields[i]);
        });
        if (non_empty) {
            layout.header_row = r;
            break;
        }
    }
    if (!layout.header_row) {
        return layout;
    }

    for (size_t i : layout.rows[*layout.header_row].cells) {
        if (has_text(fields[i])) {
            layout.columns.push_back(ColumnHeader{fields[i].box.x, trim(fields[i].text)});
        }
    }

    for (size_t r = 0; r < layout.rows.size(); ++r) {
        if (r == *layout.header_row) continue;
        for (size_t i : layout.rows[r].cells) {
            // cells are sorted by x, first hit is the leftmost
            if (has_text(fields[i]) && fields[i].box.x < config_.left_margin_px) {
                layout.row_headers[r] = trim(fields[i].text);
                break;
            }
        }
    }
    return layout;
}

TableType TableLayoutEngine::infer_table_type(const std::vector<Detection>& fields) const {
    TableLayout layout = analyze(fields);
    if (!layout.has_header()) {
        return TableType::SingleHeader;
    }

    std::set<std::string> labels;
    size_t labelled = 0;
    size_t numbered = 0;
    for (const auto& header : layout.row_headers) {
        if (!header) continue;
        labels.insert(*header);
        ++labelled;
        if (std::regex_match(*header, kRowNumberPattern)) ++numbered;
    }

    // A single distinct label is one value in the first column, not a row axis
    if (labels.size() < 2) return TableType::SingleHeader;
    if (numbered == labelled) return TableType::NumberedRows;
    return TableType::TwoAxis;
}

std::optional<std::string> TableLayoutEngine::inherited_row_header(const TableLayout& layout, size_t row) const {
    if (layout.row_headers[row]) return layout.row_headers[row];

    std::optional<std::string> best;
    float best_dist = std::numeric_limits<float>::infinity();
    for (size_t r = 0; r < layout.rows.size(); ++r) {
        if (!layout.row_headers[r]) continue;
        float dist = std::abs(layout.rows[r].y - layout.rows[row].y);
        if (dist < best_dist) {
            best_dist = dist;
            best = layout.row_headers[r];
        }
    }
    return best;
}

std::map<std::string, std::string> TableLayoutEngine::synthesize_context(
    const Table& table,
    TableType type
) const {
    std::map<std::string, std::string> context;
    TableLayout layout = analyze(table.fields);
    if (!layout.has_header()) {
        return context;
    }

    size_t row_index = 0;
    for (size_t r = 0; r < layout.rows.size(); ++r) {
        if (r == *layout.header_row) continue;
        ++row_index;

        std::optional<std::string> row_label = inherited_row_header(layout, r);

        for (size_t i : layout.rows[r].cells) {
            const Detection& field = table.fields[i];
            if (has_text(field)) continue;

            // Nearest column header; ties go to the leftmost
            const ColumnHeader* column = &layout.columns.front();
            float best = std::abs(column->x - field.box.x);
            for (const auto& candidate : layout.columns) {
                float dist = std::abs(candidate.x - field.box.x);
                if (dist < best) {
                    best = dist;
                    column = &candidate;
                }
            }

            std::string label;
            switch (type) {
                case TableType::SingleHeader:
                    if (row_label && *row_label != column->text) {
                        label = *row_label + " - " + column->text;
                    } else {
                        label = column->text + std::to_string(row_index);
                    }
                    break;

                case TableType::TwoAxis:
                    label = row_label ? *row_label + " " + column->text : config_.fallback_label;
                    break;

                case TableType::NumberedRows:
                    label = column->text + (row_label ? row_number(*row_label) : std::to_string(row_index));
                    break;
            }
            context.emplace(field.id, std::move(label));
        }
    }
    return context;
}

size_t TableLayoutEngine::apply_context(Table& table) const {
    TableType type = infer_table_type(table.fields);
    table.layout = type;

    auto context = synthesize_context(table, type);
    size_t filled = 0;
    for (auto& field : table.fields) {
        auto it = context.find(field.id);
        if (it != context.end()) {
            field.text = it->second;
            ++filled;
        }
    }

    if (config_.verbose) {
        std::cout << "[TableLayout] table=" << table.id
                  << " type=" << table_type_name(type)
                  << " fields=" << table.fields.size()
                  << " filled=" << filled << "\n";
    }
    return filled;
}

TableMap TableLayoutEngine::process_tables(const TableMap& tables) const {
    TableMap processed = tables;
    for (auto& [id, table] : processed) {
        apply_context(table);
    }
    return processed;
}

}  // namespace form_structure
