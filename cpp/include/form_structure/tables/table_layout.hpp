#pragma once

#include "table.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace form_structure {

struct TableLayoutConfig {
    float row_tolerance_px{5.0f};
    float left_margin_px{200.0f};
    std::string fallback_label{"Unknown field"};
    bool verbose{false};
};

// Fields sharing a y band, indices into the table's field list sorted by x
struct TableRow {
    float y{0.0f};
    std::vector<size_t> cells;
};

struct ColumnHeader {
    float x{0.0f};
    std::string text;
};

// Positional analysis of one table
struct TableLayout {
    std::vector<TableRow> rows;
    std::optional<size_t> header_row;
    std::vector<ColumnHeader> columns;
    // Leftmost non-empty cell inside the left margin, per row
    std::vector<std::optional<std::string>> row_headers;

    [[nodiscard]] bool has_header() const { return header_row.has_value() && !columns.empty(); }
};

// Guesses row/column semantics of a table from coordinates and labels
// the cells whose OCR text came back empty.
class TableLayoutEngine {
public:
    TableLayoutEngine() = default;
    explicit TableLayoutEngine(TableLayoutConfig config);

    // Clusters field/checkbox_context detections on y; titles are ignored
    [[nodiscard]] std::vector<TableRow> cluster_rows(const std::vector<Detection>& fields) const;

    [[nodiscard]] TableLayout analyze(const std::vector<Detection>& fields) const;

    // TwoAxis or NumberedRows need two distinct row labels; anything less
    // is SingleHeader
    [[nodiscard]] TableType infer_table_type(const std::vector<Detection>& fields) const;

    // detection id -> context label for every empty data cell.
    // Empty when the table has no header row.
    [[nodiscard]] std::map<std::string, std::string> synthesize_context(
        const Table& table,
        TableType type
    ) const;

    // Infers the layout and replaces the text of empty fields in place.
    // Returns the number of fields filled.
    size_t apply_context(Table& table) const;

    // Processed copy of every table
    [[nodiscard]] TableMap process_tables(const TableMap& tables) const;

    [[nodiscard]] const TableLayoutConfig& config() const { return config_; }

private:
    TableLayoutConfig config_;

    [[nodiscard]] std::optional<std::string> inherited_row_header(const TableLayout& layout, size_t row) const;
};

}  // namespace form_structure
