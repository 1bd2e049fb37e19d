#pragma once

#include "../core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace form_structure {

// How a rule turns two boxes into a containment decision
enum class RuleKind {
    SpanOverlap,          // vertical/horizontal overlap ratios + span within margin
    OverlapRatio,         // overlap / element area > threshold
    CenterPoint,          // element center inside container
    OverlapAndProximity,  // overlap ratio > threshold and vertically close
    GlyphAlignment        // same vertical center, element left of container
};

// Variants of the field-in-table test
enum class TableFieldStrategy {
    OverlapRatio,
    CenterPoint
};

// Variants of the checkbox-in-option test
enum class CheckboxOptionStrategy {
    OverlapProximity,
    GlyphAlignment
};

// One row of the class-pair table.
// container_mask == 0 matches any container class.
struct ContainmentRule {
    std::string name;
    uint32_t element_mask{0};
    uint32_t container_mask{0};
    RuleKind kind{RuleKind::OverlapRatio};
    float overlap_threshold{0.0f};   // main ratio (vertical ratio for SpanOverlap)
    float proximity_px{0.0f};        // vertical proximity / span margin / alignment band
    float secondary_threshold{0.0f}; // horizontal ratio (SpanOverlap) or left buffer (GlyphAlignment)

    [[nodiscard]] bool matches(DetectionClass element, DetectionClass container) const {
        if ((element_mask & class_bit(element)) == 0) return false;
        return container_mask == 0 || (container_mask & class_bit(container)) != 0;
    }
};

// Rule names used by the default table
inline constexpr const char* RULE_TABLE_IN_CONTAINER = "table_in_container";
inline constexpr const char* RULE_ELEMENT_IN_TABLE = "element_in_table";
inline constexpr const char* RULE_CHECKBOX_IN_CONTEXT = "checkbox_in_context";
inline constexpr const char* RULE_OPTION_IN_CONTEXT = "option_in_context";
inline constexpr const char* RULE_CHECKBOX_IN_OPTION = "checkbox_in_option";
inline constexpr const char* RULE_CONTEXT_IN_SECTION = "context_in_section";

// Ordered rule table; the first matching class pair wins, otherwise
// overlap / element area > default_threshold.
struct ContainmentConfig {
    std::vector<ContainmentRule> rules;
    float default_threshold{0.8f};

    // Calibrated baseline table
    static ContainmentConfig defaults(
        TableFieldStrategy table_fields = TableFieldStrategy::OverlapRatio,
        CheckboxOptionStrategy checkbox_options = CheckboxOptionStrategy::OverlapProximity
    );

    [[nodiscard]] ContainmentRule* find_rule(const std::string& name);
    [[nodiscard]] const ContainmentRule* find_rule(const std::string& name) const;

    // First rule matching the class pair, nullptr for the default rule
    [[nodiscard]] const ContainmentRule* match(DetectionClass element, DetectionClass container) const;
};

}  // namespace form_structure
