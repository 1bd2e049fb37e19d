#include "form_structure/containment/containment_config.hpp"

namespace form_structure {
namespace {

constexpr uint32_t kTableMembers =
    class_bit(DetectionClass::Field) |
    class_bit(DetectionClass::Checkbox) |
    class_bit(DetectionClass::CheckboxOption) |
    class_bit(DetectionClass::CheckboxContext);

constexpr uint32_t kCheckboxLike =
    class_bit(DetectionClass::Checkbox) |
    class_bit(DetectionClass::CheckboxOption);

}  // namespace

ContainmentConfig ContainmentConfig::defaults(
    TableFieldStrategy table_fields,
    CheckboxOptionStrategy checkbox_options
) {
    ContainmentConfig config;
    config.default_threshold = 0.8f;

    // Tables: 30% vertical, 20% horizontal, span within section +/- 100px
    config.rules.push_back(ContainmentRule{
        RULE_TABLE_IN_CONTAINER,
        class_bit(DetectionClass::Table),
        0,
        RuleKind::SpanOverlap,
        0.3f, 100.0f, 0.2f
    });

    config.rules.push_back(ContainmentRule{
        RULE_ELEMENT_IN_TABLE,
        kTableMembers,
        class_bit(DetectionClass::Table),
        table_fields == TableFieldStrategy::CenterPoint ? RuleKind::CenterPoint : RuleKind::OverlapRatio,
        0.5f, 0.0f, 0.0f
    });

    config.rules.push_back(ContainmentRule{
        RULE_CHECKBOX_IN_CONTEXT,
        kCheckboxLike,
        class_bit(DetectionClass::CheckboxContext),
        RuleKind::OverlapAndProximity,
        0.1f, 100.0f, 0.0f
    });

    // Shadowed by checkbox_in_context for the default ordering
    config.rules.push_back(ContainmentRule{
        RULE_OPTION_IN_CONTEXT,
        class_bit(DetectionClass::CheckboxOption),
        class_bit(DetectionClass::CheckboxContext),
        RuleKind::OverlapAndProximity,
        0.2f, 120.0f, 0.0f
    });

    if (checkbox_options == CheckboxOptionStrategy::GlyphAlignment) {
        // Centers within 20px, glyph right edge left of label left + 30px
        config.rules.push_back(ContainmentRule{
            RULE_CHECKBOX_IN_OPTION,
            class_bit(DetectionClass::Checkbox),
            class_bit(DetectionClass::CheckboxOption),
            RuleKind::GlyphAlignment,
            0.0f, 20.0f, 30.0f
        });
    } else {
        config.rules.push_back(ContainmentRule{
            RULE_CHECKBOX_IN_OPTION,
            class_bit(DetectionClass::Checkbox),
            class_bit(DetectionClass::CheckboxOption),
            RuleKind::OverlapAndProximity,
            0.05f, 80.0f, 0.0f
        });
    }

    config.rules.push_back(ContainmentRule{
        RULE_CONTEXT_IN_SECTION,
        class_bit(DetectionClass::CheckboxContext),
        class_bit(DetectionClass::Section),
        RuleKind::OverlapAndProximity,
        0.3f, 150.0f, 0.0f
    });

    return config;
}

ContainmentRule* ContainmentConfig::find_rule(const std::string& name) {
    for (auto& rule : rules) {
        if (rule.name == name) return &rule;
    }
    return nullptr;
}

const ContainmentRule* ContainmentConfig::find_rule(const std::string& name) const {
    for (const auto& rule : rules) {
        if (rule.name == name) return &rule;
    }
    return nullptr;
}

const ContainmentRule* ContainmentConfig::match(DetectionClass element, DetectionClass container) const {
    for (const auto& rule : rules) {
        if (rule.matches(element, container)) return &rule;
    }
    return nullptr;
}

}  // namespace form_structure
