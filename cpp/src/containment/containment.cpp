#include "form_structure/containment/containment.hpp"
#include "form_structure/geometry/box_ops.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace form_structure {
namespace {

bool span_overlap(const ContainmentRule& rule, const Box& element, const Box& container) {
    float vertical = overlap_height(element, container) / element.height;
    float horizontal = overlap_width(element, container) / std::min(element.width, container.width);
    return vertical >= rule.overlap_threshold &&
           horizontal >= rule.secondary_threshold &&
           vertical_span_within(element, container, rule.proximity_px);
}

bool glyph_alignment(const ContainmentRule& rule, const Box& element, const Box& container) {
    bool aligned = std::abs(element.y - container.y) < rule.proximity_px;
    bool precedes = element.right() < container.left() + rule.secondary_threshold;
    return aligned && precedes;
}

}  // namespace

ContainmentClassifier::ContainmentClassifier()
    : config_(ContainmentConfig::defaults()) {}

ContainmentClassifier::ContainmentClassifier(ContainmentConfig config)
    : config_(std::move(config)) {}

bool ContainmentClassifier::contains(const Detection& element, const Detection& container) const {
    return contains(element.cls, element.box, container.cls, container.box);
}

bool ContainmentClassifier::contains(
    DetectionClass element_cls,
    const Box& element,
    DetectionClass container_cls,
    const Box& container
) const {
    if (!element.is_valid() || !container.is_valid()) {
        return false;
    }

    const ContainmentRule* rule = config_.match(element_cls, container_cls);
    if (rule != nullptr) {
        return evaluate(*rule, element, container);
    }
    return overlap_ratio(element, container) > config_.default_threshold;
}

bool ContainmentClassifier::evaluate(const ContainmentRule& rule, const Box& element, const Box& container) const {
    switch (rule.kind) {
        case RuleKind::SpanOverlap:
            return span_overlap(rule, element, container);

        case RuleKind::OverlapRatio:
            return overlap_ratio(element, container) > rule.overlap_threshold;

        case RuleKind::CenterPoint:
            return center_inside(element, container);

        case RuleKind::OverlapAndProximity:
            return overlap_ratio(element, container) > rule.overlap_threshold &&
                   vertically_close(element, container, rule.proximity_px);

        case RuleKind::GlyphAlignment:
            return glyph_alignment(rule, element, container);
    }
    throw std::invalid_argument("containment rule " + rule.name + " has an unknown kind");
}

}  // namespace form_structure
