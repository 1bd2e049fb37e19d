#include "form_structure/geometry/box_ops.hpp"
#include <algorithm>
#include <cmath>

namespace form_structure {

float overlap_width(const Box& a, const Box& b) {
    float w = std::min(a.right(), b.right()) - std::max(a.left(), b.left());
    return w > 0.0f ? w : 0.0f;
}

float overlap_height(const Box& a, const Box& b) {
    float h = std::min(a.bottom(), b.bottom()) - std::max(a.top(), b.top());
    return h > 0.0f ? h : 0.0f;
}

float overlap_area(const Box& a, const Box& b) {
    return overlap_width(a, b) * overlap_height(a, b);
}

float overlap_ratio(const Box& a, const Box& b) {
    float area = a.area();
    if (area <= 0.0f) return 0.0f;
    return overlap_area(a, b) / area;
}

bool vertical_span_within(const Box& inner, const Box& outer, float margin) {
    return inner.top() >= outer.top() - margin &&
           inner.bottom() <= outer.bottom() + margin;
}

bool vertically_close(const Box& a, const Box& b, float proximity_px) {
    if (std::abs(a.top() - b.bottom()) < proximity_px) return true;
    if (std::abs(a.bottom() - b.top()) < proximity_px) return true;
    return vertical_span_within(a, b) || vertical_span_within(b, a);
}

bool center_inside(const Box& a, const Box& b) {
    return a.x >= b.left() && a.x <= b.right() &&
           a.y >= b.top() && a.y <= b.bottom();
}

}  // namespace form_structure
