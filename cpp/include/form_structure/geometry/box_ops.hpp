#pragma once

#include "../core/types.hpp"

namespace form_structure {

// Width of the horizontal intersection of two boxes (0 when disjoint)
[[nodiscard]] float overlap_width(const Box& a, const Box& b);

// Height of the vertical intersection of two boxes (0 when disjoint)
[[nodiscard]] float overlap_height(const Box& a, const Box& b);

// Intersection rectangle area, zero if the boxes do not intersect
[[nodiscard]] float overlap_area(const Box& a, const Box& b);

// overlap_area(a, b) / area(a). Relative to the first argument, not symmetric.
// Returns 0 for a degenerate first box.
[[nodiscard]] float overlap_ratio(const Box& a, const Box& b);

// Vertical span of `inner` lies inside the span of `outer`
[[nodiscard]] bool vertical_span_within(const Box& inner, const Box& outer, float margin = 0.0f);

// True if a near-edge gap (a.top to b.bottom, or a.bottom to b.top) is below
// proximity_px, or one box's vertical span lies inside the other's.
[[nodiscard]] bool vertically_close(const Box& a, const Box& b, float proximity_px);

// Center of `a` lies inside `b` (edges inclusive)
[[nodiscard]] bool center_inside(const Box& a, const Box& b);

}  // namespace form_structure
