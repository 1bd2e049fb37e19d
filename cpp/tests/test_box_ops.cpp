#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "form_structure/geometry/box_ops.hpp"

using namespace form_structure;
using Catch::Approx;

TEST_CASE("Overlap area", "[geometry]") {
    Box a(50.0f, 50.0f, 100.0f, 100.0f);   // 0..100 x 0..100

    SECTION("Partial overlap") {
        Box b(100.0f, 100.0f, 100.0f, 100.0f);  // 50..150 x 50..150
        REQUIRE(overlap_width(a, b) == Approx(50.0f));
        REQUIRE(overlap_height(a, b) == Approx(50.0f));
        REQUIRE(overlap_area(a, b) == Approx(2500.0f));
    }

    SECTION("Disjoint") {
        Box b(300.0f, 300.0f, 50.0f, 50.0f);
        REQUIRE(overlap_area(a, b) == 0.0f);
        REQUIRE(overlap_ratio(a, b) == 0.0f);
    }

    SECTION("Touching edges") {
        Box b(150.0f, 50.0f, 100.0f, 100.0f);  // starts at x = 100
        REQUIRE(overlap_area(a, b) == 0.0f);
    }
}

TEST_CASE("Overlap ratio is relative to the first box", "[geometry]") {
    Box small(50.0f, 50.0f, 20.0f, 20.0f);
    Box large(50.0f, 50.0f, 100.0f, 100.0f);

    REQUIRE(overlap_ratio(small, large) == Approx(1.0f));
    REQUIRE(overlap_ratio(large, small) == Approx(0.04f));
    REQUIRE(overlap_ratio(Box(0.0f, 0.0f, 0.0f, 10.0f), large) == 0.0f);
}

TEST_CASE("Vertical proximity", "[geometry]") {
    Box context(50.0f, 50.0f, 100.0f, 40.0f);  // y 30..70

    SECTION("Span inside") {
        Box option(55.0f, 60.0f, 90.0f, 20.0f);  // y 50..70
        REQUIRE(vertically_close(option, context, 5.0f));
        REQUIRE(vertically_close(context, option, 5.0f));
    }

    SECTION("Gap below threshold") {
        Box below(50.0f, 85.0f, 20.0f, 20.0f);  // y 75..95, gap 5
        REQUIRE(vertically_close(below, context, 10.0f));
        REQUIRE_FALSE(vertically_close(below, context, 5.0f));
    }

    SECTION("Far away") {
        Box far(50.0f, 400.0f, 20.0f, 20.0f);
        REQUIRE_FALSE(vertically_close(far, context, 100.0f));
    }
}

TEST_CASE("Span and center tests", "[geometry]") {
    Box section(300.0f, 300.0f, 400.0f, 400.0f);  // 100..500

    REQUIRE(vertical_span_within(Box(300.0f, 300.0f, 10.0f, 100.0f), section));
    REQUIRE_FALSE(vertical_span_within(Box(300.0f, 520.0f, 10.0f, 80.0f), section));
    REQUIRE(vertical_span_within(Box(300.0f, 520.0f, 10.0f, 80.0f), section, 100.0f));

    REQUIRE(center_inside(Box(500.0f, 300.0f, 40.0f, 20.0f), section));
    REQUIRE_FALSE(center_inside(Box(501.0f, 300.0f, 40.0f, 20.0f), section));
}
