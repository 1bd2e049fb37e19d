#include <catch2/catch_test_macros.hpp>
#include "form_structure/containment/containment.hpp"

using namespace form_structure;

namespace {
Detection make(const std::string& id, DetectionClass cls, float x, float y, float w, float h) {
    return Detection(id, cls, Box(x, y, w, h), 0.9f);
}
}  // namespace

TEST_CASE("Rule table", "[containment]") {
    ContainmentConfig config = ContainmentConfig::defaults();

    SECTION("Named rules") {
        REQUIRE(config.rules.size() == 6);
        REQUIRE(config.find_rule(RULE_CHECKBOX_IN_OPTION) != nullptr);
        REQUIRE(config.find_rule("missing") == nullptr);
        REQUIRE(config.default_threshold == 0.8f);
    }

    SECTION("First matching pair wins") {
        const ContainmentRule* rule = config.match(DetectionClass::CheckboxOption, DetectionClass::CheckboxContext);
        REQUIRE(rule != nullptr);
        REQUIRE(rule->name == RULE_CHECKBOX_IN_CONTEXT);

        REQUIRE(config.match(DetectionClass::Table, DetectionClass::Field)->name == RULE_TABLE_IN_CONTAINER);
        REQUIRE(config.match(DetectionClass::Field, DetectionClass::Section) == nullptr);
    }
}

TEST_CASE("Default rule", "[containment]") {
    ContainmentClassifier classifier;
    Detection section = make("s", DetectionClass::Section, 100.0f, 50.0f, 200.0f, 100.0f);

    SECTION("Field fully inside") {
        Detection field = make("f", DetectionClass::Field, 100.0f, 60.0f, 20.0f, 10.0f);
        REQUIRE(classifier.contains(field, section));
    }

    SECTION("Field mostly outside") {
        // x 180..220: half outside
        Detection field = make("f", DetectionClass::Field, 200.0f, 60.0f, 40.0f, 10.0f);
        REQUIRE_FALSE(classifier.contains(field, section));
    }

    SECTION("Custom default threshold") {
        ContainmentConfig config = ContainmentConfig::defaults();
        config.default_threshold = 0.4f;
        ContainmentClassifier lenient(config);
        Detection field = make("f", DetectionClass::Field, 200.0f, 60.0f, 40.0f, 10.0f);
        REQUIRE(lenient.contains(field, section));
    }

    SECTION("Degenerate boxes never contain or get contained") {
        Detection flat = make("z", DetectionClass::Field, 100.0f, 60.0f, 0.0f, 10.0f);
        REQUIRE_FALSE(classifier.contains(flat, section));
        REQUIRE_FALSE(classifier.contains(section, flat));
    }
}

TEST_CASE("Tables in sections", "[containment]") {
    ContainmentClassifier classifier;
    Detection section = make("s", DetectionClass::Section, 300.0f, 300.0f, 400.0f, 400.0f);  // 100..500

    SECTION("Asymmetric") {
        Detection table = make("t", DetectionClass::Table, 300.0f, 300.0f, 200.0f, 100.0f);
        REQUIRE(classifier.contains(table, section));
        REQUIRE_FALSE(classifier.contains(section, table));
    }

    SECTION("Straddling the bottom edge within the margin") {
        Detection table = make("t", DetectionClass::Table, 300.0f, 480.0f, 200.0f, 100.0f);  // y 430..530
        REQUIRE(classifier.contains(table, section));
    }

    SECTION("Below the section") {
        Detection table = make("t", DetectionClass::Table, 300.0f, 540.0f, 200.0f, 60.0f);
        REQUIRE_FALSE(classifier.contains(table, section));
    }

    SECTION("Horizontal overlap ratio") {
        // overlap 40 / min(200, 400)
        REQUIRE(classifier.contains(make("t", DetectionClass::Table, 560.0f, 300.0f, 200.0f, 100.0f), section));
        // overlap 30 / min(200, 400)
        REQUIRE_FALSE(classifier.contains(make("t", DetectionClass::Table, 570.0f, 300.0f, 200.0f, 100.0f), section));
    }
}

TEST_CASE("Fields in tables", "[containment]") {
    Detection table = make("t", DetectionClass::Table, 200.0f, 200.0f, 200.0f, 200.0f);  // 100..300
    Detection straddling = make("f", DetectionClass::Field, 300.0f, 200.0f, 40.0f, 20.0f);

    SECTION("Overlap ratio") {
        ContainmentClassifier classifier;
        REQUIRE(classifier.contains(make("f", DetectionClass::Field, 250.0f, 200.0f, 40.0f, 20.0f), table));
        // exactly half inside is not "mostly inside"
        REQUIRE_FALSE(classifier.contains(straddling, table));
    }

    SECTION("Center point") {
        ContainmentClassifier classifier(ContainmentConfig::defaults(TableFieldStrategy::CenterPoint));
        REQUIRE(classifier.contains(straddling, table));
        REQUIRE_FALSE(classifier.contains(make("f", DetectionClass::Field, 320.0f, 200.0f, 60.0f, 20.0f), table));
    }

    SECTION("Checkbox contexts use the table rule") {
        ContainmentClassifier classifier;
        Detection context = make("c", DetectionClass::CheckboxContext, 200.0f, 150.0f, 100.0f, 40.0f);
        REQUIRE(classifier.contains(context, table));
    }
}

TEST_CASE("Checkbox groups", "[containment]") {
    ContainmentClassifier classifier;
    Detection context = make("ctx", DetectionClass::CheckboxContext, 50.0f, 50.0f, 100.0f, 40.0f);

    SECTION("Option inside its context") {
        Detection option = make("opt", DetectionClass::CheckboxOption, 55.0f, 60.0f, 90.0f, 20.0f);
        REQUIRE(classifier.contains(option, context));
    }

    SECTION("Overlap without vertical proximity") {
        Detection tall = make("ctx", DetectionClass::CheckboxContext, 500.0f, 500.0f, 200.0f, 1000.0f);  // y 0..1000
        Detection checkbox = make("cb", DetectionClass::Checkbox, 500.0f, 1050.0f, 20.0f, 300.0f);       // y 900..1200
        REQUIRE_FALSE(classifier.contains(checkbox, tall));
    }

    SECTION("Context in section") {
        Detection section = make("s", DetectionClass::Section, 500.0f, 500.0f, 1000.0f, 1000.0f);
        Detection inner = make("ctx", DetectionClass::CheckboxContext, 500.0f, 300.0f, 400.0f, 100.0f);
        REQUIRE(classifier.contains(inner, section));
    }
}

TEST_CASE("Checkboxes in options", "[containment]") {
    Detection option = make("opt", DetectionClass::CheckboxOption, 200.0f, 100.0f, 200.0f, 30.0f);  // x 100..300
    Detection inside = make("cb", DetectionClass::Checkbox, 110.0f, 100.0f, 20.0f, 20.0f);
    Detection before = make("cb", DetectionClass::Checkbox, 90.0f, 100.0f, 16.0f, 16.0f);           // x 82..98
    Detection after = make("cb", DetectionClass::Checkbox, 290.0f, 100.0f, 16.0f, 16.0f);

    SECTION("Overlap and proximity") {
        ContainmentClassifier classifier;
        REQUIRE(classifier.contains(inside, option));
        REQUIRE_FALSE(classifier.contains(before, option));
    }

    SECTION("Glyph alignment") {
        ContainmentClassifier classifier(ContainmentConfig::defaults(
            TableFieldStrategy::OverlapRatio, CheckboxOptionStrategy::GlyphAlignment));
        REQUIRE(classifier.contains(before, option));
        REQUIRE_FALSE(classifier.contains(after, option));

        Detection lower = make("cb", DetectionClass::Checkbox, 90.0f, 130.0f, 16.0f, 16.0f);
        REQUIRE_FALSE(classifier.contains(lower, option));
    }

    SECTION("Recalibrated threshold") {
        ContainmentConfig config = ContainmentConfig::defaults();
        config.find_rule(RULE_CHECKBOX_IN_OPTION)->overlap_threshold = 0.02f;
        ContainmentClassifier classifier(config);
        // half a pixel of horizontal overlap
        Detection edge = make("cb", DetectionClass::Checkbox, 92.5f, 100.0f, 16.0f, 16.0f);
        REQUIRE(classifier.contains(edge, option));
        REQUIRE_FALSE(ContainmentClassifier().contains(edge, option));
    }
}
