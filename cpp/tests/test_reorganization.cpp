#include <catch2/catch_test_macros.hpp>
#include "form_structure/hierarchy/hierarchy_builder.hpp"

using namespace form_structure;

namespace {
Detection make(const std::string& id, DetectionClass cls, float x, float y, float w, float h,
               const std::string& text = "") {
    return Detection(id, cls, Box(x, y, w, h), 0.9f, text);
}

std::vector<Detection> two_sections() {
    return {
        make("sec-a", DetectionClass::Section, 300.0f, 150.0f, 400.0f, 200.0f, "A"),
        make("sec-b", DetectionClass::Section, 300.0f, 600.0f, 400.0f, 200.0f, "B"),
        make("f1", DetectionClass::Field, 200.0f, 100.0f, 40.0f, 20.0f, "Fu11 nane"),
        make("f2", DetectionClass::Field, 200.0f, 100.0f, 10.0f, 10.0f, "x"),
        make("f3", DetectionClass::Field, 400.0f, 600.0f, 40.0f, 20.0f, "Date"),
    };
}

std::vector<std::string> child_ids(const Node& node) {
    std::vector<std::string> ids;
    for (const auto& child : node.children) ids.push_back(child.id());
    return ids;
}
}  // namespace

TEST_CASE("Reorganizer edges", "[reorganization]") {
    HierarchyBuilder builder;

    SECTION("Without a reorganization the tree is geometric") {
        auto result = builder.build(two_sections());
        REQUIRE(child_ids(*find_node(result.root, "sec-a")) == std::vector<std::string>{"f1"});
    }

    SECTION("Listed elements move under their section") {
        Reorganization reorg;
        reorg.structure["sec-b"] = {"f1"};
        reorg.cleaned_text["f1"] = "Full name";
        reorg.cleaned_text["sec-a"] = "Applicant";

        auto result = builder.build(two_sections(), reorg);
        REQUIRE(result.warnings.empty());
        REQUIRE(child_ids(result.root) == std::vector<std::string>{"sec-a", "sec-b"});

        const Node* sec_b = find_node(result.root, "sec-b");
        REQUIRE(child_ids(*sec_b) == std::vector<std::string>{"f1", "f3"});
        // geometric descendants follow the element
        REQUIRE(child_ids(sec_b->children[0]) == std::vector<std::string>{"f2"});
        REQUIRE_FALSE(find_node(result.root, "sec-a")->has_children());

        REQUIRE(find_node(result.root, "f1")->detection->text == "Full name");
        REQUIRE(find_node(result.root, "sec-a")->detection->text == "Applicant");
        REQUIRE(find_node(result.root, "sec-b")->detection->text.empty());
    }

    SECTION("Bad references are skipped with warnings") {
        Reorganization reorg;
        reorg.structure["ghost"] = {"f1"};
        reorg.structure["f3"] = {"f2"};
        reorg.structure["sec-a"] = {"nope"};
        reorg.structure["sec-b"] = {"sec-a"};
        reorg.cleaned_text["zzz"] = "x";

        auto result = builder.build(two_sections(), reorg);
        REQUIRE(result.warnings.size() == 5);
        REQUIRE(child_ids(result.root) == std::vector<std::string>{"sec-a", "sec-b"});
        REQUIRE(child_ids(*find_node(result.root, "sec-a")) == std::vector<std::string>{"f1"});
    }

    SECTION("An element listed twice keeps its first section") {
        Reorganization reorg;
        reorg.structure["sec-a"] = {"f3"};
        reorg.structure["sec-b"] = {"f3"};

        auto result = builder.build(two_sections(), reorg);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(child_ids(*find_node(result.root, "sec-a")) == std::vector<std::string>{"f1", "f3"});
        REQUIRE_FALSE(find_node(result.root, "sec-b")->has_children());
    }
}
