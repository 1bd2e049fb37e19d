#pragma once

#include <map>
#include <string>
#include <vector>

namespace form_structure {

// Section assignments and cleaned text proposed by an external
// reorganizer. Used as an alternative source of parent/child edges.
struct Reorganization {
    // section id -> element ids that belong directly under it
    std::map<std::string, std::vector<std::string>> structure;
    // detection id -> replacement text
    std::map<std::string, std::string> cleaned_text;

    [[nodiscard]] bool empty() const { return structure.empty() && cleaned_text.empty(); }
};

}  // namespace form_structure
