#include "form_structure/core/types.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace form_structure {
namespace {

constexpr std::array<std::pair<DetectionClass, std::string_view>, NUM_DETECTION_CLASSES> kClassNames = {{
    {DetectionClass::Section, "section"},
    {DetectionClass::Table, "table"},
    {DetectionClass::Field, "field"},
    {DetectionClass::CheckboxContext, "checkbox_context"},
    {DetectionClass::CheckboxOption, "checkbox_option"},
    {DetectionClass::Checkbox, "checkbox"},
    {DetectionClass::Title, "title"},
    {DetectionClass::Document, "document"},
}};

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string_view class_name(DetectionClass cls) {
    for (const auto& [value, name] : kClassNames) {
        if (value == cls) return name;
    }
    return "unknown";
}

std::optional<DetectionClass> parse_class(std::string_view name) {
    for (const auto& [value, label] : kClassNames) {
        // "document" is reserved for the synthetic root
        if (label == name && value != DetectionClass::Document) return value;
    }
    return std::nullopt;
}

bool is_blank(std::string_view text) {
    for (char c : text) {
        if (!is_space(c)) return false;
    }
    return true;
}

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return std::string(text.substr(begin, end - begin));
}

}  // namespace form_structure
