#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace form_structure {

// Detection classes produced by the upstream layout model.
// Document is synthetic and only used for the tree root.
enum class DetectionClass : uint8_t {
    Section,
    Table,
    Field,
    CheckboxContext,
    CheckboxOption,
    Checkbox,
    Title,
    Document
};

constexpr size_t NUM_DETECTION_CLASSES = 8;

[[nodiscard]] std::string_view class_name(DetectionClass cls);

// Returns nullopt for names outside the model's label set
[[nodiscard]] std::optional<DetectionClass> parse_class(std::string_view name);

// Bit for class masks used by the containment rule table
[[nodiscard]] constexpr uint32_t class_bit(DetectionClass cls) {
    return 1u << static_cast<uint32_t>(cls);
}

// Center-based bounding box in image pixels
struct Box {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};

    constexpr Box() = default;
    constexpr Box(float x_, float y_, float width_, float height_)
        : x(x_), y(y_), width(width_), height(height_) {}

    [[nodiscard]] constexpr float left() const { return x - width * 0.5f; }
    [[nodiscard]] constexpr float right() const { return x + width * 0.5f; }
    [[nodiscard]] constexpr float top() const { return y - height * 0.5f; }
    [[nodiscard]] constexpr float bottom() const { return y + height * 0.5f; }
    [[nodiscard]] constexpr float area() const { return width * height; }

    // Usable in containment tests
    [[nodiscard]] bool is_valid() const {
        return std::isfinite(x) && std::isfinite(y) &&
               std::isfinite(width) && std::isfinite(height) &&
               width > 0.0f && height > 0.0f;
    }

    [[nodiscard]] constexpr bool operator==(const Box& other) const = default;
};

// One classified text region. Only `text` is mutated after construction.
struct Detection {
    std::string id;
    DetectionClass cls{DetectionClass::Field};
    Box box;
    float confidence{0.0f};
    std::string text;
    std::optional<std::string> parent_id;
    std::string filename;

    Detection() = default;
    Detection(std::string id_, DetectionClass cls_, const Box& box_,
              float confidence_ = 0.0f, std::string text_ = {})
        : id(std::move(id_)), cls(cls_), box(box_),
          confidence(confidence_), text(std::move(text_)) {}

    [[nodiscard]] float area() const { return box.area(); }
};

// True when the text carries no characters other than whitespace
[[nodiscard]] bool is_blank(std::string_view text);

// Strip leading/trailing whitespace
[[nodiscard]] std::string trim(std::string_view text);

}  // namespace form_structure
