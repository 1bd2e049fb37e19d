#pragma once

#include "containment_config.hpp"
#include "../core/types.hpp"

namespace form_structure {

// Class-pair tuned "element lies inside container" predicate.
// Not symmetric, not transitive.
class ContainmentClassifier {
public:
    ContainmentClassifier();
    explicit ContainmentClassifier(ContainmentConfig config);

    [[nodiscard]] bool contains(const Detection& element, const Detection& container) const;

    [[nodiscard]] bool contains(
        DetectionClass element_cls,
        const Box& element,
        DetectionClass container_cls,
        const Box& container
    ) const;

    [[nodiscard]] const ContainmentConfig& config() const { return config_; }

private:
    ContainmentConfig config_;

    [[nodiscard]] bool evaluate(const ContainmentRule& rule, const Box& element, const Box& container) const;
};

}  // namespace form_structure
