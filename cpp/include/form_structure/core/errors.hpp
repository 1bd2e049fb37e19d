#pragma once

#include <stdexcept>
#include <string>

namespace form_structure {

// Structural invariant violated by the input (fatal for one page)
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Two detections on the same page share an id
class DuplicateDetectionError : public ValidationError {
public:
    explicit DuplicateDetectionError(const std::string& id)
        : ValidationError("Duplicate detection id: " + id), id_(id) {}

    [[nodiscard]] const std::string& id() const { return id_; }

private:
    std::string id_;
};

// A serialized hierarchy without a document root
class MissingRootError : public ValidationError {
public:
    explicit MissingRootError(const std::string& message)
        : ValidationError("Missing document root: " + message) {}
};

// Unreadable or malformed JSON input
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace form_structure
