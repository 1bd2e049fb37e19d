#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "form_structure/form_structure.hpp"
#include "form_structure/io/json_io.hpp"

namespace py = pybind11;

namespace {
// JSON crosses the boundary as text so callers can hand over what the
// detection/OCR services returned without conversion.
nlohmann::json parse_text(const std::string& text) {
    nlohmann::json data = nlohmann::json::parse(text, nullptr, false);
    if (data.is_discarded()) {
        throw py::value_error("Invalid JSON");
    }
    return data;
}

py::dict document_result_to_dict(const form_structure::DocumentResult& result) {
    py::dict out;
    out["hierarchy"] = form_structure::hierarchy_to_json(result.hierarchy).dump();
    out["extracted_tables"] = form_structure::tables_to_json(result.extracted_tables).dump();
    out["processed_tables"] = form_structure::tables_to_json(result.processed_tables).dump();
    out["document"] = form_structure::hierarchy_to_json(result.document).dump();
    out["warnings"] = result.warnings;
    out["skipped_ids"] = result.skipped_ids;
    return out;
}
}  // namespace

PYBIND11_MODULE(form_structure_cpp, m) {
    m.doc() = "C++ implementation of form document structuring";

    py::register_exception<form_structure::ValidationError>(m, "ValidationError");
    py::register_exception<form_structure::ParseError>(m, "ParseError");

    py::enum_<form_structure::DetectionClass>(m, "DetectionClass")
        .value("Section", form_structure::DetectionClass::Section)
        .value("Table", form_structure::DetectionClass::Table)
        .value("Field", form_structure::DetectionClass::Field)
        .value("CheckboxContext", form_structure::DetectionClass::CheckboxContext)
        .value("CheckboxOption", form_structure::DetectionClass::CheckboxOption)
        .value("Checkbox", form_structure::DetectionClass::Checkbox)
        .value("Title", form_structure::DetectionClass::Title)
        .value("Document", form_structure::DetectionClass::Document);

    py::enum_<form_structure::TableType>(m, "TableType")
        .value("SingleHeader", form_structure::TableType::SingleHeader)
        .value("TwoAxis", form_structure::TableType::TwoAxis)
        .value("NumberedRows", form_structure::TableType::NumberedRows);

    // Box
    py::class_<form_structure::Box>(m, "Box")
        .def(py::init<>())
        .def(py::init<float, float, float, float>(),
            py::arg("x"), py::arg("y"), py::arg("width"), py::arg("height"))
        .def_readwrite("x", &form_structure::Box::x)
        .def_readwrite("y", &form_structure::Box::y)
        .def_readwrite("width", &form_structure::Box::width)
        .def_readwrite("height", &form_structure::Box::height)
        .def("left", &form_structure::Box::left)
        .def("right", &form_structure::Box::right)
        .def("top", &form_structure::Box::top)
        .def("bottom", &form_structure::Box::bottom)
        .def("area", &form_structure::Box::area)
        .def("__repr__", [](const form_structure::Box& b) {
            return "Box(" + form_structure::format_box(b) + ")";
        });

    m.def("overlap_area", &form_structure::overlap_area);
    m.def("overlap_ratio", &form_structure::overlap_ratio);
    m.def("vertically_close", &form_structure::vertically_close,
        py::arg("a"), py::arg("b"), py::arg("proximity_px"));

    // Detection
    py::class_<form_structure::Detection>(m, "Detection")
        .def(py::init<>())
        .def(py::init<std::string, form_structure::DetectionClass, form_structure::Box, float, std::string>(),
            py::arg("id"), py::arg("cls"), py::arg("box"),
            py::arg("confidence") = 0.0f, py::arg("text") = "")
        .def_readwrite("id", &form_structure::Detection::id)
        .def_readwrite("cls", &form_structure::Detection::cls)
        .def_readwrite("box", &form_structure::Detection::box)
        .def_readwrite("confidence", &form_structure::Detection::confidence)
        .def_readwrite("text", &form_structure::Detection::text)
        .def_readwrite("parent_id", &form_structure::Detection::parent_id)
        .def_readwrite("filename", &form_structure::Detection::filename)
        .def("area", &form_structure::Detection::area);

    // Node
    py::class_<form_structure::Node>(m, "Node")
        .def_readonly("type", &form_structure::Node::type)
        .def_readonly("detection", &form_structure::Node::detection)
        .def_readonly("children", &form_structure::Node::children)
        .def("id", &form_structure::Node::id)
        .def("is_root", &form_structure::Node::is_root)
        .def("to_json", [](const form_structure::Node& self) {
            return form_structure::hierarchy_to_json(self).dump();
        });

    // Containment
    py::class_<form_structure::ContainmentClassifier>(m, "ContainmentClassifier")
        .def(py::init<>())
        .def("contains",
            py::overload_cast<const form_structure::Detection&, const form_structure::Detection&>(
                &form_structure::ContainmentClassifier::contains, py::const_),
            py::arg("element"), py::arg("container"));

    // Hierarchy
    py::class_<form_structure::HierarchyOptions>(m, "HierarchyOptions")
        .def(py::init<>())
        .def_readwrite("blank_container_text", &form_structure::HierarchyOptions::blank_container_text)
        .def_readwrite("verbose", &form_structure::HierarchyOptions::verbose);

    py::class_<form_structure::HierarchyResult>(m, "HierarchyResult")
        .def_readonly("root", &form_structure::HierarchyResult::root)
        .def_readonly("warnings", &form_structure::HierarchyResult::warnings)
        .def_readonly("skipped_ids", &form_structure::HierarchyResult::skipped_ids);

    py::class_<form_structure::HierarchyBuilder>(m, "HierarchyBuilder")
        .def(py::init<>())
        .def(py::init([](const form_structure::HierarchyOptions& options) {
            return form_structure::HierarchyBuilder(form_structure::ContainmentClassifier(), options);
        }))
        .def("build",
            py::overload_cast<const std::vector<form_structure::Detection>&>(
                &form_structure::HierarchyBuilder::build, py::const_),
            py::arg("detections"));

    // Tables
    py::class_<form_structure::Table>(m, "Table")
        .def(py::init<>())
        .def_readwrite("id", &form_structure::Table::id)
        .def_readwrite("parent_id", &form_structure::Table::parent_id)
        .def_readwrite("fields", &form_structure::Table::fields)
        .def_readwrite("layout", &form_structure::Table::layout);

    m.def("extract_tables", &form_structure::extract_tables, py::arg("root"));

    py::class_<form_structure::TableLayoutEngine>(m, "TableLayoutEngine")
        .def(py::init<>())
        .def("infer_table_type", &form_structure::TableLayoutEngine::infer_table_type, py::arg("fields"))
        .def("synthesize_context", &form_structure::TableLayoutEngine::synthesize_context,
            py::arg("table"), py::arg("table_type"))
        .def("process_tables", &form_structure::TableLayoutEngine::process_tables, py::arg("tables"));

    // End-to-end
    m.def("process_document_json", [](const std::string& detections_json, const std::string& config_json) {
        form_structure::PipelineOptions options;
        if (!config_json.empty()) {
            options = form_structure::pipeline_options_from_json(parse_text(config_json));
        }
        auto parsed = form_structure::parse_detections(parse_text(detections_json));
        form_structure::DocumentPipeline pipeline(std::move(options));
        py::dict out = document_result_to_dict(pipeline.process(parsed.detections));
        out["input_warnings"] = parsed.warnings;
        return out;
    }, py::arg("detections_json"), py::arg("config_json") = "");

    m.def("process_reorganized_json", [](
        const std::string& detections_json,
        const std::string& reorganization_json
    ) {
        auto parsed = form_structure::parse_detections(parse_text(detections_json));
        auto reorg = form_structure::reorganization_from_json(parse_text(reorganization_json));
        form_structure::DocumentPipeline pipeline;
        py::dict out = document_result_to_dict(pipeline.process(parsed.detections, reorg));
        out["input_warnings"] = parsed.warnings;
        return out;
    }, py::arg("detections_json"), py::arg("reorganization_json"));
}
