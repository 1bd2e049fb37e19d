#pragma once

// Core types and structures
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/node.hpp"

// Geometry primitives
#include "geometry/box_ops.hpp"

// Containment heuristics
#include "containment/containment_config.hpp"
#include "containment/containment.hpp"

// Tree assembly
#include "hierarchy/reorganization.hpp"
#include "hierarchy/hierarchy_builder.hpp"

// Tables
#include "tables/table.hpp"
#include "tables/table_layout.hpp"

// End-to-end processing
#include "pipeline/document_pipeline.hpp"
