#pragma once

/// @file flowcanvas.h
/// @brief Main header for the FlowCanvas diagram editing engine
///
/// FlowCanvas holds the editable model behind a flowchart canvas: shapes,
/// connectors, selection, viewport and undo history. Rendering is left to
/// the host.
///
/// Example usage:
/// @code
/// #include <flowcanvas/flowcanvas.h>
///
/// flowcanvas::DiagramStore store;
/// auto a = store.addNode(flowcanvas::NodeType::Rectangle, {0, 0});
/// auto b = store.addNode(flowcanvas::NodeType::Ellipse, {300, 0});
/// store.addEdge(a, b);
/// store.undo();
///
/// flowcanvas::DiagramSerializer::saveToFile(store, "diagram.json");
/// @endcode

#include <string>

// Core module - Diagram model and geometry
#include "core/Types.h"
#include "core/Diagram.h"
#include "core/Shape.h"
#include "core/GeometryUtils.h"

// View and history
#include "view/ViewportTransform.h"
#include "history/HistoryManager.h"

// Editing
#include "config/EditorConfig.h"
#include "store/ToolState.h"
#include "store/DiagramStore.h"
#include "input/InputController.h"

// Interchange
#include "io/DiagramSerializer.h"

namespace flowcanvas {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace flowcanvas
