#pragma once

#include "flowcanvas/core/Types.h"

#include <cstddef>
#include <string>

namespace flowcanvas {

/// Visual defaults applied to freshly created nodes
struct NodeStyle {
    std::string text;
    std::string fill;
    std::string stroke;
    float strokeWidth = 0.0f;
};

/// Configuration for a DiagramStore and its input controller
///
/// Presets:
/// - defaults(): Sizes and styles of the reference editor
/// - compact(): Smaller shapes and a shorter history, for embedded canvases
///
/// Usage:
/// @code
/// auto config = EditorConfig::defaults();
/// config.historyCapacity = 100;  // Override specific settings
///
/// flowcanvas::DiagramStore store(config);
/// @endcode
struct EditorConfig {
    /// Maximum number of snapshots kept by the history manager
    size_t historyCapacity = 50;

    /// Lower bound for node width and height, enforced on every mutation
    float minNodeSize = 20.0f;

    /// Size of rectangle, ellipse and diamond nodes on creation
    Size defaultNodeSize = {120.0f, 80.0f};

    /// Size of text nodes on creation
    Size defaultTextSize = {100.0f, 30.0f};

    NodeStyle shapeStyle = {"New Node", "#ffffff", "#666666", 2.0f};
    NodeStyle textStyle = {"Click to edit", "transparent", "transparent", 0.0f};

    /// Scale change applied per wheel event or zoom hotkey
    float zoomStep = 0.1f;

    /// Offset of copies created by duplicateSelected()
    Point duplicateOffset = {20.0f, 20.0f};

    /// Positive sizes, steps and capacity; non-negative stroke widths
    bool isValid() const;

    // === Named Presets ===

    static EditorConfig defaults();

    /// Smaller default shapes, 20-entry history
    static EditorConfig compact();
};

}  // namespace flowcanvas
